/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file vigil.hpp
 * @brief Umbrella header for the vigil probe execution engine.
 */

#ifndef VIGIL_VIGIL_HPP_
#define VIGIL_VIGIL_HPP_

#include "vigil/platform.hpp"
#include "vigil/vocabulary.hpp"
#include "vigil/log.hpp"
#include "vigil/config.hpp"

#include "vigil/result.hpp"
#include "vigil/probe.hpp"
#include "vigil/job.hpp"
#include "vigil/worker_pool.hpp"
#include "vigil/resource_pool.hpp"
#include "vigil/timeout_controller.hpp"
#include "vigil/retry_controller.hpp"
#include "vigil/dependency_graph.hpp"
#include "vigil/scheduler.hpp"
#include "vigil/result_inverter.hpp"
#include "vigil/result_aggregator.hpp"
#include "vigil/settings.hpp"
#include "vigil/execution_engine.hpp"

#endif  // VIGIL_VIGIL_HPP_
