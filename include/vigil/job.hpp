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
 * @file job.hpp
 * @brief Job: one scheduled probe execution against one target.
 */

#ifndef VIGIL_JOB_HPP_
#define VIGIL_JOB_HPP_

#include "vigil/result.hpp"

#include <cstdint>

#include <optional>
#include <set>
#include <string>

namespace vigil {

static constexpr int32_t kDefaultJobPriority = 100;
static constexpr double kDefaultJobComplexity = 1.0;
static constexpr double kDefaultJobDuration = 1.0;

/**
 * @brief Immutable unit of work within a batch; @c id is unique per batch.
 *
 * Dependency ids not present in the batch are treated as external by the
 * graph analysis and as unmet by the engine.
 */
struct Job {
  std::string id;
  std::string probe_name;
  std::string target;
  std::set<std::string> dependencies;
  int32_t priority{kDefaultJobPriority};
  double complexity{kDefaultJobComplexity};
  double estimated_duration{kDefaultJobDuration};  ///< Seconds.
  Json params = Json::object();                    ///< Passed to the probe.
  std::optional<double> timeout;                   ///< Overrides the default.
  std::optional<uint32_t> max_retries;             ///< Overrides the default.
};

}  // namespace vigil

#endif  // VIGIL_JOB_HPP_
