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
 * @file config.hpp
 * @brief Multi-format engine configuration with template-based backend dispatch.
 *
 * Design:
 *   - Tag dispatch: IniBackend / JsonBackend / YamlBackend type tags
 *   - Template specialization: ConfigParser<Backend> per-format parsers
 *   - Variadic templates: Config<Backends...> compile-time composition
 *   - ConfigStore: shared flat "section + key = value" storage and getters
 *
 * Supported backends (CMake opt-in):
 *   - IniBackend  : inih library       (VIGIL_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json      (VIGIL_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML             (VIGIL_CONFIG_YAML_ENABLED)
 *
 * Nested documents are flattened one level: top-level mappings become
 * sections, scalar children become keys. Sequences are stored as a
 * comma-separated list readable through GetList().
 *
 * Usage:
 * @code
 *   vigil::MultiConfig cfg;
 *   if (cfg.LoadFile("engine.json").has_value()) {
 *     int32_t workers = cfg.GetInt("engine", "max_parallel_tests", 4);
 *   }
 * @endcode
 */

#ifndef VIGIL_CONFIG_HPP_
#define VIGIL_CONFIG_HPP_

#include "vigil/platform.hpp"
#include "vigil/vocabulary.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>

#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#ifdef VIGIL_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef VIGIL_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef VIGIL_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace vigil {

// ============================================================================
// ConfigFormat
// ============================================================================

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

// ============================================================================
// Backend Tag Types (tag dispatch)
// ============================================================================

namespace detail {

inline std::string ToLower(const std::string& s) {
  std::string out(s);
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

inline std::string Trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

}  // namespace detail

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const std::string& ext) {
    return ext == "ini" || ext == "cfg" || ext == "conf";
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const std::string& ext) { return ext == "json"; }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const std::string& ext) {
    return ext == "yaml" || ext == "yml";
  }
};

// ============================================================================
// ConfigStore - Flat key-value storage base
// ============================================================================

#ifndef VIGIL_CONFIG_MAX_FILE_SIZE
#define VIGIL_CONFIG_MAX_FILE_SIZE (1024U * 1024U)
#endif

class ConfigStore {
 public:
  // --- Typed Getters ---

  std::string GetString(const std::string& section, const std::string& key,
                        const std::string& default_val = "") const {
    const std::string* v = FindEntry(section, key);
    return (v != nullptr) ? *v : default_val;
  }

  int32_t GetInt(const std::string& section, const std::string& key,
                 int32_t default_val = 0) const {
    return FindInt(section, key).value_or(default_val);
  }

  bool GetBool(const std::string& section, const std::string& key,
               bool default_val = false) const {
    return FindBool(section, key).value_or(default_val);
  }

  double GetDouble(const std::string& section, const std::string& key,
                   double default_val = 0.0) const {
    return FindDouble(section, key).value_or(default_val);
  }

  /// Comma-separated value split into trimmed, non-empty items.
  std::vector<std::string> GetList(const std::string& section,
                                   const std::string& key) const {
    std::vector<std::string> out;
    const std::string* v = FindEntry(section, key);
    if (v == nullptr) return out;
    std::stringstream ss(*v);
    std::string item;
    while (std::getline(ss, item, ',')) {
      item = detail::Trim(item);
      if (!item.empty()) out.push_back(item);
    }
    return out;
  }

  // --- Optional Getters ---

  std::optional<int32_t> FindInt(const std::string& section,
                                 const std::string& key) const {
    const std::string* v = FindEntry(section, key);
    if (v == nullptr) return std::nullopt;
    char* end = nullptr;
    long val = std::strtol(v->c_str(), &end, 10);
    if (end == v->c_str()) return std::nullopt;
    return static_cast<int32_t>(val);
  }

  std::optional<double> FindDouble(const std::string& section,
                                   const std::string& key) const {
    const std::string* v = FindEntry(section, key);
    if (v == nullptr) return std::nullopt;
    char* end = nullptr;
    double val = std::strtod(v->c_str(), &end);
    if (end == v->c_str()) return std::nullopt;
    return val;
  }

  std::optional<bool> FindBool(const std::string& section,
                               const std::string& key) const {
    const std::string* v = FindEntry(section, key);
    if (v == nullptr) return std::nullopt;
    return ParseBool(*v);
  }

  // --- Query ---

  bool HasSection(const std::string& section) const {
    const std::string s = detail::ToLower(section);
    for (const auto& kv : entries_) {
      if (kv.first.first == s) return true;
    }
    return false;
  }

  bool HasKey(const std::string& section, const std::string& key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept {
    return static_cast<uint32_t>(entries_.size());
  }

  /// Programmatic override, e.g. from command-line flags. Last write wins.
  void Set(const std::string& section, const std::string& key,
           const std::string& value) {
    AddEntry(section, key, value);
  }

 protected:
  using EntryKey = std::pair<std::string, std::string>;

  std::map<EntryKey, std::string> entries_;

  bool AddEntry(const std::string& section, const std::string& key,
                const std::string& value) {
    entries_[EntryKey(detail::ToLower(section), detail::ToLower(key))] = value;
    return true;
  }

  const std::string* FindEntry(const std::string& section,
                               const std::string& key) const {
    auto it =
        entries_.find(EntryKey(detail::ToLower(section), detail::ToLower(key)));
    return (it != entries_.end()) ? &it->second : nullptr;
  }

  static expected<std::string, ConfigError> ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
      return expected<std::string, ConfigError>::error(
          ConfigError::kFileNotFound);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    std::string data = ss.str();
    if (data.size() > VIGIL_CONFIG_MAX_FILE_SIZE) {
      return expected<std::string, ConfigError>::error(ConfigError::kBufferFull);
    }
    return expected<std::string, ConfigError>::success(std::move(data));
  }

  static bool ParseBool(const std::string& str) {
    const std::string s = detail::ToLower(detail::Trim(str));
    return s == "true" || s == "1" || s == "yes" || s == "on";
  }

  static std::string GetExtension(const std::string& path) {
    const size_t dot = path.rfind('.');
    const size_t slash = path.find_last_of("/\\");
    if (dot == std::string::npos ||
        (slash != std::string::npos && dot < slash)) {
      return std::string();
    }
    return detail::ToLower(path.substr(dot + 1));
  }

  template <typename> friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend> - Template specialization per format
// ============================================================================

/** Default: format not supported (compile-time safe fallback). */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&,
                                               const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&,
                                                 const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

// --- INI Backend ---

#ifdef VIGIL_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const std::string& path) {
    int result = ini_parse(path.c_str(), Handler, &store);
    if (result == -1)
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    if (result != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    int result = ini_parse_string(data.c_str(), Handler, &store);
    if (result != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    return s->AddEntry(section ? section : "", name ? name : "",
                       value ? value : "")
               ? 1
               : 0;
  }
};
#endif

// --- JSON Backend ---

#ifdef VIGIL_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const std::string& path) {
    auto r = ConfigStore::ReadFile(path);
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    auto j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object())
      return expected<void, ConfigError>::error(ConfigError::kParseError);

    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          store.AddEntry(it.key(), kit.key(), ToStr(*kit));
        }
      } else {
        store.AddEntry("", it.key(), ToStr(*it));
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    if (n.is_number_integer()) return std::to_string(n.get<int64_t>());
    if (n.is_number_float()) {
      char buf[32];
      (void)std::snprintf(buf, sizeof(buf), "%g", n.get<double>());
      return buf;
    }
    if (n.is_array()) {
      std::string joined;
      for (const auto& item : n) {
        if (!joined.empty()) joined += ',';
        joined += ToStr(item);
      }
      return joined;
    }
    return n.dump();
  }
};
#endif

// --- YAML Backend ---

#ifdef VIGIL_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const std::string& path) {
    auto r = ConfigStore::ReadFile(path);
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    auto root = fkyaml::node::deserialize(data);
    if (root.is_null() || !root.is_mapping())
      return expected<void, ConfigError>::error(ConfigError::kParseError);

    for (auto it = root.begin(); it != root.end(); ++it) {
      auto sec = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          store.AddEntry(sec, kit.key().get_value<std::string>(), ToStr(*kit));
        }
      } else {
        store.AddEntry("", sec, ToStr(node));
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) {
      char buf[32];
      (void)std::snprintf(buf, sizeof(buf), "%g", n.get_value<double>());
      return buf;
    }
    if (n.is_sequence()) {
      std::string joined;
      for (const auto& item : n) {
        if (!joined.empty()) joined += ',';
        joined += ToStr(item);
      }
      return joined;
    }
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...> - Compile-time composable config reader
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0,
                "Config requires at least one backend");

 public:
  Config() = default;

  expected<void, ConfigError> LoadFile(
      const std::string& path, ConfigFormat format = ConfigFormat::kAuto) {
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const std::string& data,
                                         ConfigFormat format) {
    return DispatchBuffer<Backends...>(data, format);
  }

 private:
  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const std::string& path,
                                           ConfigFormat format) {
    if (First::kFormat == format)
      return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0)
      return DispatchFile<Rest...>(path, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const std::string& data,
                                             ConfigFormat format) {
    if (First::kFormat == format)
      return ConfigParser<First>::ParseBuffer(*this, data);
    if constexpr (sizeof...(Rest) > 0)
      return DispatchBuffer<Rest...>(data, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const std::string& path) const {
    const std::string ext = GetExtension(path);
    if (ext.empty()) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const std::string& ext) const {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }

  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;
};

// ============================================================================
// Convenience Type Aliases
// ============================================================================

using MultiConfig = Config<
#ifdef VIGIL_CONFIG_INI_ENABLED
    IniBackend,
#endif
#ifdef VIGIL_CONFIG_YAML_ENABLED
    YamlBackend,
#endif
    JsonBackend>;

#ifdef VIGIL_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
using JsonConfig = Config<JsonBackend>;
#ifdef VIGIL_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

}  // namespace vigil

#endif  // VIGIL_CONFIG_HPP_
