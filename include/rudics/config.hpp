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
 * @brief Bridge configuration files flattened to "section + key = value".
 *
 * The file format is chosen by extension among the backends compiled in:
 *   - IniBackend  : inih            (RUDICS_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json   (RUDICS_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML          (RUDICS_CONFIG_YAML_ENABLED)
 *
 * Top-level objects/mappings are sections. Arrays become indexed keys
 * (on_trigger.0, on_trigger.1, ...), which INI files write out by hand;
 * GetList() puts them back together. Lookups ignore case.
 *
 * @code
 *   rudics::MultiConfig cfg;
 *   if (cfg.LoadFile("/etc/serial2rudics.ini")) {
 *     auto port = cfg.FindInt("rudics", "port");
 *   }
 * @endcode
 */

#ifndef RUDICS_CONFIG_HPP_
#define RUDICS_CONFIG_HPP_

#include "rudics/platform.hpp"
#include "rudics/vocabulary.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#ifdef RUDICS_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef RUDICS_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef RUDICS_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

/// Largest config file LoadFile() accepts.
#ifndef RUDICS_CONFIG_MAX_FILE_SIZE
#define RUDICS_CONFIG_MAX_FILE_SIZE 65536U
#endif

namespace rudics {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

inline const char* ConfigErrorName(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound: return "file not found";
    case ConfigError::kParseError: return "parse error";
    case ConfigError::kFormatNotSupported: return "format not supported";
    case ConfigError::kBufferFull: return "file too large";
    case ConfigError::kInvalidValue: return "invalid value";
    default: return "unknown";
  }
}

namespace detail {

inline bool ConfigNameEqual(const std::string& a, const char* b) noexcept {
  size_t i = 0;
  for (; i < a.size() && b[i] != '\0'; ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return i == a.size() && b[i] == '\0';
}

/// Trailing blanks are tolerated after a number, anything else is not.
inline bool OnlyBlanksLeft(const char* p) noexcept {
  while (*p == ' ' || *p == '\t') ++p;
  return *p == '\0';
}

}  // namespace detail

// ============================================================================
// ConfigStore
// ============================================================================

class ConfigStore {
 public:
  /** @brief Insert or overwrite one entry. */
  void Set(const char* section, const char* key, const char* value) {
    RUDICS_ASSERT(section != nullptr && key != nullptr && value != nullptr);
    for (Entry& e : entries_) {
      if (detail::ConfigNameEqual(e.section, section) &&
          detail::ConfigNameEqual(e.key, key)) {
        e.value = value;
        return;
      }
    }
    entries_.push_back(Entry{section, key, value});
  }

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = Find(section, key);
    return (e != nullptr) ? e->value.c_str() : default_val;
  }

  /// Whole-value decimal integer; empty when absent, malformed or out of range.
  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = Find(section, key);
    if (e == nullptr) return {};
    const char* s = e->value.c_str();
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(s, &end, 10);
    if (end == s || errno == ERANGE || !detail::OnlyBlanksLeft(end) ||
        v < INT32_MIN || v > INT32_MAX) {
      return {};
    }
    return static_cast<int32_t>(v);
  }

  optional<double> FindDouble(const char* section, const char* key) const {
    const Entry* e = Find(section, key);
    if (e == nullptr) return {};
    const char* s = e->value.c_str();
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(s, &end);
    if (end == s || errno == ERANGE || !detail::OnlyBlanksLeft(end)) return {};
    return v;
  }

  /**
   * @brief Values of a list-valued key.
   *
   * The plain key comes first, then key.N entries in ascending N. Gaps in
   * the numbering are allowed.
   */
  std::vector<std::string> GetList(const char* section, const char* key) const {
    std::vector<std::pair<long, const std::string*>> found;
    const std::string prefix = std::string(key) + ".";
    for (const Entry& e : entries_) {
      if (!detail::ConfigNameEqual(e.section, section)) continue;
      if (detail::ConfigNameEqual(e.key, key)) {
        found.emplace_back(-1L, &e.value);
        continue;
      }
      if (e.key.size() <= prefix.size() ||
          !detail::ConfigNameEqual(e.key.substr(0, prefix.size()), prefix.c_str())) {
        continue;
      }
      const char* idx = e.key.c_str() + prefix.size();
      char* end = nullptr;
      const long n = std::strtol(idx, &end, 10);
      if (end != idx && *end == '\0' && n >= 0) found.emplace_back(n, &e.value);
    }
    std::stable_sort(found.begin(), found.end(),
                     [](const std::pair<long, const std::string*>& a,
                        const std::pair<long, const std::string*>& b) {
                       return a.first < b.first;
                     });
    std::vector<std::string> out;
    out.reserve(found.size());
    for (const auto& f : found) out.push_back(*f.second);
    return out;
  }

  bool HasKey(const char* section, const char* key) const {
    return Find(section, key) != nullptr;
  }

  bool HasSection(const char* section) const {
    for (const Entry& e : entries_) {
      if (detail::ConfigNameEqual(e.section, section)) return true;
    }
    return false;
  }

  size_t Size() const noexcept { return entries_.size(); }

 private:
  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };

  const Entry* Find(const char* section, const char* key) const {
    RUDICS_ASSERT(section != nullptr && key != nullptr);
    for (const Entry& e : entries_) {
      if (detail::ConfigNameEqual(e.section, section) &&
          detail::ConfigNameEqual(e.key, key)) {
        return &e;
      }
    }
    return nullptr;
  }

  std::vector<Entry> entries_;
};

// ============================================================================
// Backends
// ============================================================================

namespace detail {

inline void SetIndexed(ConfigStore& store, const std::string& section,
                       const std::string& key, size_t index, const std::string& value) {
  const std::string indexed = key + "." + std::to_string(index);
  store.Set(section.c_str(), indexed.c_str(), value.c_str());
}

inline expected<void, ConfigError> Unsupported() {
  return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
}

}  // namespace detail

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;

  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::ConfigNameEqual(ext, "ini") || detail::ConfigNameEqual(ext, "cfg") ||
           detail::ConfigNameEqual(ext, "conf");
  }

  /// inih keeps values verbatim, so regex backslashes survive.
  static expected<void, ConfigError> Parse(ConfigStore& store, const std::string& text) {
#ifdef RUDICS_CONFIG_INI_ENABLED
    if (::ini_parse_string(text.c_str(), &IniBackend::OnEntry, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
#else
    (void)store;
    (void)text;
    return detail::Unsupported();
#endif
  }

 private:
#ifdef RUDICS_CONFIG_INI_ENABLED
  static int OnEntry(void* user, const char* section, const char* name,
                     const char* value) {
    static_cast<ConfigStore*>(user)->Set(section != nullptr ? section : "",
                                         name != nullptr ? name : "",
                                         value != nullptr ? value : "");
    return 1;
  }
#endif
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;

  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::ConfigNameEqual(ext, "json");
  }

  static expected<void, ConfigError> Parse(ConfigStore& store, const std::string& text) {
#ifdef RUDICS_CONFIG_JSON_ENABLED
    const nlohmann::json root = nlohmann::json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      if (it->is_object()) {
        for (auto kv = it->begin(); kv != it->end(); ++kv) {
          Store(store, it.key(), kv.key(), *kv);
        }
      } else {
        Store(store, std::string(), it.key(), *it);
      }
    }
    return expected<void, ConfigError>::success();
#else
    (void)store;
    (void)text;
    return detail::Unsupported();
#endif
  }

#ifdef RUDICS_CONFIG_JSON_ENABLED
 private:
  static void Store(ConfigStore& store, const std::string& section, const std::string& key,
                    const nlohmann::json& v) {
    if (v.is_array()) {
      for (size_t i = 0; i < v.size(); ++i) {
        detail::SetIndexed(store, section, key, i, Scalar(v[i]));
      }
      return;
    }
    store.Set(section.c_str(), key.c_str(), Scalar(v).c_str());
  }

  static std::string Scalar(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_null()) return std::string();
    return v.dump();
  }
#endif
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;

  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::ConfigNameEqual(ext, "yaml") || detail::ConfigNameEqual(ext, "yml");
  }

  static expected<void, ConfigError> Parse(ConfigStore& store, const std::string& text) {
#ifdef RUDICS_CONFIG_YAML_ENABLED
    fkyaml::node root;
    try {
      root = fkyaml::node::deserialize(text);
    } catch (const fkyaml::exception&) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    if (!root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      const std::string name = it.key().get_value<std::string>();
      fkyaml::node& node = *it;
      if (node.is_mapping()) {
        for (auto kv = node.begin(); kv != node.end(); ++kv) {
          Store(store, name, kv.key().get_value<std::string>(), *kv);
        }
      } else {
        Store(store, std::string(), name, node);
      }
    }
    return expected<void, ConfigError>::success();
#else
    (void)store;
    (void)text;
    return detail::Unsupported();
#endif
  }

#ifdef RUDICS_CONFIG_YAML_ENABLED
 private:
  static void Store(ConfigStore& store, const std::string& section, const std::string& key,
                    fkyaml::node& v) {
    if (v.is_sequence()) {
      size_t i = 0;
      for (auto& elem : v) {
        detail::SetIndexed(store, section, key, i++, Scalar(elem));
      }
      return;
    }
    store.Set(section.c_str(), key.c_str(), Scalar(v).c_str());
  }

  static std::string Scalar(const fkyaml::node& v) {
    if (v.is_string()) return v.get_value<std::string>();
    if (v.is_boolean()) return v.get_value<bool>() ? "true" : "false";
    if (v.is_integer()) return std::to_string(v.get_value<int64_t>());
    if (v.is_float_number()) {
      char buf[32];
      (void)std::snprintf(buf, sizeof(buf), "%.17g", v.get_value<double>());
      return buf;
    }
    return std::string();
  }
#endif
};

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  /**
   * @brief Read and merge a file; later loads override earlier keys.
   *
   * With kAuto the extension picks the backend, falling back to the
   * first one listed.
   */
  expected<void, ConfigError> LoadFile(const char* path,
                                       ConfigFormat format = ConfigFormat::kAuto) {
    RUDICS_ASSERT(path != nullptr);
    std::string text;
    auto r = ReadWholeFile(path, text);
    if (!r) return r;
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return Dispatch<Backends...>(text, format);
  }

  expected<void, ConfigError> LoadBuffer(const std::string& text, ConfigFormat format) {
    return Dispatch<Backends...>(text, format);
  }

 private:
  template <typename First, typename... Rest>
  expected<void, ConfigError> Dispatch(const std::string& text, ConfigFormat format) {
    if (First::kFormat == format) return First::Parse(*this, text);
    if constexpr (sizeof...(Rest) > 0) {
      return Dispatch<Rest...>(text, format);
    } else {
      return detail::Unsupported();
    }
  }

  template <typename First, typename... Rest>
  static ConfigFormat FormatForExtension(const std::string& ext) noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) {
      return FormatForExtension<Rest...>(ext);
    } else {
      return kDefaultFormat;
    }
  }

  static ConfigFormat DetectFormat(const std::string& path) noexcept {
    const size_t slash = path.find_last_of('/');
    const size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
      return kDefaultFormat;
    }
    return FormatForExtension<Backends...>(path.substr(dot + 1U));
  }

  static expected<void, ConfigError> ReadWholeFile(const char* path, std::string& out) {
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    char chunk[4096];
    size_t n = 0;
    bool too_big = false;
    while ((n = std::fread(chunk, 1U, sizeof(chunk), f)) > 0U) {
      out.append(chunk, n);
      if (out.size() > RUDICS_CONFIG_MAX_FILE_SIZE) {
        too_big = true;
        break;
      }
    }
    const bool failed = std::ferror(f) != 0;
    (void)std::fclose(f);
    if (too_big) return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    if (failed) return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    return expected<void, ConfigError>::success();
  }

  static constexpr ConfigFormat kDefaultFormat =
      std::tuple_element<0, std::tuple<Backends...>>::type::kFormat;
};

// ============================================================================
// Aliases
// ============================================================================

#ifdef RUDICS_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef RUDICS_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef RUDICS_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

/// Every backend compiled into this build.
#if defined(RUDICS_CONFIG_INI_ENABLED) && defined(RUDICS_CONFIG_JSON_ENABLED) && \
    defined(RUDICS_CONFIG_YAML_ENABLED)
using MultiConfig = Config<IniBackend, JsonBackend, YamlBackend>;
#elif defined(RUDICS_CONFIG_INI_ENABLED) && defined(RUDICS_CONFIG_JSON_ENABLED)
using MultiConfig = Config<IniBackend, JsonBackend>;
#elif defined(RUDICS_CONFIG_INI_ENABLED) && defined(RUDICS_CONFIG_YAML_ENABLED)
using MultiConfig = Config<IniBackend, YamlBackend>;
#elif defined(RUDICS_CONFIG_JSON_ENABLED) && defined(RUDICS_CONFIG_YAML_ENABLED)
using MultiConfig = Config<JsonBackend, YamlBackend>;
#elif defined(RUDICS_CONFIG_INI_ENABLED)
using MultiConfig = IniConfig;
#elif defined(RUDICS_CONFIG_JSON_ENABLED)
using MultiConfig = JsonConfig;
#elif defined(RUDICS_CONFIG_YAML_ENABLED)
using MultiConfig = YamlConfig;
#endif

}  // namespace rudics

#endif  // RUDICS_CONFIG_HPP_
