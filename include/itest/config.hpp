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
 * @brief Settings-file reader with template-based backend dispatch.
 *
 * Design:
 *   - Tag dispatch: IniBackend / JsonBackend / YamlBackend type tags
 *   - Template specialization: ConfigParser<Backend> per-format parsers
 *   - Variadic templates: Config<Backends...> compile-time composition
 *   - ConfigStore: flat "section + key = value" storage shared by all formats
 *
 * Supported backends (CMake opt-in):
 *   - IniBackend  : inih library       (ITEST_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json       (ITEST_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML             (ITEST_CONFIG_YAML_ENABLED)
 *
 * Section and key lookups are case-insensitive. Keys loaded later override
 * earlier ones, so several files can be layered onto one store.
 *
 * Usage:
 * @code
 *   itest::MultiConfig cfg;
 *   cfg.LoadFile("itest.ini");
 *   int32_t timeout = cfg.GetInt("itest", "run_case_timeout", 1800);
 * @endcode
 */

#ifndef ITEST_CONFIG_HPP_
#define ITEST_CONFIG_HPP_

#include "itest/platform.hpp"
#include "itest/vocabulary.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <tuple>
#include <vector>

#ifdef ITEST_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef ITEST_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef ITEST_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace itest {

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

inline bool CaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a; ++b;
  }
  return *a == *b;
}

}  // namespace detail

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "cfg") ||
           detail::CaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore - Flat key-value storage base
// ============================================================================

class ConfigStore {
 public:
  // --- Typed Getters ---

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value.c_str() : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    long val = std::strtol(e->value.c_str(), &end, 10);
    return (end == e->value.c_str()) ? default_val : static_cast<int32_t>(val);
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value.c_str()) : default_val;
  }

  double GetDouble(const char* section, const char* key,
                   double default_val = 0.0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    double val = std::strtod(e->value.c_str(), &end);
    return (end == e->value.c_str()) ? default_val : val;
  }

  // --- Optional Getters ---

  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    char* end = nullptr;
    long val = std::strtol(e->value.c_str(), &end, 10);
    return (end == e->value.c_str())
               ? optional<int32_t>{}
               : optional<int32_t>{static_cast<int32_t>(val)};
  }

  optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    return (e == nullptr) ? optional<bool>{}
                          : optional<bool>{ParseBool(e->value.c_str())};
  }

  // --- Query ---

  bool HasSection(const char* section) const {
    ITEST_ASSERT(section != nullptr);
    for (const Entry& e : entries_) {
      if (detail::CaseEqual(e.section.c_str(), section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  /// @brief Visit every key of @p section in load order.
  template <typename Fn>
  void ForEachKey(const char* section, Fn&& fn) const {
    for (const Entry& e : entries_) {
      if (detail::CaseEqual(e.section.c_str(), section)) {
        fn(e.key.c_str(), e.value.c_str());
      }
    }
  }

  /// @brief Whole file contents, shared by the format parsers.
  static expected<std::string, ConfigError> ReadFile(const char* path) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr) {
      return expected<std::string, ConfigError>::error(
          ConfigError::kFileNotFound);
    }
    std::string data;
    char buf[4096];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
      data.append(buf, n);
    }
    std::fclose(f);
    return expected<std::string, ConfigError>::success(std::move(data));
  }

  uint32_t EntryCount() const noexcept {
    return static_cast<uint32_t>(entries_.size());
  }

 protected:
  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };

  std::vector<Entry> entries_;

  void AddEntry(const char* section, const char* key, const char* value) {
    for (Entry& e : entries_) {
      if (detail::CaseEqual(e.section.c_str(), section) &&
          detail::CaseEqual(e.key.c_str(), key)) {
        e.value = value;
        return;
      }
    }
    entries_.push_back(Entry{section, key, value});
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    ITEST_ASSERT(section != nullptr && key != nullptr);
    for (const Entry& e : entries_) {
      if (detail::CaseEqual(e.section.c_str(), section) &&
          detail::CaseEqual(e.key.c_str(), key))
        return &e;
    }
    return nullptr;
  }

  static bool ParseBool(const char* str) noexcept {
    if (str == nullptr) return false;
    return detail::CaseEqual(str, "true") || detail::CaseEqual(str, "1") ||
           detail::CaseEqual(str, "yes") || detail::CaseEqual(str, "on");
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = nullptr;
    for (const char* p = path; *p != '\0'; ++p) {
      if (*p == '.') dot = p;
      if (*p == '/') dot = nullptr;
    }
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

  template <typename> friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend> - Template specialization per format
// ============================================================================

/** Default: format not supported (compile-time safe fallback). */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*,
                                                  uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

// --- INI Backend ---

#ifdef ITEST_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                                const char* path) {
    int result = ini_parse(path, Handler, &store);
    if (result == -1)
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    if (result != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                  const char* data, uint32_t) {
    int result = ini_parse_string(data, Handler, &store);
    if (result != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    s->AddEntry(section ? section : "", name ? name : "", value ? value : "");
    return 1;
  }
};
#endif

// --- JSON Backend ---

#ifdef ITEST_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                                const char* path) {
    auto r = ConfigStore::ReadFile(path);
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    const std::string& text = r.value();
    return ParseBuffer(store, text.c_str(), static_cast<uint32_t>(text.size()));
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                  const char* data,
                                                  uint32_t size) {
    auto j = nlohmann::json::parse(data, data + size, nullptr, false);
    if (j.is_discarded() || !j.is_object())
      return expected<void, ConfigError>::error(ConfigError::kParseError);

    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          store.AddEntry(it.key().c_str(), kit.key().c_str(),
                         ToStr(*kit).c_str());
        }
      } else {
        store.AddEntry("", it.key().c_str(), ToStr(*it).c_str());
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    if (n.is_number_integer()) return std::to_string(n.get<int64_t>());
    if (n.is_array()) {
      // Arrays of labels/selectors flatten to a comma separated list.
      std::string out;
      for (const auto& item : n) {
        if (!out.empty()) out += ',';
        out += ToStr(item);
      }
      return out;
    }
    return n.dump();
  }
};
#endif

// --- YAML Backend ---

#ifdef ITEST_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                                const char* path) {
    auto r = ConfigStore::ReadFile(path);
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    const std::string& text = r.value();
    return ParseBuffer(store, text.c_str(), static_cast<uint32_t>(text.size()));
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                  const char* data,
                                                  uint32_t size) {
    std::string yaml_str(data, size);
    auto root = fkyaml::node::deserialize(yaml_str);
    if (root.is_null() || !root.is_mapping())
      return expected<void, ConfigError>::error(ConfigError::kParseError);

    for (auto it = root.begin(); it != root.end(); ++it) {
      auto sec = it.key().get_value<std::string>();
      auto& node = *it;

      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          auto key = kit.key().get_value<std::string>();
          store.AddEntry(sec.c_str(), key.c_str(), ToStr(*kit).c_str());
        }
      } else {
        store.AddEntry("", sec.c_str(), ToStr(node).c_str());
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) return std::to_string(n.get_value<double>());
    if (n.is_sequence()) {
      std::string out;
      for (const auto& item : n) {
        if (!out.empty()) out += ',';
        out += ToStr(item);
      }
      return out;
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
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  Config() = default;

  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    ITEST_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                          ConfigFormat format) {
    ITEST_ASSERT(data != nullptr);
    return DispatchBuffer<Backends...>(data, size, format);
  }

 private:
  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path,
                                            ConfigFormat format) {
    if (First::kFormat == format)
      return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0)
      return DispatchFile<Rest...>(path, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const char* data, uint32_t size,
                                              ConfigFormat format) {
    if (First::kFormat == format)
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    if constexpr (sizeof...(Rest) > 0)
      return DispatchBuffer<Rest...>(data, size, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = GetExtension(path);
    if (ext == nullptr) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
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
#ifdef ITEST_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(ITEST_CONFIG_INI_ENABLED) && \
    (defined(ITEST_CONFIG_JSON_ENABLED) || defined(ITEST_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef ITEST_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(ITEST_CONFIG_JSON_ENABLED) && defined(ITEST_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef ITEST_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;

#ifdef ITEST_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef ITEST_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef ITEST_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

}  // namespace itest

#endif  // ITEST_CONFIG_HPP_
