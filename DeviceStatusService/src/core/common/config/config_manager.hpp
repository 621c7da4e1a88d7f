#pragma once

#include <cctype>
#include <cstdint>
#include <exception>
#include <fstream>
#include <iterator>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <ryml.hpp>
#include <ryml_std.hpp>

#include "core/common/utils/time_utils.hpp"

namespace devstatus {
namespace core {
namespace common {
namespace config {

// Flat view of a YAML document. Nested maps become dotted keys
// ("registry.stale_after"), sequence items become "key[i]".
class ConfigManager {
public:
  using Map = std::unordered_map<std::string, std::string>;

  bool LoadYamlFile(const std::string& file_path) {
    data_.clear();
    last_error_.clear();
    return LoadYamlFileMerge(file_path);
  }

  bool LoadYamlFileMerge(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::in | std::ios::binary);
    if (!file) {
      last_error_ = "cannot open " + file_path;
      return false;
    }
    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (contents.empty()) {
      last_error_ = "empty config file " + file_path;
      return false;
    }
    return LoadYamlStringMerge(contents);
  }

  bool LoadYamlString(const std::string& contents) {
    data_.clear();
    last_error_.clear();
    return LoadYamlStringMerge(contents);
  }

  bool LoadYamlStringMerge(const std::string& contents) {
    try {
      ryml::Tree tree = ryml::parse_in_arena(ryml::to_csubstr(contents));
      const ryml::ConstNodeRef root = tree.rootref();
      if (!root.valid()) {
        last_error_ = "config has no root node";
        return false;
      }
      FlattenYaml(root, std::string());
      return true;
    } catch (const std::exception& e) {
      last_error_ = std::string("yaml parse error: ") + e.what();
      return false;
    }
  }

  const std::string& LastError() const { return last_error_; }

  bool Has(const std::string& key) const {
    return data_.find(key) != data_.end();
  }

  void Set(const std::string& key, std::string value) { data_[key] = std::move(value); }

  bool GetString(const std::string& key, std::string& out) const {
    const auto it = data_.find(key);
    if (it == data_.end()) return false;
    out = it->second;
    return true;
  }

  std::string GetStringOr(const std::string& key, std::string default_value) const {
    std::string out;
    if (GetString(key, out)) return out;
    return default_value;
  }

  bool GetInt64(const std::string& key, std::int64_t& out) const {
    std::string s;
    if (!GetString(key, s)) return false;
    return ParseInt64(s, out);
  }

  std::int64_t GetInt64Or(const std::string& key, std::int64_t default_value) const {
    std::int64_t out = 0;
    if (GetInt64(key, out)) return out;
    return default_value;
  }

  bool GetBool(const std::string& key, bool& out) const {
    std::string s;
    if (!GetString(key, s)) return false;
    return ParseBool(s, out);
  }

  bool GetDurationMs(const std::string& key, std::int64_t& out) const {
    std::string s;
    if (!GetString(key, s)) return false;
    const auto v = time::ParseDurationMs(s);
    if (!v) return false;
    out = *v;
    return true;
  }

  // Distinct names of the direct children under "prefix.", in no particular order.
  std::vector<std::string> ChildNames(const std::string& prefix) const {
    std::vector<std::string> out;
    const std::string p = prefix + ".";
    for (const auto& kv : data_) {
      if (kv.first.size() <= p.size() || kv.first.compare(0, p.size(), p) != 0) continue;
      const std::string rest = kv.first.substr(p.size());
      const auto dot = rest.find('.');
      std::string name = (dot == std::string::npos) ? rest : rest.substr(0, dot);
      if (name.empty()) continue;
      bool seen = false;
      for (const auto& n : out) {
        if (n == name) {
          seen = true;
          break;
        }
      }
      if (!seen) out.push_back(std::move(name));
    }
    return out;
  }

private:
  // Decimal with optional sign; rejects trailing text and overflow.
  static inline bool ParseInt64(const std::string& s, std::int64_t& out) {
    const bool negative = !s.empty() && s[0] == '-';
    const size_t start = (negative || (!s.empty() && s[0] == '+')) ? 1 : 0;
    if (start >= s.size()) return false;

    std::uint64_t v = 0;
    const std::uint64_t limit = negative ? std::uint64_t{1} << 63 : (std::uint64_t{1} << 63) - 1;
    for (size_t i = start; i < s.size(); ++i) {
      const char c = s[i];
      if (c < '0' || c > '9') return false;
      const auto digit = static_cast<std::uint64_t>(c - '0');
      if (v > (limit - digit) / 10) return false;
      v = v * 10 + digit;
    }
    out = negative ? static_cast<std::int64_t>(0 - v) : static_cast<std::int64_t>(v);
    return true;
  }

  static inline bool ParseBool(const std::string& s, bool& out) {
    std::string t;
    t.reserve(s.size());
    for (char c : s) t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (t == "1" || t == "true" || t == "yes" || t == "on") {
      out = true;
      return true;
    }
    if (t == "0" || t == "false" || t == "no" || t == "off") {
      out = false;
      return true;
    }
    return false;
  }

  static inline std::string ToStdString(c4::csubstr s) {
    return std::string(s.str, s.len);
  }

  void FlattenYaml(const ryml::ConstNodeRef& node, const std::string& prefix) {
    if (!node.valid()) return;

    if (node.has_val()) {
      if (!prefix.empty()) data_[prefix] = ToStdString(node.val());
      return;
    }

    if (node.is_map()) {
      for (ryml::ConstNodeRef child : node.children()) {
        if (!child.has_key()) continue;
        const std::string ks = ToStdString(child.key());
        const std::string next = prefix.empty() ? ks : (prefix + "." + ks);
        FlattenYaml(child, next);
      }
      return;
    }

    if (node.is_seq()) {
      std::size_t i = 0;
      for (ryml::ConstNodeRef child : node.children()) {
        const std::string next = prefix + "[" + std::to_string(i) + "]";
        FlattenYaml(child, next);
        ++i;
      }
      return;
    }
  }

private:
  Map data_;
  std::string last_error_;
};

// Each returns one message per offending key; an empty vector means valid.
std::vector<std::string> ValidateDurationKeys(const ConfigManager& cfg,
                                              const std::vector<std::string>& keys);
std::vector<std::string> ValidateOneOf(const ConfigManager& cfg, const std::string& key,
                                       const std::vector<std::string>& allowed);

}  // namespace config
}  // namespace common
}  // namespace core
}  // namespace devstatus
