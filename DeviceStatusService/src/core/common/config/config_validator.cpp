#include "core/common/config/config_manager.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace devstatus::core::common::config {

static std::string BadDurationMessage(std::string_view key, std::string_view value) {
  return std::string("invalid duration for ") + std::string(key) + ": '" + std::string(value) +
         "' (expected e.g. 500ms, 30s, 5m, 1h)";
}

std::vector<std::string> ValidateDurationKeys(const ConfigManager& cfg,
                                              const std::vector<std::string>& keys) {
  std::vector<std::string> errors;
  for (const auto& k : keys) {
    std::string v;
    if (!cfg.GetString(k, v)) continue;
    if (!time::ParseDurationMs(v)) errors.push_back(BadDurationMessage(k, v));
  }
  return errors;
}

std::vector<std::string> ValidateOneOf(const ConfigManager& cfg, const std::string& key,
                                       const std::vector<std::string>& allowed) {
  std::vector<std::string> errors;
  std::string v;
  if (!cfg.GetString(key, v)) return errors;
  for (const auto& a : allowed) {
    if (v == a) return errors;
  }

  std::string msg = "invalid value for " + key + ": '" + v + "' (expected one of";
  for (size_t i = 0; i < allowed.size(); ++i) {
    msg += (i == 0) ? " " : ", ";
    msg += allowed[i];
  }
  msg += ")";
  errors.push_back(std::move(msg));
  return errors;
}

}  // namespace devstatus::core::common::config
