#pragma once

#include <optional>
#include <string>
#include <vector>

namespace devstatus {
namespace service {

// Command-line values win over the config file.
struct Args {
  std::string config_yaml;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
};

// Unknown flags and flags missing their value are reported in `errors`.
Args ParseArgs(int argc, const char* const* argv, std::vector<std::string>& errors);

class ServiceCore {
public:
  // 0 on clean shutdown, 2 when the configuration is unusable, 1 otherwise.
  static int Run(const Args& args);
};

}  // namespace service
}  // namespace devstatus
