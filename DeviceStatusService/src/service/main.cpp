#include <iostream>
#include <string>
#include <vector>

#include "service/service_core.h"

int main(int argc, char** argv) {
  std::vector<std::string> errors;
  const auto args = devstatus::service::ParseArgs(argc, argv, errors);
  if (!errors.empty()) {
    for (const auto& e : errors) std::cerr << e << "\n";
    std::cerr << "usage: " << argv[0] << " [--config <file.yaml>] [--log-file <path>] [--log-level <level>]\n";
    return 2;
  }
  return devstatus::service::ServiceCore::Run(args);
}
