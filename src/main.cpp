#include <iostream>

#include "config/options.hpp"
#include "core/runner.hpp"

int main(int argc, char **argv) {
  auto opt = config::ParseArgs(argc, argv);
  if (opt.help) {
    std::cout << config::Usage(argv[0]);
    return 0;
  }
  if (auto error = config::Validate(opt)) {
    std::cerr << *error << "\n" << config::Usage(argv[0]);
    return 1;
  }
  return core::Run(opt);
}
