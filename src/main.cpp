#include "Application.hpp"
#include "CommandLine.hpp"
#include <iostream>

int main(int argc, char *argv[]) {
  auto options = drivesage::parseCommandLine(argc, argv);
  if (!options.valid) {
    std::cerr << options.errorMessage << std::endl;
    drivesage::printUsage(std::cerr, argv[0]);
    return 1;
  }
  if (options.showHelp) {
    drivesage::printUsage(std::cout, argv[0]);
    return 0;
  }

  return drivesage::runCommand(options);
}
