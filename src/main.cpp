#include "localderiv/core/application_runner.hpp"

int main(int argc, char* argv[]) {
  localderiv::core::ApplicationRunner runner;
  return runner.run(argc, argv).exit_code;
}
