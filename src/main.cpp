#include "cli/router.hpp"

int main(int argc, char** argv) {
  // Command parsing and exit-code contracts live in the CLI router.
  return nucleobench::cli::Dispatch(argc, argv);
}
