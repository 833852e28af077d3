#include "netstack/cli/router.hpp"

int main(int argc, char** argv) {
  // All command parsing and output/exit-code contracts live in the router.
  return netstack::cli::Dispatch(argc, argv);
}
