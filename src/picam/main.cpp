#include "picam/cli/router.hpp"

int main(int argc, char** argv) {
  // Keep the process entrypoint intentionally thin. All command parsing and
  // output/exit-code contracts live in the CLI router.
  return picam::cli::Dispatch(argc, argv);
}
