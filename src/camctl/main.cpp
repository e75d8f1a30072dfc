#include "camctl/cli/router.hpp"

int main(int argc, char** argv) {
  // Argument handling and exit statuses belong to cli::Dispatch.
  return camctl::cli::Dispatch(argc, argv);
}
