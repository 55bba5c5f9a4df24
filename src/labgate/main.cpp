#include "labgate/cli/router.hpp"

int main(int argc, char** argv) {
  return labgate::cli::Dispatch(argc, argv);
}
