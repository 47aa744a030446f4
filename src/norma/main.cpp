#include "norma/cli/router.hpp"

int main(int argc, char** argv) {
  return norma::cli::Dispatch(argc, argv);
}
