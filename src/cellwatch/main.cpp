#include "cellwatch/cli/router.hpp"

int main(int argc, char** argv) {
  return cellwatch::cli::Dispatch(argc, argv);
}
