#include <iostream>
#include <string>
#include <vector>

#include "valsim_harness/cli.hpp"

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv, argv + argc);
    return valsim::harness::cli::run(args, std::cout, std::cerr);
}
