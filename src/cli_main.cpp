#include <iostream>

#include "autodeploy/Cli.hpp"
#include "autodeploy/Logging.hpp"

int main(int argc, char** argv) {
    const int code = autodeploy::run_cli(argc, argv, std::cout, std::cerr);
    autodeploy::shutdown_logging();
    return code;
}
