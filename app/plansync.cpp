#include "plansync/cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        return plansync::cli::run_main(argc, argv);
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
