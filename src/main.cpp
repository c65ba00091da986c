// ============================================================================
// main.cpp - Entry point for bunit test programs (bunit_main)
// ============================================================================

#include "bunit/cli.hpp"

#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    try {
        return bunit::run_main(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
}
