//! # errlens Entry Point
//!
//! Delegates to the driver in `cli/driver.cpp`.

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return errlens::cli::errlens_main(argc, argv);
}
