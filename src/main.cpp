/***
 * Name: terse-calc main
 * Purpose: Entry point for the terse-calc command-line calculator.
 * Inputs:
 *   - argc, argv: Standard process arguments.
 * Outputs:
 *   - int: process status code (see terse::driver::Run).
 * Theory of Operation: Delegates to terse::driver::Run with the standard
 *   streams; anything escaping it is reported as an internal error.
 */
#include <exception>
#include <iostream>

#include "terse/driver/app.h"

int main(int argc, char** argv) {
  try {
    return terse::driver::Run(argc, argv, std::cout, std::cerr);
  } catch (const std::exception& ex) {
    std::cerr << "terse-calc: internal error: " << ex.what() << '\n';
    return terse::driver::kExitError;
  }
}
