// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

// vigil_check - command-line front end for the vigil integrity engine

#include <exception>
#include <iostream>

#include "commands.hpp"

int main(int argc, char* argv[]) {
  vigil::check::Commands commands;

  try {
    return commands.execute(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
