// FILE: src/cli/print_cli_help.cpp
#include "cli/print_cli_help.hpp"

#include <iostream>

void print_cli_help() {
  std::cout
      << "Usage: tidegraph_cli -g <graph.yaml> [options]\n\n"
      << "Options:\n"
      << "  -h, --help                 Show this help message\n"
      << "  -g, --graph <file>         Read YAML and create graph\n"
      << "  -b, --batches <file>       Feed the input batches in <file> in order\n"
      << "  -P, --parallel             Use the parallel processor\n"
      << "  -j, --threads <n>          Worker threads for the parallel processor\n"
      << "  -p, --print                Print dependency tree\n"
      << "  -s, --schedule             Show the schedule used for each batch\n"
      << "  -t, --timer                Print compute events after each batch\n"
      << "  -v, --verbose              Log every node computation\n"
      << "      --config <file>        Use a specific configuration file\n"
      << std::endl;
}
