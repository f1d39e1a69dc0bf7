#pragma once

void print_cli_help();
