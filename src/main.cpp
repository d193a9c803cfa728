#include "lxcforge/cli/commands.hpp"

int main(int argc, char **argv) { return lxcforge::cli::run_cli(argc, argv); }
