#include "fsgate/cli/commands.hpp"

int main(int argc, char **argv) { return fsgate::cli::run_cli(argc, argv); }
