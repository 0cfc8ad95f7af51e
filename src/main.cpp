#include "mnemobox/cli/commands.hpp"

int main(int argc, char **argv) { return mnemobox::cli::run_cli(argc, argv); }
