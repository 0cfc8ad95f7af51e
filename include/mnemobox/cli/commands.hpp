#pragma once

namespace mnemobox::cli {

int run_cli(int argc, char **argv);

} // namespace mnemobox::cli
