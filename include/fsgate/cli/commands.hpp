#pragma once

namespace fsgate::cli {

int run_cli(int argc, char **argv);

} // namespace fsgate::cli
