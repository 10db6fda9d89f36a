#pragma once

namespace switchboard::cli {

int run_cli(int argc, char **argv);

} // namespace switchboard::cli
