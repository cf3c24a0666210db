#pragma once

namespace tether::cli
{
    /** Parse arguments and run one subcommand; returns the process exit code */
    int run(int argc, char *argv[]);

} // namespace tether::cli
