#pragma once

namespace cardlab
{
    /**
     * Parses the options, sets up logging and runs the requested command.
     *
     * @return the process exit code
     */
    int run(int argc, const char** argv);
}
