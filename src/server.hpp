#pragma once

#include "options.hpp"

namespace server
{
    /**
     * Runs the HTTP service until SIGINT, then shuts down the webserver and
     * the activity monitor.
     *
     * @return the process exit code
     */
    int serve(const Options& opts);
}
