#pragma once

#include <iostream>
#include <memory>

#include "options.hpp"
#include "bin_lookup.hpp"

/**
 * The command line front end. Each command writes its results to `out`,
 * reports bad input on `err`, and returns the process exit code.
 */
namespace commands
{
    int generate(const Options& opts, std::ostream& out, std::ostream& err);
    int validate(const Options& opts, std::istream& in, std::ostream& out, std::ostream& err);
    int classify(const Options& opts, std::ostream& out, std::ostream& err);
    int bin(const Options& opts, bin_lookup::BinLookup& lookup, std::ostream& out, std::ostream& err);

    std::unique_ptr<bin_lookup::BinLookup> make_lookup(const Options& opts);
}
