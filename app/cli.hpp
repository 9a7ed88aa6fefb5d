#pragma once

#include "opfreq.hpp"

#include <optional>

namespace opfreq::cli {

    // Fills `cfg` from argv; an engaged result is the exit status for a run that should stop here.
    std::optional<int> parse_cli(int argc, char** argv, run_config& cfg);

}  // namespace opfreq::cli
