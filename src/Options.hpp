#pragma once

#include <limits>
#include <string>
#include <vector>

struct SReconstructionOptions {
    // equations an unknown daily extreme needs before it is solved
    size_t                   minEquations = 5;
    // fill what neither equations nor proxies cover by linear interpolation
    bool                     interpolateGaps = true;
    // proxy stations whose bias statistics exceed these are not used
    double                   maxMeanBias  = std::numeric_limits<double>::infinity();
    double                   maxStdevBias = std::numeric_limits<double>::infinity();
    // highest priority first, empty uses every proxy in name order
    std::vector<std::string> proxyPriority;
};
