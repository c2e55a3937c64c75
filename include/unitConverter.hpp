#pragma once

#include <string>
#include <vector>
#include "accelSample.hpp"

namespace ACC{

    // Device calibration: codes 0..63 span -FULL_SCALE..+FULL_SCALE m/s^2.
    constexpr double FULL_SCALE = 14.709;
    constexpr double CODE_MAX   = 63.0;

    // Ordered physical samples of one file, split per axis.
    struct Trial {
        std::string source;
        std::vector<double> x, y, z;

        std::size_t size() const { return x.size(); }
    };

    // Codes outside 0..63 are mapped without clamping.
    inline double to_physical(int code){
        return -FULL_SCALE + (code / CODE_MAX) * (2.0 * FULL_SCALE);
    }

    PhysicalSample convert(const RawSample& raw);
    Trial convert_trial(const std::vector<RawSample>& raw, const std::string& source = "");
}
