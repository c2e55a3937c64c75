#pragma once

#include <string>
#include <vector>
#include "accelSample.hpp"

namespace ACC{
    // Parses "x<ws>y<ws>z" (tabs or spaces) into out. Returns false unless
    // the line holds exactly three integers.
    bool parse_record(const std::string& line, RawSample& out);

    // Reads one trial file. Throws IOError if it cannot be read and
    // FormatError (with the 1-based line number) on the first bad record.
    std::vector<RawSample> decode_trial(const std::string& path);
}
