#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "pipeline.hpp"

namespace ACC{
    // {"numSamples": m, "trials": [...], "x": [[col 0], [col 1], ...], "y": ..., "z": ...}
    nlohmann::json to_json(const Dataset& data);

    // Throws IOError if path cannot be written.
    void write_dataset(const Dataset& data, const std::string& path);
}
