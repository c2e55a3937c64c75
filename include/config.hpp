#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "pipeline.hpp"

namespace ACC{

    struct Config {
        std::string dataDir;
        int windowSize = 3;
        std::string output;            // dataset JSON, empty = not written
        std::string diagnosticsJson;   // figures as JSON lines, empty = off
        double sampleRateHz = 32.0;
        std::vector<int> spectrumOrders{1, 3, 5, 7, 9};
        bool quiet = false;
    };

    // Overwrites the fields present in j. Throws ConfigError on wrong types.
    void apply_config_json(const nlohmann::json& j, Config& cfg);

    // Reads a JSON config file on top of the defaults.
    Config load_config(const std::string& path);

    // Applies command-line options to cfg. --config is read first so that
    // other flags override the file. Returns false if --help was given.
    bool parse_args(int argc, const char* const argv[], Config& cfg);

    std::string usage(const char* prog);

    ProcessOptions process_options(const Config& cfg);
}
