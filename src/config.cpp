#include <cstdlib>
#include <fstream>
#include <limits>
#include "config.hpp"
#include "errors.hpp"

namespace ACC{

    // json's own conversions turn true into 1 and 3.7 into 3
    static int get_int(const nlohmann::json& v, const std::string& key){
        if (!v.is_number_integer()) {
            throw ConfigError("config: \"" + key + "\" must be an integer, got " + v.dump());
        }
        const long long n = v.get<long long>();
        if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
            throw ConfigError("config: \"" + key + "\" out of range: " + v.dump());
        }
        return static_cast<int>(n);
    }

    void apply_config_json(const nlohmann::json& j, Config& cfg){
        using nlohmann::json;

        if (!j.is_object()) {
            throw ConfigError("config must be a JSON object");
        }
        try {
            cfg.dataDir = j.value("data_dir", cfg.dataDir);
            if (j.contains("window_size")) {
                cfg.windowSize = get_int(j["window_size"], "window_size");
            }
            cfg.output = j.value("output", cfg.output);
            if (j.contains("quiet")) {
                if (!j["quiet"].is_boolean()) throw ConfigError("config: \"quiet\" must be true or false");
                cfg.quiet = j["quiet"].get<bool>();
            }

            if (j.contains("diagnostics")) {
                const auto& d = j["diagnostics"];
                if (!d.is_object()) throw ConfigError("\"diagnostics\" must be an object");
                cfg.diagnosticsJson = d.value("json", cfg.diagnosticsJson);
                if (d.contains("sample_rate_hz")) {
                    const auto& fs = d["sample_rate_hz"];
                    if (!fs.is_number()) {
                        throw ConfigError("config: \"sample_rate_hz\" must be a number, got " + fs.dump());
                    }
                    cfg.sampleRateHz = fs.get<double>();
                }
                if (d.contains("spectrum_orders")) {
                    const auto& orders = d["spectrum_orders"];
                    if (!orders.is_array()) {
                        throw ConfigError("config: \"spectrum_orders\" must be an array");
                    }
                    std::vector<int> parsed;
                    for (const auto& n : orders) parsed.push_back(get_int(n, "spectrum_orders"));
                    cfg.spectrumOrders = parsed;
                }
            }
        } catch (const json::exception& e) {
            throw ConfigError(std::string("config: ") + e.what());
        }

        if (cfg.sampleRateHz <= 0.0) {
            throw ConfigError("config: sample_rate_hz must be positive");
        }
    }

    Config load_config(const std::string& path){
        std::ifstream in(path);
        if (!in) {
            throw ConfigError(path + ": cannot open config file");
        }
        nlohmann::json j;
        try {
            in >> j;
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigError(path + ": " + e.what());
        }
        Config cfg;
        apply_config_json(j, cfg);
        return cfg;
    }

    static int parse_int(const std::string& opt, const std::string& value){
        char* end = nullptr;
        const long v = std::strtol(value.c_str(), &end, 10);
        if (value.empty() || *end != '\0' || v < -1000000 || v > 1000000) {
            throw ConfigError(opt + ": expected an integer, got \"" + value + "\"");
        }
        return static_cast<int>(v);
    }

    bool parse_args(int argc, const char* const argv[], Config& cfg){
        auto need_value = [&](int i) -> std::string {
            if (i + 1 >= argc) throw ConfigError(std::string(argv[i]) + " requires a value");
            return argv[i + 1];
        };

        // --config first, flags below override it
        for (int i = 1; i < argc; ++i) {
            if (std::string(argv[i]) == "--config") {
                cfg = load_config(need_value(i));
                break;
            }
        }

        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "-h" || arg == "--help") {
                return false;
            } else if (arg == "--config") {
                ++i;
            } else if (arg == "-n" || arg == "--window") {
                cfg.windowSize = parse_int(arg, need_value(i));
                ++i;
            } else if (arg == "-o" || arg == "--out") {
                cfg.output = need_value(i);
                ++i;
            } else if (arg == "--diag-json") {
                cfg.diagnosticsJson = need_value(i);
                ++i;
            } else if (arg == "-q" || arg == "--quiet") {
                cfg.quiet = true;
            } else if (!arg.empty() && arg[0] == '-') {
                throw ConfigError("unknown option " + arg);
            } else {
                cfg.dataDir = arg;
            }
        }

        if (cfg.dataDir.empty()) {
            throw ConfigError("no data directory given");
        }
        return true;
    }

    std::string usage(const char* prog){
        return std::string("usage: ") + prog + " [options] <data_dir>\n"
               "  --config FILE      JSON configuration\n"
               "  -n, --window N     median filter order (odd, default 3)\n"
               "  -o, --out FILE     write the filtered dataset as JSON\n"
               "  --diag-json FILE   write diagnostic figures as JSON lines\n"
               "  -q, --quiet        no progress output\n";
    }

    ProcessOptions process_options(const Config& cfg){
        ProcessOptions opt;
        opt.windowSize     = cfg.windowSize;
        opt.sampleRateHz   = cfg.sampleRateHz;
        opt.spectrumOrders = cfg.spectrumOrders;
        return opt;
    }
}
