#include <fstream>
#include "datasetWriter.hpp"
#include "errors.hpp"

namespace ACC{

    static nlohmann::json columns(const AxisMatrix& m){
        nlohmann::json cols = nlohmann::json::array();
        for (std::size_t c = 0; c < m.cols(); ++c) {
            cols.push_back(m.column(c));
        }
        return cols;
    }

    nlohmann::json to_json(const Dataset& data){
        nlohmann::json j;
        j["numSamples"] = data.numSamples;
        j["trials"] = data.trials;
        j["x"] = columns(data.x);
        j["y"] = columns(data.y);
        j["z"] = columns(data.z);
        return j;
    }

    void write_dataset(const Dataset& data, const std::string& path){
        // trial names come from the filesystem and need not be valid UTF-8
        const std::string text = to_json(data).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);

        std::ofstream out(path, std::ios::trunc);
        if (!out) {
            throw IOError(path, "cannot open output file");
        }
        out << text << '\n';
        out.flush();
        if (!out) {
            throw IOError(path, "write failed");
        }
    }
}
