#include <cstdio>
#include "diagnostics.hpp"
#include "errors.hpp"

namespace ACC{

    nlohmann::json to_json(const Figure& fig){
        using nlohmann::json;

        json j;
        j["title"] = fig.title;
        j["panels"] = json::array();
        for (const auto& p : fig.panels) {
            json jp;
            jp["title"]  = p.title;
            jp["xlabel"] = p.xlabel;
            jp["ylabel"] = p.ylabel;
            jp["ylim"]   = {p.y_min, p.y_max};
            jp["series"] = json::array();
            for (const auto& s : p.series) {
                jp["series"].push_back({{"label", s.label}, {"x", s.x}, {"y", s.y}});
            }
            j["panels"].push_back(jp);
        }
        return j;
    }

    JsonDiagnosticsSink::JsonDiagnosticsSink(const std::string& path)
        : path_(path), out_(path, std::ios::trunc) {
        if (!out_) {
            throw IOError(path, "cannot open diagnostics file for writing");
        }
    }

    void JsonDiagnosticsSink::emit(const Figure& fig){
        out_ << to_json(fig).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
        out_.flush();
        if (!out_) {
            throw IOError(path_, "write failed");
        }
        ++count_;
    }

    void TeeSink::add(DiagnosticsSink* sink){
        if (sink) sinks_.push_back(sink);
    }

    void TeeSink::emit(const Figure& fig){
        for (auto* s : sinks_) {
            emit_safely(s, fig);
        }
    }

    void emit_safely(DiagnosticsSink* sink, const Figure& fig){
        if (!sink) return;
        try {
            sink->emit(fig);
        } catch (const std::exception& e) {
            std::fprintf(stderr, "[diagnostics] dropped figure \"%s\": %s\n", fig.title.c_str(), e.what());
        }
    }
}
