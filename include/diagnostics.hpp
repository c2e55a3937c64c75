#pragma once

#include <fstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ACC{

    struct Series {
        std::string label;
        std::vector<double> x;
        std::vector<double> y;
    };

    struct Panel {
        std::string title;
        std::string xlabel;
        std::string ylabel;
        double y_min = 0.0;
        double y_max = 0.0;   // y_min == y_max means autoscale
        std::vector<Series> series;
    };

    struct Figure {
        std::string title;
        std::vector<Panel> panels;
    };

    nlohmann::json to_json(const Figure& fig);

    // Push-only consumer of diagnostic figures. Nothing in the pipeline
    // depends on what a sink does with them.
    class DiagnosticsSink {
    public:
        virtual ~DiagnosticsSink() = default;
        virtual void emit(const Figure& fig) = 0;
    };

    // One figure per line (newline-delimited JSON).
    class JsonDiagnosticsSink : public DiagnosticsSink {
    public:
        // Throws IOError if path cannot be opened for writing.
        explicit JsonDiagnosticsSink(const std::string& path);
        void emit(const Figure& fig) override;
        std::size_t count() const { return count_; }

    private:
        std::string path_;
        std::ofstream out_;
        std::size_t count_ = 0;
    };

    // Forwards each figure to every attached sink.
    class TeeSink : public DiagnosticsSink {
    public:
        void add(DiagnosticsSink* sink);
        bool empty() const { return sinks_.empty(); }
        void emit(const Figure& fig) override;

    private:
        std::vector<DiagnosticsSink*> sinks_;
    };

    // Hands fig to sink (if any). A throwing sink is reported on stderr,
    // the caller carries on.
    void emit_safely(DiagnosticsSink* sink, const Figure& fig);
}
