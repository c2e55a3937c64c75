#pragma once

#include <vector>
#include "diagnostics.hpp"

namespace ACC{

    // Keeps every emitted figure and draws them with ImPlot on show().
    class PlotViewer : public DiagnosticsSink {
    public:
        void emit(const Figure& fig) override;
        std::size_t size() const { return figures_.size(); }

        // Blocks until the window is closed. Returns false if no window
        // could be created.
        bool show();

    private:
        std::vector<Figure> figures_;
    };
}
