#include <cstdio>
#include "app.hpp"
#include "plotViewer.hpp"

int main(int argc, char** argv)
{
    ACC::Config cfg;
    const int status = ACC::parse_command_line(argc, argv, cfg);
    if (status >= 0) return status;

    // Pipeline first, the window opens once every figure is in.
    ACC::PlotViewer viewer;
    const int rc = ACC::run(cfg, &viewer);
    if (rc != ACC::EXIT_OK) return rc;

    if (!viewer.show()) {
        std::fprintf(stderr, "[viewer] no display, %zu figures not shown\n", viewer.size());
        return 1;
    }
    return 0;
}
