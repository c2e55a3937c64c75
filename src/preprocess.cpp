#include "app.hpp"

int main(int argc, char** argv)
{
    ACC::Config cfg;
    const int status = ACC::parse_command_line(argc, argv, cfg);
    if (status >= 0) return status;

    return ACC::run(cfg);
}
