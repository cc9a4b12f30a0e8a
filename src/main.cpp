#include "mcptools/cli/app.hpp"

auto main(int argc, char** argv) -> int {
    mcptools::cli::App app;
    return app.run(argc, argv);
}
