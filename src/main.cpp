#include "core/application.hpp"
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    geobim::Application app;

    if (!app.init(argc, argv)) {
        return 1;
    }

    spdlog::info("GeoBIM v0.1.0");

    int status = app.run();
    app.shutdown();

    return status;
}
