#include "app.h"
#include "config.h"
#include <cstdio>

int main(int argc, char* argv[]) {
    Quire::App app(Quire::loadConfig());

    // The file to open, if any, is picked up once the window is on screen
    app.addLaunchArguments(argc, argv);

    if (!app.init()) {
        fprintf(stderr, "Failed to initialize Quire\n");
        return 1;
    }

    app.run();

    return 0;
}
