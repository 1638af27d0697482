#include "driver.hpp"

namespace lox {
    // run is the main entry point for the front end.
    int run(int argc, char* argv[]) {
        // Create and initialize the driver.
        Driver d;
        if (!d.initFromArgs(argc, argv))
            return d.exitCode();

        return d.run();
    }
}

int main(int argc, char* argv[]) {
    return lox::run(argc, argv);
}
