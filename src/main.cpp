#include "engine/Engine.hpp"

#include <string>

int main(int argc, char** argv) {
    ghostwatch::Engine engine;

    std::string configPath = argc > 1 ? argv[1] : "config.json";
    if (!engine.init(configPath)) {
        engine.shutdown();
        return 1;
    }

    engine.run();
    engine.shutdown();

    return 0;
}
