#include "aquarium_config.hpp"
#include "aquarium_loop.hpp"
#include "gl_context.hpp"
#include "ingest_service.hpp"
#include "log.hpp"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    const std::string configPath = argc > 1 ? argv[1] : "aquarium.yml";

    AquariumConfig config;
    std::string error;
    if (!AquariumConfig::load(configPath, config, error) || !config.validate(error)) {
        std::cerr << "paperfish: " << error << "\n";
        return ExitInitFailed;
    }
    if (argc > 2) config.watcher.photosDir = argv[2];

    LogLevel level = LogLevel::Info;
    if (parseLogLevel(config.logLevel, level)) setLogLevel(level);

    PF_LOG_INFO("main", "photos from " << config.watcher.photosDir << ", canonical frame "
                << config.canonical.width << "x" << config.canonical.height);

    GlfwGraphicsContext context;
    IngestService ingest(config);
    AquariumLoop loop(config, context, ingest);
    return loop.run();
}
