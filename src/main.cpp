#include "config.hpp"
#include "harvester.hpp"
#include "http_client.hpp"
#include "logging.hpp"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    Config config;
    try {
        config = ConfigLoader::from_args(argc, argv);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        std::cerr << "usage: " << argv[0] << " [config.json] [target_count] [input_path]" << std::endl;
        return 1;
    }

    int code = 1;
    try {
        auto logger = init_logging(config);
        logger->info("Start: target {} images from {}", config.target_image_count, config.input_path);

        CprHttpClient client(config.request_timeout_ms, config.user_agent);
        Harvester harvester(config, logger, client);
        try {
            code = exit_code(harvester.run().outcome);
        } catch (const std::exception& ex) {
            logger->critical("Run aborted: {}", ex.what());
            code = 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        code = 1;
    }
    shutdown_logging();
    return code;
}
