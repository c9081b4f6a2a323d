#pragma once

#include <optional>
#include <string>
#include <vector>

struct Config {
    int target_image_count = 10;
    int request_timeout_ms = 30000;
    std::string user_agent = "imgharvest/1.0";
    std::string input_path = "urls.txt";
    std::string originals_root = "originals";
    std::string output_root = "output";
    std::string log_dir = "logs";
    std::string log_level = "info";
    int max_concurrency = 8;
    std::string manifest_path;
    std::optional<std::vector<std::string>> blocklist;
};

class ConfigLoader {
public:
    // Keys missing from the file keep their defaults. Throws ConfigError.
    static Config load_file(const std::string& path);

    // imgharvest [config.json] [target_count] [input_path]
    static Config from_args(int argc, char** argv);

    static void apply_env(Config& config);

    static void validate(const Config& config);
};
