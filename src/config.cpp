#include "config.hpp"

#include "errors.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using nlohmann::json;

namespace {

template <typename T>
void read_key(const json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("config key '") + key + "': " + e.what());
    }
}

int parse_int(const std::string& text, const char* what) {
    try {
        size_t used = 0;
        int v = std::stoi(text, &used);
        if (used != text.size()) throw ConfigError(std::string("invalid ") + what + ": " + text);
        return v;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string("invalid ") + what + ": " + text);
    }
}

} // namespace

Config ConfigLoader::load_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw ConfigError("cannot open config file: " + path);

    json j;
    try {
        f >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("config file " + path + ": " + e.what());
    }
    if (!j.is_object()) throw ConfigError("config file " + path + ": top level must be an object");

    Config c;
    read_key(j, "target_image_count", c.target_image_count);
    read_key(j, "request_timeout_ms", c.request_timeout_ms);
    read_key(j, "user_agent", c.user_agent);
    read_key(j, "input_path", c.input_path);
    read_key(j, "originals_root", c.originals_root);
    read_key(j, "output_root", c.output_root);
    read_key(j, "log_dir", c.log_dir);
    read_key(j, "log_level", c.log_level);
    read_key(j, "max_concurrency", c.max_concurrency);
    read_key(j, "manifest_path", c.manifest_path);
    if (j.contains("blocklist") && !j["blocklist"].is_null()) {
        std::vector<std::string> keywords;
        read_key(j, "blocklist", keywords);
        c.blocklist = std::move(keywords);
    }
    return c;
}

void ConfigLoader::apply_env(Config& config) {
    if (const char* level = std::getenv("IMGHARVEST_LOG_LEVEL")) config.log_level = level;
    if (const char* dir = std::getenv("IMGHARVEST_LOG_DIR")) config.log_dir = dir;
}

Config ConfigLoader::from_args(int argc, char** argv) {
    Config config;
    if (argc > 1) {
        config = load_file(argv[1]);
    } else if (std::filesystem::exists("config.json")) {
        config = load_file("config.json");
    }
    if (argc > 2) config.target_image_count = parse_int(argv[2], "target count");
    if (argc > 3) config.input_path = argv[3];
    apply_env(config);
    validate(config);
    return config;
}

void ConfigLoader::validate(const Config& config) {
    if (config.target_image_count <= 0) throw ConfigError("target_image_count must be > 0");
    if (config.request_timeout_ms <= 0) throw ConfigError("request_timeout_ms must be > 0");
    if (config.max_concurrency <= 0) throw ConfigError("max_concurrency must be > 0");
    if (config.user_agent.empty()) throw ConfigError("user_agent must not be empty");
    if (config.input_path.empty()) throw ConfigError("input_path must not be empty");
    if (config.originals_root.empty()) throw ConfigError("originals_root must not be empty");
    if (config.output_root.empty()) throw ConfigError("output_root must not be empty");
    if (config.originals_root == config.output_root) {
        throw ConfigError("originals_root and output_root must differ");
    }
    // from_str maps any unrecognized name to off
    if (config.log_level != "off" && spdlog::level::from_str(config.log_level) == spdlog::level::off) {
        throw ConfigError("log_level '" + config.log_level + "' is not a known level");
    }
}
