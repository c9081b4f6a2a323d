#include "logging.hpp"

#include "fs_utils.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <string>
#include <vector>

namespace {

constexpr const char* kPattern = "%Y-%m-%d %H:%M:%S.%e [%t] [%l] %v";

std::string log_file_name() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d--%H-%M-%S", &tm);
    return std::string(buf) + ".log";
}

} // namespace

std::shared_ptr<spdlog::logger> init_logging(const Config& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!config.log_dir.empty()) {
        ensure_dir(config.log_dir);
        auto path = std::filesystem::path(config.log_dir) / log_file_name();
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string()));
    }

    auto logger = std::make_shared<spdlog::logger>("imgharvest", sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    logger->set_level(spdlog::level::from_str(config.log_level));
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

void shutdown_logging() {
    spdlog::shutdown();
}
