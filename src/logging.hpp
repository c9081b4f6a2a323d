#pragma once

#include "config.hpp"

#include <spdlog/logger.h>

#include <memory>

// Console sink, plus log_dir/<timestamp>.log when log_dir is set.
std::shared_ptr<spdlog::logger> init_logging(const Config& config);

void shutdown_logging();
