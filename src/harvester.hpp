#pragma once

#include "batch_downloader.hpp"
#include "config.hpp"
#include "http_client.hpp"
#include "mixer.hpp"

#include <spdlog/logger.h>

#include <memory>
#include <string>
#include <vector>

enum class RunOutcome {
    Success,       // target_image_count images stored
    Partial,       // candidates ran out first
    NoCandidates   // nothing to download
};

int exit_code(RunOutcome outcome);

struct RunReport {
    RunOutcome outcome = RunOutcome::NoCandidates;
    size_t pages = 0;
    size_t pages_harvested = 0;
    size_t candidates = 0;
    BatchOutcome downloads;
};

class Harvester {
public:
    Harvester(const Config& config, std::shared_ptr<spdlog::logger> logger, HttpClient& client);

    // Reads the page list from config.input_path and runs the whole pipeline.
    RunReport run();

    // Pipeline over an already loaded page list.
    RunReport run(const std::vector<std::string>& page_urls);

private:
    const Config& config_;
    std::shared_ptr<spdlog::logger> logger_;
    HttpClient& client_;
    UrlCanonicalizer canonicalizer_;
};
