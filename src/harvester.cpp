#include "harvester.hpp"

#include "fs_utils.hpp"
#include "image_store.hpp"
#include "manifest.hpp"
#include "page_harvester.hpp"

int exit_code(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::Success: return 0;
        case RunOutcome::Partial: return 2;
        case RunOutcome::NoCandidates: return 3;
    }
    return 1;
}

// -------------------- ctor --------------------
Harvester::Harvester(const Config& config, std::shared_ptr<spdlog::logger> logger, HttpClient& client)
    : config_(config),
      logger_(std::move(logger)),
      client_(client),
      canonicalizer_(config.blocklist ? UrlCanonicalizer(*config.blocklist) : UrlCanonicalizer()) {}

// -------------------- orchestration --------------------
RunReport Harvester::run() {
    std::vector<std::string> pages = read_line_list(config_.input_path);
    logger_->info("Loaded {} page URLs from {}", pages.size(), config_.input_path);
    return run(pages);
}

RunReport Harvester::run(const std::vector<std::string>& page_urls) {
    RunReport report;
    report.pages = page_urls.size();

    PageHarvester page_harvester(client_, canonicalizer_);
    HarvestOrchestrator orchestrator(page_harvester, config_.max_concurrency, logger_);
    PageImages harvested = orchestrator.harvest_all(page_urls);
    report.pages_harvested = harvested.size();

    std::vector<Candidate> candidates = mix(harvested);
    report.candidates = candidates.size();
    logger_->info("Candidates after mixing: {}", candidates.size());
    if (candidates.empty()) {
        logger_->error("No image candidates found, nothing to download");
        report.outcome = RunOutcome::NoCandidates;
        return report;
    }

    ImageStore store(client_, StorageRoots{config_.originals_root, config_.output_root}, logger_);
    BatchDownloader downloader(store, config_.max_concurrency, logger_);
    report.downloads = downloader.download_and_rotate_all(candidates, config_.target_image_count);

    if (!config_.manifest_path.empty()) {
        try {
            write_manifest(config_.manifest_path, report.downloads.results);
            logger_->info("Manifest written: {}, items: {}", config_.manifest_path, report.downloads.results.size());
        } catch (const IoError& e) {
            logger_->error("Manifest not written: {} ({})", e.subject(), e.what());
        }
    }

    report.outcome = report.downloads.success_count >= config_.target_image_count
        ? RunOutcome::Success
        : RunOutcome::Partial;
    logger_->info("Done: {} stored, {} failed, target {}",
                  report.downloads.success_count, report.downloads.error_count, config_.target_image_count);
    return report;
}
