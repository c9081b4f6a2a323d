#include "page_harvester.hpp"

#include "errors.hpp"
#include "task_pool.hpp"

#include <exception>

PageHarvester::PageHarvester(HttpClient& client, const UrlCanonicalizer& canonicalizer)
    : fetcher_(client), canonicalizer_(canonicalizer) {}

std::vector<std::string> PageHarvester::harvest(const std::string& page_url) const {
    HttpResponse page = fetcher_.fetch(page_url);
    try {
        return canonicalizer_.parse(page.body, page.final_url);
    } catch (const std::exception& e) {
        // std::regex_error and friends
        throw ParseError(page_url, e.what());
    }
}

HarvestOrchestrator::HarvestOrchestrator(const PageHarvester& harvester,
                                         int max_concurrency,
                                         std::shared_ptr<spdlog::logger> logger)
    : harvester_(harvester), max_concurrency_(max_concurrency), logger_(std::move(logger)) {}

PageImages HarvestOrchestrator::harvest_all(const std::vector<std::string>& page_urls) const {
    auto outcomes = run_isolated<std::vector<std::string>>(
        page_urls, max_concurrency_,
        [&](std::size_t i) { return harvester_.harvest(page_urls[i]); });

    PageImages result;
    result.reserve(outcomes.size());
    for (auto& out : outcomes) {
        if (!out.ok()) {
            logger_->warn("Harvest failed [{}]: {} ({})", error_kind_name(out.error_kind), out.subject, out.error);
            continue;
        }
        logger_->info("Harvested: {} images: {}", out.subject, out.value->size());
        result.emplace_back(out.subject, std::move(*out.value));
    }
    logger_->info("Pages harvested: {}/{}", result.size(), page_urls.size());
    return result;
}
