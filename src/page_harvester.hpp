#pragma once

#include "http_client.hpp"
#include "url_canonicalizer.hpp"

#include <spdlog/logger.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

// Image URLs per webpage, in the order the pages were given.
using PageImages = std::vector<std::pair<std::string, std::vector<std::string>>>;

class PageHarvester {
public:
    PageHarvester(HttpClient& client, const UrlCanonicalizer& canonicalizer);

    // Fetches page_url and returns the image URLs it references. Relative
    // references resolve against the post-redirect URL. Any failure surfaces
    // as a PipelineError whose subject is page_url.
    std::vector<std::string> harvest(const std::string& page_url) const;

private:
    PageFetcher fetcher_;
    const UrlCanonicalizer& canonicalizer_;
};

class HarvestOrchestrator {
public:
    HarvestOrchestrator(const PageHarvester& harvester,
                        int max_concurrency,
                        std::shared_ptr<spdlog::logger> logger);

    // Harvests every page concurrently. Failed pages are logged and left out
    // of the result; pages without images stay in with an empty list.
    PageImages harvest_all(const std::vector<std::string>& page_urls) const;

private:
    const PageHarvester& harvester_;
    int max_concurrency_;
    std::shared_ptr<spdlog::logger> logger_;
};
