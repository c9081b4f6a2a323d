#pragma once

#include "image_store.hpp"
#include "mixer.hpp"

#include <spdlog/logger.h>

#include <cstddef>
#include <memory>
#include <vector>

struct BatchOutcome {
    int error_count = 0;
    int success_count = 0;
    int batches = 0;
    std::vector<ImgResult> results;  // every attempted image, in candidate order
};

// Works through candidates in forward-only windows until target_count images
// are stored or the list runs out. The first window is [0, target_count);
// each later window starts where the previous ended and is as long as the
// remaining shortfall. A failed candidate is never tried again.
class BatchDownloader {
public:
    BatchDownloader(ImageProcessor& processor, int max_concurrency, std::shared_ptr<spdlog::logger> logger);

    BatchOutcome download_and_rotate_all(const std::vector<Candidate>& candidates, int target_count) const;

    static Img make_img(const Candidate& candidate);

private:
    ImageProcessor& processor_;
    int max_concurrency_;
    std::shared_ptr<spdlog::logger> logger_;

    void run_batch(const std::vector<Candidate>& candidates, size_t from, size_t to, BatchOutcome& totals) const;
};
