#include "batch_downloader.hpp"

#include "filename_encoder.hpp"
#include "task_pool.hpp"

#include <algorithm>
#include <string>

BatchDownloader::BatchDownloader(ImageProcessor& processor, int max_concurrency,
                                 std::shared_ptr<spdlog::logger> logger)
    : processor_(processor), max_concurrency_(max_concurrency), logger_(std::move(logger)) {}

Img BatchDownloader::make_img(const Candidate& candidate) {
    StoragePath path = FilenameEncoder::convert(candidate.image_url);
    Img img;
    img.url = candidate.image_url;
    img.source_page = candidate.page_url;
    img.directory = path.directory;
    img.filename = path.filename;
    img.status = ImgStatus::NotProcessed;
    return img;
}

void BatchDownloader::run_batch(const std::vector<Candidate>& candidates, size_t from, size_t to,
                                BatchOutcome& totals) const {
    std::vector<Img> imgs;
    std::vector<std::string> subjects;
    imgs.reserve(to - from);
    subjects.reserve(to - from);
    for (size_t i = from; i < to; ++i) {
        imgs.push_back(make_img(candidates[i]));
        subjects.push_back(candidates[i].image_url);
    }

    auto outcomes = run_isolated<ImgResult>(
        subjects, max_concurrency_,
        [&](std::size_t i) { return processor_.download_and_rotate(imgs[i]); });

    int errors = 0;
    int successes = 0;
    for (size_t i = 0; i < outcomes.size(); ++i) {
        ImgResult result;
        if (outcomes[i].ok()) {
            result = std::move(*outcomes[i].value);
        } else {
            // escaped the processor: not a PipelineError
            result.img = imgs[i];
            result.error_kind = outcomes[i].error_kind;
            result.error = outcomes[i].error;
            logger_->error("Image failed [{}]: {} ({})", error_kind_name(result.error_kind),
                           outcomes[i].subject, result.error);
        }
        if (result.ok()) ++successes;
        else ++errors;
        totals.results.push_back(std::move(result));
    }

    totals.error_count += errors;
    totals.success_count += successes;
    ++totals.batches;
    logger_->info("Batch [{}, {}) done: {} ok, {} failed (total {} ok, {} failed)",
                  from, to, successes, errors, totals.success_count, totals.error_count);
}

BatchOutcome BatchDownloader::download_and_rotate_all(const std::vector<Candidate>& candidates,
                                                      int target_count) const {
    BatchOutcome totals;
    if (target_count <= 0 || candidates.empty()) return totals;

    const size_t size = candidates.size();
    size_t from = 0;
    size_t to = static_cast<size_t>(target_count);
    for (;;) {
        size_t end = std::min(to, size);
        logger_->info("Batch [{}, {}) of {} candidates", from, end, size);
        run_batch(candidates, from, end, totals);

        if (to >= size) {
            if (totals.success_count < target_count) {
                logger_->warn("Candidates exhausted: {}/{} images stored", totals.success_count, target_count);
            }
            break;
        }
        if (totals.success_count >= target_count) break;

        from = to;
        to = from + static_cast<size_t>(target_count - totals.success_count);
    }
    return totals;
}
