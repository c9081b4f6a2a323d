#pragma once

#include "errors.hpp"
#include "http_client.hpp"

#include <spdlog/logger.h>

#include <memory>
#include <optional>
#include <string>

enum class ImgStatus {
    NotProcessed,
    Downloaded,
    Processed
};

const char* img_status_name(ImgStatus status);

struct Img {
    std::string url;
    std::string source_page;
    std::string directory;
    std::string filename;
    ImgStatus status = ImgStatus::NotProcessed;
};

// Where one image ended up. img holds the last status reached; on failure
// error_kind and error say why it stopped there.
struct ImgResult {
    Img img;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;

    bool ok() const { return error_kind == ErrorKind::None && img.status == ImgStatus::Processed; }
};

// Seam between the batch loop and the network/filesystem work.
class ImageProcessor {
public:
    virtual ~ImageProcessor() = default;
    virtual ImgResult download_and_rotate(const Img& img) = 0;
};

struct StorageRoots {
    std::string originals_root;
    std::string output_root;
};

class ImageStore : public ImageProcessor {
public:
    ImageStore(HttpClient& client, StorageRoots roots, std::shared_ptr<spdlog::logger> logger);

    // Downloads img.url into originals_root/<directory>/<filename>, then
    // writes a copy rotated by 180 degrees to output_root at the same
    // relative path. The filename gains an extension from Content-Type when
    // it does not already end in one matching it.
    ImgResult download_and_rotate(const Img& img) override;

    // Each stage returns a new Img one status further along.
    virtual Img download(const Img& img) const;
    virtual Img rotate(const Img& img) const;

    // ".jpg" for "image/jpeg; charset=binary"; nullopt when unknown.
    static std::optional<std::string> guess_extension(const std::string& content_type);
    static std::string repair_filename(const std::string& filename, const std::string& content_type);

    std::string original_path(const Img& img) const;
    std::string output_path(const Img& img) const;

private:
    PageFetcher fetcher_;
    StorageRoots roots_;
    std::shared_ptr<spdlog::logger> logger_;

    static std::string read_file(const std::string& path);
};
