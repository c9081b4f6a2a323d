#include "image_store.hpp"

#include "fs_utils.hpp"
#include "image_codec.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct MimeExtensions {
    const char* mime;
    std::vector<const char*> extensions;  // first one is appended
};

const std::vector<MimeExtensions>& mime_table() {
    static const std::vector<MimeExtensions> table = {
        {"image/jpeg", {".jpg", ".jpeg", ".jpe", ".jfif"}},
        {"image/pjpeg", {".jpg", ".jpeg"}},
        {"image/png", {".png"}},
        {"image/gif", {".gif"}},
        {"image/webp", {".webp"}},
        {"image/bmp", {".bmp"}},
        {"image/x-ms-bmp", {".bmp"}},
        {"image/tiff", {".tiff", ".tif"}},
        {"image/svg+xml", {".svg"}},
        {"image/x-icon", {".ico"}},
        {"image/vnd.microsoft.icon", {".ico"}},
        {"image/avif", {".avif"}},
        {"image/heic", {".heic"}},
    };
    return table;
}

std::string to_lower(std::string s) {
    for (auto& ch : s) ch = static_cast<char>(::tolower(static_cast<unsigned char>(ch)));
    return s;
}

std::string mime_type(const std::string& content_type) {
    std::string t = content_type.substr(0, content_type.find(';'));
    size_t a = t.find_first_not_of(" \t");
    if (a == std::string::npos) return {};
    size_t b = t.find_last_not_of(" \t");
    return to_lower(t.substr(a, b - a + 1));
}

const MimeExtensions* lookup(const std::string& content_type) {
    std::string mime = mime_type(content_type);
    for (const auto& entry : mime_table()) {
        if (mime == entry.mime) return &entry;
    }
    return nullptr;
}

bool ends_with(const std::string& s, const std::string& suf) {
    return s.size() >= suf.size() && s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
}

} // namespace

const char* img_status_name(ImgStatus status) {
    switch (status) {
        case ImgStatus::NotProcessed: return "not_processed";
        case ImgStatus::Downloaded: return "downloaded";
        case ImgStatus::Processed: return "processed";
    }
    return "not_processed";
}

ImageStore::ImageStore(HttpClient& client, StorageRoots roots, std::shared_ptr<spdlog::logger> logger)
    : fetcher_(client), roots_(std::move(roots)), logger_(std::move(logger)) {}

// -------------------- naming --------------------
std::optional<std::string> ImageStore::guess_extension(const std::string& content_type) {
    const MimeExtensions* entry = lookup(content_type);
    if (!entry) return std::nullopt;
    return std::string(entry->extensions.front());
}

std::string ImageStore::repair_filename(const std::string& filename, const std::string& content_type) {
    const MimeExtensions* entry = lookup(content_type);
    if (!entry) return filename;
    std::string lower = to_lower(filename);
    for (const char* ext : entry->extensions) {
        if (ends_with(lower, ext)) return filename;
    }
    return filename + entry->extensions.front();
}

std::string ImageStore::original_path(const Img& img) const {
    return (fs::path(roots_.originals_root) / img.directory / img.filename).string();
}

std::string ImageStore::output_path(const Img& img) const {
    return (fs::path(roots_.output_root) / img.directory / img.filename).string();
}

std::string ImageStore::read_file(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) throw IoError(path, "cannot open for reading");
    std::ostringstream ss;
    ss << ifs.rdbuf();
    if (ifs.bad()) throw IoError(path, "read failed");
    return ss.str();
}

// -------------------- stages --------------------
Img ImageStore::download(const Img& img) const {
    HttpResponse r = fetcher_.fetch(img.url);

    Img next = img;
    next.filename = repair_filename(img.filename, r.content_type);

    ensure_dir((fs::path(roots_.originals_root) / next.directory).string());
    write_binary(original_path(next), r.body);
    next.status = ImgStatus::Downloaded;
    return next;
}

Img ImageStore::rotate(const Img& img) const {
    const std::string src = original_path(img);
    Image decoded = ImageCodec::decode(read_file(src), src);
    std::string encoded = ImageCodec::encode(ImageCodec::rotate_180(decoded), src);

    ensure_dir((fs::path(roots_.output_root) / img.directory).string());
    write_binary(output_path(img), encoded);

    Img next = img;
    next.status = ImgStatus::Processed;
    return next;
}

ImgResult ImageStore::download_and_rotate(const Img& img) {
    ImgResult result;
    result.img = img;
    try {
        result.img = download(result.img);
        result.img = rotate(result.img);
        logger_->debug("Stored: {} -> {}", img.url, output_path(result.img));
    } catch (const PipelineError& e) {
        result.error_kind = e.kind();
        result.error = e.what();
        logger_->warn("Image failed [{}]: {} ({})", error_kind_name(e.kind()), img.url, e.what());
    } catch (const std::exception& e) {
        result.error_kind = ErrorKind::Unknown;
        result.error = e.what();
        logger_->error("Image failed [{}] at {}: {} ({})", error_kind_name(ErrorKind::Unknown),
                       img_status_name(result.img.status), img.url, e.what());
    }
    return result;
}
