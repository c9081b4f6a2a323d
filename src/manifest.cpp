#include "manifest.hpp"

#include "fs_utils.hpp"

#include <filesystem>

using nlohmann::json;

json manifest_json(const std::vector<ImgResult>& results) {
    json j = json::array();
    for (const auto& r : results) {
        j.push_back({
            {"url", r.img.url},
            {"source_page", r.img.source_page},
            {"directory", r.img.directory},
            {"filename", r.img.filename},
            {"status", img_status_name(r.img.status)},
            {"error", r.error}
        });
    }
    return j;
}

void write_manifest(const std::string& filepath, const std::vector<ImgResult>& results) {
    auto parent = std::filesystem::path(filepath).parent_path();
    if (!parent.empty()) ensure_dir(parent.string());
    write_binary(filepath, manifest_json(results).dump(2));
}
