#pragma once

#include "image_store.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

nlohmann::json manifest_json(const std::vector<ImgResult>& results);

// Per-run report of every attempted image. Throws IoError.
void write_manifest(const std::string& filepath, const std::vector<ImgResult>& results);
