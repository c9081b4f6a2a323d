#include "fs_utils.hpp"

#include "errors.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

std::vector<std::string> read_line_list(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) throw IoError(path, "cannot open for reading");

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line)) {
        size_t a = line.find_first_not_of(" \t\r\n");
        if (a == std::string::npos) continue;
        size_t b = line.find_last_not_of(" \t\r\n");
        line = line.substr(a, b - a + 1);
        if (line[0] == '#') continue;
        lines.push_back(line);
    }
    if (ifs.bad()) throw IoError(path, "read failed");
    return lines;
}

void write_binary(const std::string& path, const std::string& content) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) throw IoError(path, "cannot open for writing");
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
    ofs.close();
    if (!ofs) throw IoError(path, "write failed");
}

void ensure_dir(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) throw IoError(path, "cannot create directory: " + ec.message());
}
