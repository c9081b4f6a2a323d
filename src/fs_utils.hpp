#pragma once

#include <string>
#include <vector>

// Non-empty lines of a text file, trimmed; lines starting with '#' skipped.
std::vector<std::string> read_line_list(const std::string& path);

void write_binary(const std::string& path, const std::string& content);

void ensure_dir(const std::string& path);
