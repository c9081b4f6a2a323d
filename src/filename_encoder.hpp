#pragma once

#include <string>

struct StoragePath {
    std::string directory;
    std::string filename;
};

// Maps an absolute image URL to <hostname>/<encoded path and query>.
//
//   https://sub.example.org/images/Ex.jpg?p=1
//     -> directory "sub.example.org", filename "images%2FEx--p%3D1.jpg"
//
// The query is spliced in before the last suffix so the extension stays at
// the end of the name. Distinct URLs can collide (e.g. "a--b.jpg" and
// "a.jpg?b"); writers sharing a path race and the last one wins.
class FilenameEncoder {
public:
    static constexpr const char* kDelimiter = "--";
    static constexpr const char* kIndexName = "index";

    static StoragePath convert(const std::string& url);

    // quote_plus-style escaping: unreserved characters kept, space -> '+'.
    static std::string percent_encode(const std::string& s);

private:
    static std::string splice_query(const std::string& path, const std::string& query);
};
