#include "filename_encoder.hpp"

#include "url_canonicalizer.hpp"

#include <cctype>

std::string FilenameEncoder::percent_encode(const std::string& s) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else if (c == ' ') {
            out += '+';
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

std::string FilenameEncoder::splice_query(const std::string& path, const std::string& query) {
    if (query.empty()) return path;

    auto slash = path.rfind('/');
    size_t name_start = slash == std::string::npos ? 0 : slash + 1;
    std::string dir = path.substr(0, name_start);
    std::string name = path.substr(name_start);

    // a leading dot marks a hidden file, not a suffix
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return dir + name + kDelimiter + query;
    }
    return dir + name.substr(0, dot) + kDelimiter + query + name.substr(dot);
}

StoragePath FilenameEncoder::convert(const std::string& url) {
    UrlCanonicalizer::UrlParts parts = UrlCanonicalizer::split(url);

    std::string path = parts.path;
    if (!path.empty() && path[0] == '/') path.erase(0, 1);
    if (path.empty() || path.back() == '/') path += kIndexName;

    StoragePath out;
    out.directory = UrlCanonicalizer::hostname(url);
    out.filename = percent_encode(splice_query(path, parts.query));
    return out;
}
