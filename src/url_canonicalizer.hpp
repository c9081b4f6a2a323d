#pragma once

#include <string>
#include <vector>

class UrlCanonicalizer {
public:
    // Components of an RFC 3986 URI reference. has_* flags distinguish an
    // absent component from an empty one ("?" with nothing after it).
    struct UrlParts {
        std::string scheme;
        std::string authority;
        std::string path;
        std::string query;
        std::string fragment;
        bool has_scheme = false;
        bool has_authority = false;
        bool has_query = false;
        bool has_fragment = false;
    };

    static const std::vector<std::string>& default_blocklist();

    UrlCanonicalizer();
    explicit UrlCanonicalizer(std::vector<std::string> blocklist);

    // Absolute URL of reference against base_url, without fragment.
    static std::string resolve(const std::string& reference, const std::string& base_url);

    // Image URLs referenced by <img src> in markup, resolved against base_url,
    // blocklisted references dropped, duplicates removed. Results keep the
    // document order of each URL's first occurrence.
    std::vector<std::string> parse(const std::string& markup, const std::string& base_url) const;

    bool is_blocked(const std::string& reference) const;

    static UrlParts split(const std::string& url);
    static std::string recompose(const UrlParts& parts);
    static std::string remove_dot_segments(const std::string& path);
    static std::string hostname(const std::string& url);

    const std::vector<std::string>& blocklist() const { return blocklist_; }

private:
    std::vector<std::string> blocklist_;

    static std::string to_lower(const std::string& s);
    static std::string trim(const std::string& s);
    // src values of <img> elements in document order, as an HTML5 parser
    // tokenizes them
    static std::vector<std::string> img_srcs(const std::string& markup);
};
