#include "url_canonicalizer.hpp"

#include <gumbo.h>

#include <cctype>
#include <regex>
#include <unordered_set>

namespace {

void collect_img_srcs(const GumboNode* node, std::vector<std::string>& srcs) {
    if (node->type != GUMBO_NODE_ELEMENT) return;
    const GumboElement& element = node->v.element;
    if (element.tag == GUMBO_TAG_IMG) {
        const GumboAttribute* src = gumbo_get_attribute(&element.attributes, "src");
        if (src && src->value) srcs.emplace_back(src->value);
    }
    const GumboVector& children = element.children;
    for (unsigned i = 0; i < children.length; ++i) {
        collect_img_srcs(static_cast<const GumboNode*>(children.data[i]), srcs);
    }
}

} // namespace

// -------------------- blocklist --------------------
const std::vector<std::string>& UrlCanonicalizer::default_blocklist() {
    static const std::vector<std::string> keywords = {
        "adServer", "scorecardresearch.com", "1px", "avatar",
        "profile", "logo", "static", ".svg"
    };
    return keywords;
}

UrlCanonicalizer::UrlCanonicalizer() : blocklist_(default_blocklist()) {}

UrlCanonicalizer::UrlCanonicalizer(std::vector<std::string> blocklist)
    : blocklist_(std::move(blocklist)) {}

bool UrlCanonicalizer::is_blocked(const std::string& reference) const {
    for (const auto& keyword : blocklist_) {
        if (!keyword.empty() && reference.find(keyword) != std::string::npos) return true;
    }
    return false;
}

// -------------------- small utils --------------------
std::string UrlCanonicalizer::to_lower(const std::string& s) {
    std::string r = s;
    for (auto& ch : r) ch = static_cast<char>(::tolower(static_cast<unsigned char>(ch)));
    return r;
}

std::string UrlCanonicalizer::trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n\f");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n\f");
    return s.substr(a, b - a + 1);
}

// -------------------- url structure --------------------
UrlCanonicalizer::UrlParts UrlCanonicalizer::split(const std::string& url) {
    // RFC 3986, appendix B
    static const std::regex re(R"(^(([^:/?#]+):)?(//([^/?#]*))?([^?#]*)(\?([^#]*))?(#(.*))?)");
    UrlParts p;
    std::smatch m;
    if (!std::regex_search(url, m, re)) {
        p.path = url;
        return p;
    }
    p.has_scheme = m[1].matched;
    p.scheme = m[2].str();
    p.has_authority = m[3].matched;
    p.authority = m[4].str();
    p.path = m[5].str();
    p.has_query = m[6].matched;
    p.query = m[7].str();
    p.has_fragment = m[8].matched;
    p.fragment = m[9].str();
    return p;
}

std::string UrlCanonicalizer::recompose(const UrlParts& parts) {
    std::string out;
    if (parts.has_scheme) out += parts.scheme + ":";
    if (parts.has_authority) out += "//" + parts.authority;
    out += parts.path;
    if (parts.has_query) out += "?" + parts.query;
    if (parts.has_fragment) out += "#" + parts.fragment;
    return out;
}

std::string UrlCanonicalizer::remove_dot_segments(const std::string& path) {
    std::string in = path;
    std::string out;
    while (!in.empty()) {
        if (in.rfind("../", 0) == 0) {
            in.erase(0, 3);
        } else if (in.rfind("./", 0) == 0) {
            in.erase(0, 2);
        } else if (in.rfind("/./", 0) == 0) {
            in.replace(0, 3, "/");
        } else if (in == "/.") {
            in = "/";
        } else if (in.rfind("/../", 0) == 0 || in == "/..") {
            in = in.size() == 3 ? std::string("/") : in.substr(3);
            auto slash = out.rfind('/');
            out.erase(slash == std::string::npos ? 0 : slash);
        } else if (in == "." || in == "..") {
            in.clear();
        } else {
            size_t start = in[0] == '/' ? 1 : 0;
            size_t next = in.find('/', start);
            if (next == std::string::npos) next = in.size();
            out += in.substr(0, next);
            in.erase(0, next);
        }
    }
    return out;
}

std::string UrlCanonicalizer::hostname(const std::string& url) {
    UrlParts p = split(url);
    std::string host = p.authority;
    auto at = host.rfind('@');
    if (at != std::string::npos) host = host.substr(at + 1);
    if (!host.empty() && host[0] == '[') {
        auto close = host.find(']');
        host = host.substr(1, close == std::string::npos ? std::string::npos : close - 1);
    } else {
        auto colon = host.find(':');
        if (colon != std::string::npos) host = host.substr(0, colon);
    }
    return to_lower(host);
}

std::string UrlCanonicalizer::resolve(const std::string& reference, const std::string& base_url) {
    UrlParts r = split(trim(reference));
    UrlParts b = split(base_url);
    UrlParts t;

    if (r.has_scheme) {
        t = r;
        t.path = remove_dot_segments(r.path);
    } else {
        if (r.has_authority) {
            t.has_authority = true;
            t.authority = r.authority;
            t.path = remove_dot_segments(r.path);
            t.has_query = r.has_query;
            t.query = r.query;
        } else {
            if (r.path.empty()) {
                t.path = b.path;
                t.has_query = r.has_query || b.has_query;
                t.query = r.has_query ? r.query : b.query;
            } else {
                if (r.path[0] == '/') {
                    t.path = remove_dot_segments(r.path);
                } else {
                    // merge with the base path's directory
                    std::string merged;
                    if (b.has_authority && b.path.empty()) {
                        merged = "/" + r.path;
                    } else {
                        auto slash = b.path.rfind('/');
                        merged = (slash == std::string::npos ? std::string() : b.path.substr(0, slash + 1)) + r.path;
                    }
                    t.path = remove_dot_segments(merged);
                }
                t.has_query = r.has_query;
                t.query = r.query;
            }
            t.has_authority = b.has_authority;
            t.authority = b.authority;
        }
        t.has_scheme = b.has_scheme;
        t.scheme = b.scheme;
    }

    t.scheme = to_lower(t.scheme);
    if (t.has_authority) {
        // lowercase the host but leave any userinfo untouched
        auto at = t.authority.rfind('@');
        size_t host_start = at == std::string::npos ? 0 : at + 1;
        t.authority = t.authority.substr(0, host_start) + to_lower(t.authority.substr(host_start));
        if (t.path.empty() && (t.scheme == "http" || t.scheme == "https")) t.path = "/";
    }
    t.has_fragment = false;
    t.fragment.clear();
    return recompose(t);
}

// -------------------- markup --------------------
std::vector<std::string> UrlCanonicalizer::img_srcs(const std::string& markup) {
    std::vector<std::string> srcs;
    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, markup.data(), markup.size());
    if (!output) return srcs;
    collect_img_srcs(output->root, srcs);
    gumbo_destroy_output(&kGumboDefaultOptions, output);
    return srcs;
}

std::vector<std::string> UrlCanonicalizer::parse(const std::string& markup, const std::string& base_url) const {
    std::vector<std::string> urls;
    std::unordered_set<std::string> seen;
    // attribute values arrive entity-decoded
    for (const auto& src : img_srcs(markup)) {
        std::string reference = trim(src);
        if (reference.empty()) continue;
        if (is_blocked(reference)) continue;
        std::string url = resolve(reference, base_url);
        std::string scheme = split(url).scheme;
        if (scheme != "http" && scheme != "https") continue;
        if (seen.insert(url).second) urls.push_back(std::move(url));
    }
    return urls;
}
