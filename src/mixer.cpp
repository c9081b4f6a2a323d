#include "mixer.hpp"

#include <algorithm>

std::vector<Candidate> mix(const PageImages& pages) {
    std::vector<Candidate> result;
    if (pages.empty()) return result;

    size_t total = 0;
    size_t longest = 0;
    for (const auto& page : pages) {
        total += page.second.size();
        longest = std::max(longest, page.second.size());
    }
    result.reserve(total);

    if (pages.size() == 1) {
        for (const auto& url : pages.front().second) result.push_back(Candidate{pages.front().first, url});
        return result;
    }

    for (size_t i = 0; i < longest; ++i) {
        for (const auto& page : pages) {
            if (i < page.second.size()) result.push_back(Candidate{page.first, page.second[i]});
        }
    }
    return result;
}
