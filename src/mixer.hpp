#pragma once

#include "page_harvester.hpp"

#include <string>
#include <vector>

struct Candidate {
    std::string page_url;
    std::string image_url;

    bool operator==(const Candidate& o) const {
        return page_url == o.page_url && image_url == o.image_url;
    }
};

// Round-robin interleaving of per-page image lists:
//
//   {A: [a0, a1], B: [b0], C: []}  ->  (A,a0) (B,b0) (A,a1)
//
// Page order is the order of `pages`; order within a page is preserved.
std::vector<Candidate> mix(const PageImages& pages);
