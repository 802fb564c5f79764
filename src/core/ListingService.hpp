#pragma once
#include <string>
#include "FetchOrchestrator.hpp"
#include "../parser/Listing.hpp"

namespace Loopnet {

// Search and detail lookups on top of the fetch pipeline.
class ListingService {
public:
    ListingService(FetchOrchestrator& orchestrator, std::string base_url);

    // Fetch errors propagate unchanged.
    SearchResult Search(const std::string& location, const std::string& property_type = "",
                        const std::string& listing_type = "for-sale", int page = 1);

    // Accepts a listing URL or a bare listing id.
    // Throws FetchError on retrieval failure, std::runtime_error if the page cannot be parsed.
    PropertyDetail Detail(const std::string& url_or_id);

    std::string ResolveDetailUrl(const std::string& url_or_id) const;

private:
    FetchOrchestrator& orchestrator_;
    std::string base_url_;
};

}
