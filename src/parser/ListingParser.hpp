#pragma once
#include <optional>
#include <string>
#include <vector>
#include "Listing.hpp"

namespace Loopnet {

    class ListingParser {
    public:
        // "101 Main St, Dallas, TX 75201" -> street, city, state, zip.
        // Input without a comma is returned as the street address.
        static Address ParseAddress(const std::string& raw);

        static std::vector<PropertySummary> ParseSearchResults(const std::string& html, const std::string& base_url);

        // Result count from the page header, if the page shows one.
        static std::optional<int> ParseTotalResults(const std::string& html);

        static bool HasNextPage(const std::string& html);

        // Throws std::runtime_error if the HTML cannot be parsed.
        static PropertyDetail ParsePropertyDetail(const std::string& html, const std::string& url);
    };
}
