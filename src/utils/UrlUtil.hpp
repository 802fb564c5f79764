#pragma once
#include <optional>
#include <string>

namespace Loopnet {
namespace UrlUtil {

// Turns free-form location input into a URL slug.
// "Houston, TX" -> "houston-tx", "New York, NY" -> "new-york-ny", "77001" -> "77001"
std::string NormalizeLocation(const std::string& location);

// {base}/search/{type-slug}/{location-slug}/{listing_type}/[{page}/]
// Unknown or empty property types search all commercial real estate.
std::string BuildSearchUrl(const std::string& base_url, const std::string& location,
                           const std::string& property_type = "",
                           const std::string& listing_type = "for-sale", int page = 1);

// Numeric id from the last path segment, e.g. /Listing/1435-River-Ave-Camden-NJ/31948105/
// -> "31948105", /property/4820-mims-ave-laredo-tx-78041/48479-210176/ -> "48479-210176".
std::optional<std::string> ExtractListingId(const std::string& url);

std::string BuildDetailUrl(const std::string& base_url, const std::string& listing_id);

// Resolve possibly-relative or protocol-relative URL against a base URL (page URL).
// Rules:
// - If candidate starts with http:// or https://, return as-is.
// - If candidate starts with //, prefix https:.
// - If candidate starts with /, return base_scheme://base_host + candidate.
// - Otherwise, append to base directory: base_scheme://base_host/base_dir/ + candidate.
// On parse failure, returns candidate unchanged.
std::string ResolveAgainst(const std::string& base_url, const std::string& candidate);

}
}
