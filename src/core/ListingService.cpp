#include "ListingService.hpp"
#include <stdexcept>
#include "../parser/ListingParser.hpp"
#include "../utils/Logger.hpp"
#include "../utils/UrlUtil.hpp"

namespace Loopnet {

ListingService::ListingService(FetchOrchestrator& orchestrator, std::string base_url)
    : orchestrator_(orchestrator), base_url_(std::move(base_url)) {}

SearchResult ListingService::Search(const std::string& location, const std::string& property_type,
                                    const std::string& listing_type, int page) {
    const std::string url = UrlUtil::BuildSearchUrl(base_url_, location, property_type, listing_type, page);
    Logger::Log(LogLevel::Info, "Searching: " + url);

    const std::string html = orchestrator_.Fetch(url);

    SearchResult result;
    result.query_location = location;
    if (!property_type.empty()) result.query_property_type = property_type;
    result.query_listing_type = listing_type;
    result.page = page;
    result.properties = ListingParser::ParseSearchResults(html, base_url_);
    for (auto& property : result.properties) {
        property.listing_type = listing_type;
    }
    result.total_results = ListingParser::ParseTotalResults(html);
    if (!result.total_results) {
        result.total_results = static_cast<int>(result.properties.size());
    }
    result.has_next_page = ListingParser::HasNextPage(html);

    Logger::Log(LogLevel::Info, "Found " + std::to_string(result.properties.size()) + " properties on page " +
                                    std::to_string(page));
    return result;
}

std::string ListingService::ResolveDetailUrl(const std::string& url_or_id) const {
    if (url_or_id.rfind("http", 0) == 0) return url_or_id;
    return UrlUtil::BuildDetailUrl(base_url_, url_or_id);
}

PropertyDetail ListingService::Detail(const std::string& url_or_id) {
    const std::string url = ResolveDetailUrl(url_or_id);
    Logger::Log(LogLevel::Info, "Fetching property: " + url);

    const std::string html = orchestrator_.Fetch(url);
    try {
        return ListingParser::ParsePropertyDetail(html, url);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Failed to parse property page: ") + e.what());
    }
}

}
