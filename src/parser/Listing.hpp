#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Loopnet {

struct Address {
    std::string address;
    std::string city;
    std::string state;
    std::optional<std::string> zip_code;
};

// One placard on a search results page.
struct PropertySummary {
    std::string name;
    std::string address;
    std::string city;
    std::string state;
    std::optional<std::string> zip_code;
    std::optional<std::string> property_type;
    std::optional<std::string> listing_type;
    std::optional<std::string> price;
    std::optional<std::string> price_per_sqft;
    std::optional<std::string> size_sqft;
    std::optional<std::string> lot_size;
    std::string url;
    std::optional<std::string> image_url;
    std::optional<std::string> broker_name;
    std::optional<std::string> broker_company;
};

// Everything a listing's detail page exposes.
struct PropertyDetail {
    std::string name;
    std::string address;
    std::string city;
    std::string state;
    std::optional<std::string> zip_code;
    std::optional<std::string> property_type;
    std::optional<std::string> property_subtype;
    std::optional<std::string> listing_type;
    std::optional<std::string> price;
    std::optional<std::string> price_per_sqft;
    std::optional<std::string> cap_rate;
    std::optional<std::string> noi;
    std::optional<std::string> size_sqft;
    std::optional<std::string> lot_size;
    std::optional<std::string> year_built;
    std::optional<std::string> building_class;
    std::optional<std::string> zoning;
    std::optional<std::string> parking;
    std::optional<int> stories;
    std::optional<int> units;
    std::optional<std::string> description;
    std::vector<std::string> highlights;
    std::vector<std::string> images;
    std::optional<std::string> broker_name;
    std::optional<std::string> broker_company;
    std::optional<std::string> broker_phone;
    std::string url;
    std::optional<std::string> last_updated;
};

struct SearchResult {
    std::string query_location;
    std::optional<std::string> query_property_type;
    std::optional<std::string> query_listing_type;
    std::optional<int> total_results;
    int page = 1;
    bool has_next_page = false;
    std::vector<PropertySummary> properties;
};

void to_json(nlohmann::json& j, const PropertySummary& p);
void to_json(nlohmann::json& j, const PropertyDetail& d);
void to_json(nlohmann::json& j, const SearchResult& r);

}
