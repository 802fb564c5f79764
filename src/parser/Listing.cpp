#include "Listing.hpp"

namespace Loopnet {

namespace {
template <typename T>
nlohmann::json OrNull(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}
}

void to_json(nlohmann::json& j, const PropertySummary& p) {
    j = nlohmann::json{
        {"name", p.name},
        {"address", p.address},
        {"city", p.city},
        {"state", p.state},
        {"zip_code", OrNull(p.zip_code)},
        {"property_type", OrNull(p.property_type)},
        {"listing_type", OrNull(p.listing_type)},
        {"price", OrNull(p.price)},
        {"price_per_sqft", OrNull(p.price_per_sqft)},
        {"size_sqft", OrNull(p.size_sqft)},
        {"lot_size", OrNull(p.lot_size)},
        {"url", p.url},
        {"image_url", OrNull(p.image_url)},
        {"broker_name", OrNull(p.broker_name)},
        {"broker_company", OrNull(p.broker_company)},
    };
}

void to_json(nlohmann::json& j, const PropertyDetail& d) {
    j = nlohmann::json{
        {"name", d.name},
        {"address", d.address},
        {"city", d.city},
        {"state", d.state},
        {"zip_code", OrNull(d.zip_code)},
        {"property_type", OrNull(d.property_type)},
        {"property_subtype", OrNull(d.property_subtype)},
        {"listing_type", OrNull(d.listing_type)},
        {"price", OrNull(d.price)},
        {"price_per_sqft", OrNull(d.price_per_sqft)},
        {"cap_rate", OrNull(d.cap_rate)},
        {"noi", OrNull(d.noi)},
        {"size_sqft", OrNull(d.size_sqft)},
        {"lot_size", OrNull(d.lot_size)},
        {"year_built", OrNull(d.year_built)},
        {"building_class", OrNull(d.building_class)},
        {"zoning", OrNull(d.zoning)},
        {"parking", OrNull(d.parking)},
        {"stories", OrNull(d.stories)},
        {"units", OrNull(d.units)},
        {"description", OrNull(d.description)},
        {"highlights", d.highlights},
        {"images", d.images},
        {"broker_name", OrNull(d.broker_name)},
        {"broker_company", OrNull(d.broker_company)},
        {"broker_phone", OrNull(d.broker_phone)},
        {"url", d.url},
        {"last_updated", OrNull(d.last_updated)},
    };
}

void to_json(nlohmann::json& j, const SearchResult& r) {
    j = nlohmann::json{
        {"query_location", r.query_location},
        {"query_property_type", OrNull(r.query_property_type)},
        {"query_listing_type", OrNull(r.query_listing_type)},
        {"total_results", OrNull(r.total_results)},
        {"page", r.page},
        {"has_next_page", r.has_next_page},
        {"properties", r.properties},
    };
}

}
