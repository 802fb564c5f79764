#include "UrlUtil.hpp"
#include <map>
#include <regex>
#include <cstring>

namespace Loopnet {
namespace UrlUtil {

namespace {

const std::map<std::string, std::string>& PropertyTypeSlugs() {
    static const std::map<std::string, std::string> slugs = {
        {"office", "office"},
        {"retail", "retail"},
        {"industrial", "industrial"},
        {"multifamily", "apartment-buildings"},
        {"land", "land"},
        {"hospitality", "hospitality"},
        {"special-purpose", "commercial-real-estate"},
        {"health-care", "health-care-facilities"},
    };
    return slugs;
}

inline bool starts_with(const std::string& s, const char* pfx) {
    size_t n = strlen(pfx);
    return s.size() >= n && memcmp(s.data(), pfx, n) == 0;
}

inline std::string get_scheme_host(const std::string& url) {
    // Very small parser: scheme://host[:port]
    auto pos_scheme = url.find("://");
    if (pos_scheme == std::string::npos) return {};
    auto start_host = pos_scheme + 3;
    auto pos_end = url.find_first_of("/\\?#", start_host);
    if (pos_end == std::string::npos) pos_end = url.size();
    return url.substr(0, pos_end);
}

inline std::string get_base_dir(const std::string& url) {
    // Returns scheme://host[:port]/path/dir (without filename)
    auto scheme_host = get_scheme_host(url);
    if (scheme_host.empty()) return {};
    std::string rest = url.substr(scheme_host.size());
    auto qpos = rest.find_first_of("?#");
    if (qpos != std::string::npos) rest = rest.substr(0, qpos);
    if (rest.empty()) {
        rest = "/";
    } else if (rest.back() != '/') {
        auto slash = rest.find_last_of('/');
        rest = (slash != std::string::npos) ? rest.substr(0, slash + 1) : "/";
    }
    return scheme_host + rest;
}

} // anonymous namespace

std::string NormalizeLocation(const std::string& location) {
    std::string text;
    for (char c : location) {
        if (c != ',') text.push_back(c);
    }
    text = std::regex_replace(text, std::regex(R"(^\s+|\s+$)"), "");
    text = std::regex_replace(text, std::regex(R"(\s+)"), "-");

    std::string slug;
    for (unsigned char c : text) {
        if (c >= 'A' && c <= 'Z') c = static_cast<unsigned char>(c + 32);
        if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-') slug.push_back(static_cast<char>(c));
    }
    slug = std::regex_replace(slug, std::regex("-+"), "-");
    while (!slug.empty() && slug.front() == '-') slug.erase(slug.begin());
    while (!slug.empty() && slug.back() == '-') slug.pop_back();
    return slug;
}

std::string BuildSearchUrl(const std::string& base_url, const std::string& location,
                           const std::string& property_type, const std::string& listing_type, int page) {
    const auto& slugs = PropertyTypeSlugs();
    auto it = slugs.find(property_type);
    const std::string type_slug = it != slugs.end() ? it->second : "commercial-real-estate";

    std::string url = base_url + "/search/" + type_slug + "/" + NormalizeLocation(location) + "/" + listing_type + "/";
    if (page > 1) {
        url += std::to_string(page) + "/";
    }
    return url;
}

std::optional<std::string> ExtractListingId(const std::string& url) {
    std::string trimmed = url;
    while (!trimmed.empty() && trimmed.back() == '/') trimmed.pop_back();
    trimmed += "/";

    static const std::regex id_regex(R"(/(\d[\d-]*)/?$)");
    std::smatch match;
    if (std::regex_search(trimmed, match, id_regex)) {
        return match[1].str();
    }
    return std::nullopt;
}

std::string BuildDetailUrl(const std::string& base_url, const std::string& listing_id) {
    return base_url + "/Listing/" + listing_id + "/";
}

std::string ResolveAgainst(const std::string& base_url, const std::string& candidate) {
    if (candidate.empty()) return candidate;
    if (starts_with(candidate, "http://") || starts_with(candidate, "https://")) return candidate;
    if (starts_with(candidate, "//")) return std::string("https:") + candidate;

    auto scheme_host = get_scheme_host(base_url);
    if (scheme_host.empty()) return candidate; // fallback

    if (candidate[0] == '/') {
        return scheme_host + candidate;
    }

    auto base_dir = get_base_dir(base_url);
    if (base_dir.empty()) return candidate;
    return base_dir + candidate;
}

}
}
