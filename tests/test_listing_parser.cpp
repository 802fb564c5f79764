#include <catch2/catch_all.hpp>
#include <vector>
#include "cache/ResponseCache.hpp"
#include "core/FetchOrchestrator.hpp"
#include "core/ListingService.hpp"
#include "parser/ListingParser.hpp"

using namespace Loopnet;

namespace {

const char* kSearchPage = R"(
<html><body>
<div class="search-header"><span class="total-results-digits">1,234 Results</span></div>
<article class="placard tier-1">
  <header>
    <h4><a href="/Listing/101-Main-St-Houston-TX/31948105/">  101   Main
        Street </a></h4>
    <a class="subtitle-beta" href="#">101 Main St, Houston, TX 77002</a>
  </header>
  <div class="slide"><img src="https://images1.loopnet.com/i2/1.jpg"></div>
  <ul class="data-points-2c">
    <li name="Price">$2,800,000</li>
    <li>25,000 SF Office Building</li>
    <li>6.5% Cap Rate</li>
  </ul>
  <div company-logo-carousel><img alt="Acme Realty" src="/logo.png"></div>
</article>
<article class="placard">
  <header><h4><a>Missing link</a></h4></header>
</article>
<article class="placard">
  <header>
    <h4><a href="https://www.loopnet.com/Listing/Katy-Land/555/">Katy Land</a></h4>
    <a class="subtitle-beta">Katy, TX</a>
  </header>
  <ul class="data-points-2c">
    <li name="Price">Upon Request</li>
    <li>Retail</li>
  </ul>
</article>
<a data-automation-id="NextPage" href="/search/office/houston-tx/for-sale/2/">Next</a>
</body></html>
)";

const char* kDetailPage = R"(
<html><body>
<div class="profile-hero-main-title"><span class="profile-hero__segment"> Riverside Plaza </span></div>
<div class="profile-hero-sub-title">
  <span class="profile-hero__segment">$4,500,000 ($180/SF)</span>
  <span class="profile-hero__segment">1435 River Ave, Camden, NJ 08103</span>
  <span class="profile-hero__segment">7.25% Cap Rate</span>
</div>
<table class="property-data">
  <tr class="feature-grid__row"><td class="feature-grid__title">Building Size</td><td class="feature-grid__data">25,000 SF</td></tr>
  <tr class="feature-grid__row"><td class="feature-grid__title">Stories</td><td class="feature-grid__data">3 Floors</td></tr>
  <tr class="feature-grid__row"><td class="feature-grid__title">Year Built</td><td class="feature-grid__data">1998</td></tr>
</table>
<table class="facts">
  <tr><td class="feature-grid__data" data-fact-type="Units">12 Units</td></tr>
  <tr><td class="feature-grid__data" data-fact-type="Zoning">C-2</td></tr>
  <tr><td class="feature-grid__data" data-fact-type="PropertyType">Office</td></tr>
</table>
<div class="highlights-wrap"><ul class="bulleted-list"><li> Corner lot </li><li>Renovated 2020</li></ul></div>
<section class="description"><div class="sales-notes-text">  Great building near the river. </div></section>
<div id="mosaic-profile">
  <div class="mosaic-tile"><img src="https://images1.loopnet.com/a.jpg"></div>
  <div class="mosaic-tile"><img src="https://images1.loopnet.com/b.jpg"></div>
</div>
<div class="mosaic-carousel"><img src="https://images1.loopnet.com/a.jpg"><img src="https://images1.loopnet.com/c.jpg"></div>
<ul class="contacts">
  <li class="contact">
    <div class="contact-name"><span class="first-name">Jane</span> <span class="last-name">Doe</span></div>
    <span class="company-name">Acme Realty</span>
  </li>
</ul>
<a id="broker-phone-number" href="tel:5551234567">(555) 123-4567</a>
</body></html>
)";

class CannedTransport : public IHttpTransport {
public:
    explicit CannedTransport(std::string body) : body_(std::move(body)) {}
    HttpResponse Get(const std::string& url) override {
        urls.push_back(url);
        HttpResponse r;
        r.status_code = 200;
        r.body = body_;
        return r;
    }
    void Close() override {}
    std::vector<std::string> urls;
private:
    std::string body_;
};

class NoEscalation : public IEscalationFetcher {
public:
    std::string Fetch(const std::string&) override { return ""; }
    void Close() override {}
};

class NoRateLimit : public IRateLimiter {
public:
    void WaitTurn() override {}
};

Config QuietConfig() {
    Config config;
    config.warmup_enabled = false;
    return config;
}

} // namespace

TEST_CASE("ParseAddress splits street, city, state and zip") {
    Address full = ListingParser::ParseAddress("101 Main St, Houston, TX 77002");
    CHECK(full.address == "101 Main St");
    CHECK(full.city == "Houston");
    CHECK(full.state == "TX");
    CHECK(full.zip_code == std::optional<std::string>("77002"));

    Address city_only = ListingParser::ParseAddress("Dallas, tx");
    CHECK(city_only.address == "Dallas");
    CHECK(city_only.city == "Dallas");
    CHECK(city_only.state == "TX");
    CHECK_FALSE(city_only.zip_code.has_value());

    Address bare = ListingParser::ParseAddress("Downtown Houston");
    CHECK(bare.address == "Downtown Houston");
    CHECK(bare.city.empty());
    CHECK(bare.state.empty());
}

TEST_CASE("ParseSearchResults extracts placards") {
    auto results = ListingParser::ParseSearchResults(kSearchPage, "https://www.loopnet.com");
    REQUIRE(results.size() == 2);

    const auto& first = results[0];
    CHECK(first.name == "101 Main Street");
    CHECK(first.url == "https://www.loopnet.com/Listing/101-Main-St-Houston-TX/31948105/");
    CHECK(first.address == "101 Main St");
    CHECK(first.city == "Houston");
    CHECK(first.state == "TX");
    CHECK(first.zip_code == std::optional<std::string>("77002"));
    CHECK(first.price == std::optional<std::string>("$2,800,000"));
    CHECK(first.size_sqft == std::optional<std::string>("25,000 SF Office Building"));
    CHECK(first.image_url == std::optional<std::string>("https://images1.loopnet.com/i2/1.jpg"));
    CHECK(first.broker_company == std::optional<std::string>("Acme Realty"));

    const auto& second = results[1];
    CHECK(second.name == "Katy Land");
    CHECK(second.url == "https://www.loopnet.com/Listing/Katy-Land/555/");
    CHECK(second.city == "Katy");
    CHECK_FALSE(second.price.has_value());
    CHECK(second.property_type == std::optional<std::string>("Retail"));
    CHECK_FALSE(second.image_url.has_value());
}

TEST_CASE("Search page metadata") {
    CHECK(ListingParser::ParseTotalResults(kSearchPage) == std::optional<int>(1234));
    CHECK(ListingParser::HasNextPage(kSearchPage));

    const char* empty = "<html><body><p>No results</p></body></html>";
    CHECK_FALSE(ListingParser::ParseTotalResults(empty).has_value());
    CHECK_FALSE(ListingParser::HasNextPage(empty));
    CHECK(ListingParser::ParseSearchResults(empty, "https://www.loopnet.com").empty());
}

TEST_CASE("ParsePropertyDetail reads the listing page") {
    const std::string url = "https://www.loopnet.com/Listing/1435-River-Ave-Camden-NJ/31948105/";
    PropertyDetail d = ListingParser::ParsePropertyDetail(kDetailPage, url);

    CHECK(d.url == url);
    CHECK(d.name == "Riverside Plaza");
    CHECK(d.address == "1435 River Ave");
    CHECK(d.city == "Camden");
    CHECK(d.state == "NJ");
    CHECK(d.zip_code == std::optional<std::string>("08103"));
    CHECK(d.price == std::optional<std::string>("$4,500,000"));
    CHECK(d.size_sqft == std::optional<std::string>("25,000 SF"));
    CHECK(d.year_built == std::optional<std::string>("1998"));
    CHECK(d.stories == std::optional<int>(3));
    CHECK(d.units == std::optional<int>(12));
    CHECK(d.zoning == std::optional<std::string>("C-2"));
    CHECK(d.property_type == std::optional<std::string>("Office"));
    CHECK(d.cap_rate == std::optional<std::string>("7.25% Cap Rate"));
    CHECK(d.highlights == std::vector<std::string>{"Corner lot", "Renovated 2020"});
    CHECK(d.description == std::optional<std::string>("Great building near the river."));
    CHECK(d.images == std::vector<std::string>{"https://images1.loopnet.com/a.jpg",
                                               "https://images1.loopnet.com/b.jpg",
                                               "https://images1.loopnet.com/c.jpg"});
    CHECK(d.broker_name == std::optional<std::string>("Jane Doe"));
    CHECK(d.broker_company == std::optional<std::string>("Acme Realty"));
    CHECK(d.broker_phone == std::optional<std::string>("(555) 123-4567"));
}

TEST_CASE("ParsePropertyDetail tolerates a bare page") {
    PropertyDetail d = ListingParser::ParsePropertyDetail("<html><body></body></html>", "https://www.loopnet.com/Listing/1/");
    CHECK(d.name == "Unknown");
    CHECK(d.address.empty());
    CHECK_FALSE(d.price.has_value());
    CHECK(d.highlights.empty());
    CHECK(d.images.empty());
}

TEST_CASE("PropertySummary serializes absent fields as null") {
    PropertySummary p;
    p.name = "Lot";
    p.url = "https://www.loopnet.com/Listing/1/";
    nlohmann::json j = p;
    CHECK(j["name"] == "Lot");
    CHECK(j["price"].is_null());
    CHECK(j["zip_code"].is_null());
}

TEST_CASE("ListingService search builds the URL and fills query fields") {
    CannedTransport transport(kSearchPage);
    NoEscalation escalation;
    ResponseCache cache(10, std::chrono::hours(1));
    NoRateLimit limiter;
    FetchOrchestrator orchestrator(QuietConfig(), transport, escalation, cache, limiter);
    ListingService service(orchestrator, "https://www.loopnet.com");

    SearchResult result = service.Search("Houston, TX", "office", "for-sale", 1);
    REQUIRE(transport.urls.size() == 1);
    CHECK(transport.urls[0] == "https://www.loopnet.com/search/office/houston-tx/for-sale/");
    CHECK(result.query_location == "Houston, TX");
    CHECK(result.query_property_type == std::optional<std::string>("office"));
    CHECK(result.total_results == std::optional<int>(1234));
    CHECK(result.has_next_page);
    REQUIRE(result.properties.size() == 2);
    CHECK(result.properties[0].listing_type == std::optional<std::string>("for-sale"));
}

TEST_CASE("ListingService detail accepts a bare listing id") {
    CannedTransport transport(kDetailPage);
    NoEscalation escalation;
    ResponseCache cache(10, std::chrono::hours(1));
    NoRateLimit limiter;
    FetchOrchestrator orchestrator(QuietConfig(), transport, escalation, cache, limiter);
    ListingService service(orchestrator, "https://www.loopnet.com");

    PropertyDetail d = service.Detail("31948105");
    REQUIRE(transport.urls.size() == 1);
    CHECK(transport.urls[0] == "https://www.loopnet.com/Listing/31948105/");
    CHECK(d.url == "https://www.loopnet.com/Listing/31948105/");
    CHECK(d.name == "Riverside Plaza");
}
