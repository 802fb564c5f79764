#include <catch2/catch_all.hpp>
#include "utils/UrlUtil.hpp"

using namespace Loopnet;

TEST_CASE("ResolveAgainst handles protocol and relative URLs") {
    using UrlUtil::ResolveAgainst;

    std::string base = "https://www.loopnet.com/search/office/houston-tx/for-sale/";
    CHECK(ResolveAgainst(base, "https://images1.loopnet.com/a.jpg") == "https://images1.loopnet.com/a.jpg");
    CHECK(ResolveAgainst(base, "//images1.loopnet.com/a.jpg") == "https://images1.loopnet.com/a.jpg");
    CHECK(ResolveAgainst(base, "/Listing/101-Main-St/123/") == "https://www.loopnet.com/Listing/101-Main-St/123/");
    CHECK(ResolveAgainst(base, "2/") == "https://www.loopnet.com/search/office/houston-tx/for-sale/2/");
    CHECK(ResolveAgainst("https://www.loopnet.com", "Listing/1/").rfind("https://www.loopnet.com/", 0) == 0);
    CHECK(ResolveAgainst("not a url", "/x") == "/x");
}

TEST_CASE("NormalizeLocation produces URL slugs") {
    using UrlUtil::NormalizeLocation;
    CHECK(NormalizeLocation("Houston, TX") == "houston-tx");
    CHECK(NormalizeLocation("New York, NY") == "new-york-ny");
    CHECK(NormalizeLocation("77001") == "77001");
    CHECK(NormalizeLocation("  St. Louis ,  MO  ") == "st-louis-mo");
    CHECK(NormalizeLocation("Winston--Salem") == "winston-salem");
}

TEST_CASE("BuildSearchUrl maps property types and pages") {
    using UrlUtil::BuildSearchUrl;
    const std::string base = "https://www.loopnet.com";

    CHECK(BuildSearchUrl(base, "Houston, TX") ==
          "https://www.loopnet.com/search/commercial-real-estate/houston-tx/for-sale/");
    CHECK(BuildSearchUrl(base, "Houston, TX", "office") ==
          "https://www.loopnet.com/search/office/houston-tx/for-sale/");
    CHECK(BuildSearchUrl(base, "Austin, TX", "multifamily", "for-lease") ==
          "https://www.loopnet.com/search/apartment-buildings/austin-tx/for-lease/");
    CHECK(BuildSearchUrl(base, "Austin, TX", "health-care", "for-sale", 3) ==
          "https://www.loopnet.com/search/health-care-facilities/austin-tx/for-sale/3/");
    CHECK(BuildSearchUrl(base, "Austin, TX", "warehouse", "for-sale", 1) ==
          "https://www.loopnet.com/search/commercial-real-estate/austin-tx/for-sale/");
}

TEST_CASE("ExtractListingId reads the trailing id segment") {
    using UrlUtil::ExtractListingId;
    CHECK(ExtractListingId("https://www.loopnet.com/Listing/1435-River-Ave-Camden-NJ/31948105/") ==
          std::optional<std::string>("31948105"));
    CHECK(ExtractListingId("https://www.loopnet.com/property/4820-mims-ave-laredo-tx-78041/48479-210176") ==
          std::optional<std::string>("48479-210176"));
    CHECK_FALSE(ExtractListingId("https://www.loopnet.com/search/office/houston-tx/for-sale/").has_value());
}

TEST_CASE("BuildDetailUrl formats listing links") {
    CHECK(UrlUtil::BuildDetailUrl("https://www.loopnet.com", "31948105") ==
          "https://www.loopnet.com/Listing/31948105/");
}
