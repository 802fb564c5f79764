#include <catch2/catch_all.hpp>
#include <algorithm>
#include <thread>
#include <vector>
#include "utils/RateLimiter.hpp"
#include "cache/ResponseCache.hpp"
#include "core/ChallengeDetector.hpp"

using namespace Loopnet;
using namespace std::chrono_literals;

TEST_CASE("RateLimiter spaces consecutive dispatches") {
    RateLimiter rl(100ms);
    auto start = std::chrono::steady_clock::now();
    rl.WaitTurn(); // first turn is immediate
    CHECK(std::chrono::steady_clock::now() - start < 50ms);
    rl.WaitTurn();
    rl.WaitTurn();
    CHECK(std::chrono::steady_clock::now() - start >= 200ms);
}

TEST_CASE("RateLimiter spacing holds across threads") {
    RateLimiter rl(50ms);
    std::vector<std::chrono::steady_clock::time_point> stamps(4);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < stamps.size(); ++i) {
        threads.emplace_back([&rl, &stamps, i] {
            rl.WaitTurn();
            stamps[i] = std::chrono::steady_clock::now();
        });
    }
    for (auto& t : threads) t.join();
    std::sort(stamps.begin(), stamps.end());
    // Three gaps of at least 50ms, minus a little scheduling slack.
    CHECK(stamps.back() - stamps.front() >= 140ms);
}

TEST_CASE("RateLimiter with zero delay never waits") {
    RateLimiter rl(std::chrono::steady_clock::duration::zero());
    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 10; ++i) rl.WaitTurn();
    CHECK(std::chrono::steady_clock::now() - start < 50ms);
}

TEST_CASE("ResponseCache returns stored values until the TTL elapses") {
    ResponseCache cache(10, 100ms);
    cache.Set("http://a", "A");
    auto hit = cache.Get("http://a");
    REQUIRE(hit.has_value());
    CHECK(*hit == "A");

    std::this_thread::sleep_for(150ms);
    CHECK_FALSE(cache.Get("http://a").has_value());
    CHECK(cache.Size() == 0); // expired entry removed on read
}

TEST_CASE("ResponseCache evicts the earliest stored entry when full") {
    ResponseCache cache(2, 1h);
    cache.Set("http://a", "A");
    std::this_thread::sleep_for(2ms);
    cache.Set("http://b", "B");
    std::this_thread::sleep_for(2ms);
    cache.Set("http://c", "C"); // evicts A

    CHECK(cache.Size() == 2);
    CHECK_FALSE(cache.Get("http://a").has_value());
    CHECK(cache.Get("http://b") == std::optional<std::string>("B"));
    CHECK(cache.Get("http://c") == std::optional<std::string>("C"));
}

TEST_CASE("ResponseCache overwrite refreshes without evicting") {
    ResponseCache cache(2, 1h);
    cache.Set("http://a", "A");
    cache.Set("http://b", "B");
    cache.Set("http://a", "A2");

    CHECK(cache.Size() == 2);
    CHECK(cache.Get("http://a") == std::optional<std::string>("A2"));
    CHECK(cache.Get("http://b") == std::optional<std::string>("B"));

    // A is now the newest, so B goes first.
    cache.Set("http://c", "C");
    CHECK_FALSE(cache.Get("http://b").has_value());
    CHECK(cache.Get("http://a").has_value());
}

TEST_CASE("ResponseCache Clear empties the cache") {
    ResponseCache cache(5, 1h);
    cache.Set("http://a", "A");
    cache.Set("http://b", "B");
    cache.Clear();
    CHECK(cache.Size() == 0);
    CHECK_FALSE(cache.Get("http://a").has_value());
}

TEST_CASE("IsChallengePage recognises short interstitials") {
    CHECK(IsChallengePage("<html><div id=\"sec-if-cpt-container\"></div></html>"));
    CHECK(IsChallengePage("<div class=\"behavioral-content\">checking</div>"));
    CHECK(IsChallengePage("<img src=\"/akam/13/pixel_1234abcd\">"));
    CHECK_FALSE(IsChallengePage("<html><body>Office space for lease</body></html>"));
    CHECK_FALSE(IsChallengePage(""));
}

TEST_CASE("IsChallengePage ignores markers in large pages") {
    std::string page = "<html><div id=\"sec-if-cpt-container\"></div>";
    page += std::string(kChallengeMaxLength, 'x');
    CHECK_FALSE(IsChallengePage(page));

    std::string boundary = "sec-if-cpt-container";
    boundary.resize(kChallengeMaxLength - 1, ' ');
    CHECK(IsChallengePage(boundary));
    boundary.push_back(' ');
    CHECK_FALSE(IsChallengePage(boundary));
}

TEST_CASE("IsChallengePage measures length in characters") {
    std::string accented;
    for (int i = 0; i < 6000; ++i) accented += "\xC3\xA9"; // U+00E9, two bytes each
    const std::string page = "<div id=\"sec-if-cpt-container\"></div>" + accented;
    REQUIRE(page.size() > kChallengeMaxLength);
    CHECK(CharacterCount(page) < kChallengeMaxLength);
    CHECK(IsChallengePage(page));

    std::string boundary = "sec-if-cpt-container";
    while (CharacterCount(boundary) < kChallengeMaxLength - 1) boundary += "\xC3\xA9";
    CHECK(IsChallengePage(boundary));
    boundary += "\xC3\xA9";
    CHECK(CharacterCount(boundary) == kChallengeMaxLength);
    CHECK_FALSE(IsChallengePage(boundary));
}

TEST_CASE("CharacterCount counts code points") {
    CHECK(CharacterCount("") == 0);
    CHECK(CharacterCount("abc") == 3);
    CHECK(CharacterCount("caf\xC3\xA9") == 4);
    CHECK(CharacterCount("\xE2\x82\xAC" "1") == 2);      // euro sign
    CHECK(CharacterCount("\xF0\x9F\x8F\xA2") == 1);      // four-byte code point
}
