#include "BrowserProfile.hpp"
#include <map>

namespace Loopnet {

namespace {

const char* kDefaultProfile = "chrome136";

std::vector<std::string> ChromiumHeaders(const std::string& brand, const std::string& major) {
    return {
        "sec-ch-ua: \"" + brand + "\";v=\"" + major + "\", \"Chromium\";v=\"" + major + "\", \"Not.A/Brand\";v=\"99\"",
        "sec-ch-ua-mobile: ?0",
        "sec-ch-ua-platform: \"Windows\"",
        "Upgrade-Insecure-Requests: 1",
        "Accept: text/html,application/xhtml+xml,application/xml;q=0.9,image/avif,image/webp,image/apng,*/*;q=0.8,application/signed-exchange;v=b3;q=0.7",
        "Sec-Fetch-Site: none",
        "Sec-Fetch-Mode: navigate",
        "Sec-Fetch-User: ?1",
        "Sec-Fetch-Dest: document",
        "Accept-Language: en-US,en;q=0.9",
        "Priority: u=0, i",
    };
}

BrowserProfile Chrome(const std::string& id, const std::string& major) {
    return {id,
            "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/" + major + ".0.0.0 Safari/537.36",
            ChromiumHeaders("Google Chrome", major)};
}

const std::map<std::string, BrowserProfile>& Profiles() {
    static const std::map<std::string, BrowserProfile> profiles = [] {
        std::map<std::string, BrowserProfile> m;
        m["chrome136"] = Chrome("chrome136", "136");
        m["chrome131"] = Chrome("chrome131", "131");
        m["chrome124"] = Chrome("chrome124", "124");
        m["edge101"] = {"edge101",
            "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/101.0.4951.64 Safari/537.36 Edg/101.0.1210.47",
            ChromiumHeaders("Microsoft Edge", "101")};
        m["safari17_0"] = {"safari17_0",
            "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/605.1.15 (KHTML, like Gecko) Version/17.0 Safari/605.1.15",
            {
                "Accept: text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8",
                "Sec-Fetch-Site: none",
                "Sec-Fetch-Mode: navigate",
                "Sec-Fetch-Dest: document",
                "Accept-Language: en-US,en;q=0.9",
            }};
        m["firefox133"] = {"firefox133",
            "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:133.0) Gecko/20100101 Firefox/133.0",
            {
                "Accept: text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8",
                "Accept-Language: en-US,en;q=0.5",
                "Upgrade-Insecure-Requests: 1",
                "Sec-Fetch-Dest: document",
                "Sec-Fetch-Mode: navigate",
                "Sec-Fetch-Site: none",
                "Sec-Fetch-User: ?1",
                "Priority: u=0, i",
                "TE: trailers",
            }};
        return m;
    }();
    return profiles;
}

} // anonymous namespace

bool IsKnownBrowserProfile(const std::string& id) {
    return Profiles().count(id) > 0;
}

const BrowserProfile& LookupBrowserProfile(const std::string& id) {
    const auto& profiles = Profiles();
    auto it = profiles.find(id);
    if (it != profiles.end()) return it->second;
    return profiles.at(kDefaultProfile);
}

}
