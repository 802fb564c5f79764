#pragma once
#include <string>
#include <vector>

namespace Loopnet {

// Request headers a real browser sends, keyed by an impersonation identifier
// such as "chrome136".
struct BrowserProfile {
    std::string id;
    std::string user_agent;
    std::vector<std::string> headers; // "Name: value", User-Agent excluded
};

// Unknown identifiers resolve to the default Chrome profile.
const BrowserProfile& LookupBrowserProfile(const std::string& id);
bool IsKnownBrowserProfile(const std::string& id);

}
