#pragma once
#include <memory>
#include <string>

namespace Loopnet {

// One open tab. Destroying it closes the tab.
class IBrowserPage {
public:
    virtual ~IBrowserPage() = default;
    virtual std::string Content() = 0;
};

class IBrowserSession {
public:
    virtual ~IBrowserSession() = default;
    // Opens a new tab and starts navigating to url.
    virtual std::unique_ptr<IBrowserPage> Open(const std::string& url) = 0;
    virtual void Stop() = 0;
};

}
