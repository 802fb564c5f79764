#pragma once
#include <string>

namespace Loopnet {

class IEscalationFetcher {
public:
    virtual ~IEscalationFetcher() = default;
    // Throws EscalationError when the page cannot be resolved.
    virtual std::string Fetch(const std::string& url) = 0;
    virtual void Close() = 0;
};

}
