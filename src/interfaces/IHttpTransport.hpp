#pragma once
#include <string>

namespace Loopnet {

struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::string effective_url;
    std::string error; // Non-empty on a transport-level fault (no HTTP status)
};

class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    virtual HttpResponse Get(const std::string& url) = 0;
    virtual void Close() = 0;
};

}
