#pragma once

namespace Loopnet {

class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;
    // Blocks until the caller may dispatch its request.
    virtual void WaitTurn() = 0;
};

}
