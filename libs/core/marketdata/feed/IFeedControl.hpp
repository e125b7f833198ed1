#pragma once

// Lifecycle seam between FanoutHub and the upstream connection.
// Both calls are non-blocking requests; ordering between them is preserved.
class IFeedControl {
public:
    virtual ~IFeedControl() = default;
    virtual void start() = 0;
    virtual void stop() = 0;
};
