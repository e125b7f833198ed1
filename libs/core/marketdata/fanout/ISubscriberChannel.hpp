#pragma once
#include <string>

// One downstream listener as seen by FanoutHub.
class ISubscriberChannel {
public:
    virtual ~ISubscriberChannel() = default;

    /// Hand one serialized message to the listener. Must not block.
    /// False means the listener is gone or not keeping up and should be dropped.
    virtual bool deliver(const std::string& message) = 0;
};
