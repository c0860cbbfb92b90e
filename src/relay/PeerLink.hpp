#pragma once

#include <memory>
#include <string>

namespace signalrelay::relay {

using Frame = std::shared_ptr<const std::string>;

// Outbound side of one relay participant.
// deliver() must not block and must not throw for an ordinary dead peer:
// it queues the frame and reports write failures through the transport's
// own close path.
class PeerLink {
public:
    virtual ~PeerLink() = default;

    virtual void deliver(Frame frame) = 0;
};

inline Frame make_frame(std::string text) {
    return std::make_shared<const std::string>(std::move(text));
}

} // namespace signalrelay::relay
