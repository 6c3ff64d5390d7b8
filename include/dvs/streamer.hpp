#pragma once

#include <cstdint>
#include <string>

namespace durin::dvs {

// Something that can push the event-camera stream to host:port.
class Streamer {
public:
    virtual ~Streamer() = default;

    virtual void startStream(const std::string& host, uint16_t port) = 0;
    // Must be safe to call when nothing is streaming.
    virtual void stopStream() = 0;
};

class NullStreamer : public Streamer {
public:
    void startStream(const std::string& host, uint16_t port) override {
        (void)host;
        (void)port;
    }
    void stopStream() override {}
};

}  // namespace durin::dvs
