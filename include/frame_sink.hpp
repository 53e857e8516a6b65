#pragma once

#include <cstdint>
#include <string>

namespace edgegate {

// Outbound side of a WebSocket connection as seen by the gateway logic.
// WebSocketSession implements it over Beast; tests use an in-memory sink.
class FrameSink {
public:
    virtual ~FrameSink() = default;

    // Queues a text frame. Returns false when the connection can no longer send.
    virtual bool send_text(const std::string& frame) = 0;

    // Starts a close handshake with the given code. Safe to call more than once.
    virtual void close(uint16_t code, const std::string& reason) = 0;

    virtual bool is_open() const = 0;
};

}
