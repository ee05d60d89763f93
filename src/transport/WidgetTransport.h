#ifndef WIDGET_TRANSPORT_H
#define WIDGET_TRANSPORT_H

#include <stddef.h>
#include <stdint.h>

#include <etl/array.h>

#include "device/DeviceProfile.h"
#include "protocol/dmx_buffer.h"
#include "protocol/idle_supervisor.h"
#include "protocol/widget_frame.h"
#include "SerialPort.h"

namespace dmxusb {

class WidgetTransport {
public:
    WidgetTransport(SerialPort& port, const DeviceProfile& profile, DmxBuffer& dmx_buffer);

    // Drains the port until a frame completes or is discarded (returns true)
    // or no bytes are left (returns false). A discarded frame shows up in
    // getLastError(); the caller clears it before the next call. Otherwise
    // the completed frame is in rxFrame(). Never blocks.
    bool processInput(uint32_t now_ms);

    // Resets a stalled parser. Returns true if it did.
    bool checkIdle(uint32_t now_ms);

    // Encodes and writes a frame. Returns false if the payload is too large
    // or the port accepted fewer bytes than the frame.
    bool sendFrame(uint8_t label, const uint8_t* payload, size_t length);

    const protocol::Frame& rxFrame() const { return _parser.frame(); }

    protocol::FrameParser::Error getLastError() const { return _parser.getError(); }
    void clearError() { _parser.clearError(); }
    uint32_t skippedBytes() const { return _parser.skippedBytes(); }
    uint32_t discardedFrames() const { return _parser.discardedFrames(); }
    void resetCounters() { _parser.resetCounters(); }
    protocol::FrameParser::State parserState() const { return _parser.state(); }

    void flush() { _port.flush(); }

    // Resets the parser (and with it the DMX buffer).
    void reset();

private:
    SerialPort& _port;
    protocol::FrameParser _parser;
    protocol::FrameBuilder _builder;
    protocol::IdleSupervisor _supervisor;

    etl::array<uint8_t, protocol::MAX_FRAME_SIZE> _tx_frame_buffer;
};

} // namespace dmxusb

#endif // WIDGET_TRANSPORT_H
