#include "WidgetTransport.h"

namespace dmxusb {

WidgetTransport::WidgetTransport(SerialPort& port, const DeviceProfile& profile, DmxBuffer& dmx_buffer)
    : _port(port),
      _parser(profile, dmx_buffer),
      _builder(),
      _supervisor() {
        _tx_frame_buffer.fill(0);
      }

bool WidgetTransport::processInput(uint32_t now_ms) {
    while (_port.available() > 0) {
        int byte_read = _port.read();
        if (byte_read < 0) {
            // Port lied about availability; try again next poll.
            return false;
        }
        if (_parser.consume(static_cast<uint8_t>(byte_read), now_ms) ||
            _parser.getError() != protocol::FrameParser::Error::NONE) {
            return true;
        }
    }
    return false;
}

bool WidgetTransport::checkIdle(uint32_t now_ms) {
    return _supervisor.poll(_parser, now_ms);
}

bool WidgetTransport::sendFrame(uint8_t label, const uint8_t* payload, size_t length) {
    size_t frame_len = _builder.build(
        _tx_frame_buffer.data(),
        _tx_frame_buffer.size(),
        label,
        payload,
        length);

    if (frame_len == 0) {
        return false;
    }

    size_t written = _port.write(_tx_frame_buffer.data(), frame_len);
    _port.flush(); // Force physical transmission

    return written == frame_len;
}

void WidgetTransport::reset() {
    _parser.reset();
    _parser.clearError();
}

} // namespace dmxusb
