/*
 * This file is part of the DMXUSB widget library.
 */
#include "widget_frame.h"

#include <string.h>

namespace dmxusb {
namespace protocol {

// --- FrameParser ---

FrameParser::FrameParser(const DeviceProfile& profile, DmxBuffer& dmx_buffer)
    : _profile(profile),
      _dmx_buffer(dmx_buffer),
      _state(State::START),
      _last_error(Error::NONE),
      _frame{},
      _bytes_remaining(0),
      _payload_index(0),
      _pending_is_dmx(false),
      _last_byte_ms(0),
      _skipped_bytes(0),
      _discarded_frames(0) {
  reset();
}

void FrameParser::_resetPending() {
  _state = State::START;
  _frame.header.label = 0;
  _frame.header.payload_length = 0;
  _bytes_remaining = 0;
  _payload_index = 0;
  _pending_is_dmx = false;
}

void FrameParser::reset() {
  _resetPending();
  _dmx_buffer.clear();
}

void FrameParser::abort() {
  reset();
  _last_error = Error::IDLE_TIMEOUT;
}

bool FrameParser::consume(uint8_t byte, uint32_t now_ms) {
  _last_byte_ms = now_ms;

  switch (_state) {
    case State::START:
      if (byte == START_MARK) {
        _state = State::LABEL;
      } else {
        // Noise between frames; the next start mark resynchronizes.
        ++_skipped_bytes;
      }
      return false;

    case State::LABEL:
      _frame.header.label = byte;
      _pending_is_dmx = _profile.isDmxLabel(byte);
      if (_pending_is_dmx) {
        _dmx_buffer.clear();
      }
      _state = State::LENGTH_LOW;
      return false;

    case State::LENGTH_LOW:
      _frame.header.payload_length = byte;
      _state = State::LENGTH_HIGH;
      return false;

    case State::LENGTH_HIGH:
      _frame.header.payload_length |= static_cast<uint16_t>(byte) << 8;
      _bytes_remaining = _frame.header.payload_length;
      _payload_index = 0;
      _state = (_bytes_remaining > 0) ? State::DATA : State::END;
      return false;

    case State::DATA:
      if (_payload_index < MAX_PAYLOAD_SIZE) {
        _frame.payload[_payload_index] = byte;
      }
      if (_payload_index < 0xFFFF) {
        ++_payload_index;
      }
      if (_pending_is_dmx) {
        (void)_dmx_buffer.push(byte);
      }
      if (--_bytes_remaining == 0) {
        _state = State::END;
      }
      return false;

    case State::END: {
      const bool oversize = _frame.header.payload_length > MAX_PAYLOAD_SIZE;
      const bool complete = (byte == END_MARK) && !oversize;
      if (complete) {
        // Keep label/length/payload readable until the next byte arrives.
        _state = State::START;
        _bytes_remaining = 0;
        _payload_index = 0;
        _pending_is_dmx = false;
        return true;
      }
      _last_error = oversize ? Error::OVERSIZE : Error::MISSING_END_MARK;
      ++_discarded_frames;
      reset();
      return false;
    }
  }

  // Unreachable with a valid State; recover instead of trusting memory.
  reset();
  return false;
}

// --- FrameBuilder ---

FrameBuilder::FrameBuilder() {}

size_t FrameBuilder::build(uint8_t* buffer,
                           size_t buffer_size,
                           uint8_t label,
                           const uint8_t* payload,
                           size_t payload_len) {
  if (buffer == nullptr || payload_len > MAX_PAYLOAD_SIZE ||
      (payload_len > 0 && payload == nullptr)) {
    return 0;
  }

  const size_t total_len = FRAME_HEADER_SIZE + payload_len + FRAME_TRAILER_SIZE;
  if (total_len > buffer_size) {
    return 0;  // Buffer overflow protection
  }

  uint8_t* p = buffer;
  *p++ = START_MARK;
  *p++ = label;
  write_u16_le(p, static_cast<uint16_t>(payload_len));
  p += 2;

  if (payload_len > 0) {
    memcpy(p, payload, payload_len);
    p += payload_len;
  }

  *p = END_MARK;

  return total_len;
}

const char* frameErrorName(FrameParser::Error error) {
  switch (error) {
    case FrameParser::Error::NONE:
      return "none";
    case FrameParser::Error::MISSING_END_MARK:
      return "missing_end_mark";
    case FrameParser::Error::OVERSIZE:
      return "oversize";
    case FrameParser::Error::IDLE_TIMEOUT:
      return "idle_timeout";
  }
  return "unknown";
}

}  // namespace protocol
}  // namespace dmxusb
