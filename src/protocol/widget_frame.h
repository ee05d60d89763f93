/*
 * This file is part of the DMXUSB widget library.
 */
#ifndef WIDGET_FRAME_H
#define WIDGET_FRAME_H

#include <stddef.h>
#include <stdint.h>

#include <etl/array.h>
#include <etl/span.h>

#include "device/DeviceProfile.h"
#include "dmx_buffer.h"
#include "widget_protocol.h"

namespace dmxusb {
namespace protocol {

struct FrameHeader {
  uint8_t label;
  uint16_t payload_length;
};

// A completed frame. Only the first MAX_PAYLOAD_SIZE bytes of a payload are
// ever kept; longer frames are discarded before they reach this struct.
struct Frame {
  FrameHeader header;
  etl::array<uint8_t, MAX_PAYLOAD_SIZE> payload;

  etl::span<const uint8_t> payloadView() const {
    return etl::span<const uint8_t>(payload.data(), header.payload_length);
  }
};

class FrameParser {
 public:
  enum class State : uint8_t {
    START,
    LABEL,
    LENGTH_LOW,
    LENGTH_HIGH,
    DATA,
    END
  };

  enum class Error : uint8_t {
    NONE,
    MISSING_END_MARK,
    OVERSIZE,
    IDLE_TIMEOUT
  };

  // The profile decides which labels stream into dmx_buffer. Both must
  // outlive the parser.
  FrameParser(const DeviceProfile& profile, DmxBuffer& dmx_buffer);

  // Consumes a byte received at now_ms. Returns true when it completes a
  // well-formed frame, which is then available from frame() until the next
  // call.
  bool consume(uint8_t byte, uint32_t now_ms);

  // Drops the pending frame, zero-fills the DMX buffer and returns to START.
  void reset();

  // Forced reset after a mid-frame stall; records IDLE_TIMEOUT.
  void abort();

  State state() const { return _state; }
  bool idle() const { return _state == State::START; }
  uint32_t lastByteMillis() const { return _last_byte_ms; }
  const Frame& frame() const { return _frame; }
  bool pendingIsDmx() const { return _pending_is_dmx; }

  Error getError() const { return _last_error; }
  void clearError() { _last_error = Error::NONE; }

  // Bytes dropped while waiting for a start mark.
  uint32_t skippedBytes() const { return _skipped_bytes; }
  // Frames dropped at END (missing end mark or oversize).
  uint32_t discardedFrames() const { return _discarded_frames; }
  void resetCounters() {
    _skipped_bytes = 0;
    _discarded_frames = 0;
  }

 private:
  void _resetPending();

  const DeviceProfile& _profile;
  DmxBuffer& _dmx_buffer;

  State _state;
  Error _last_error;
  Frame _frame;
  uint16_t _bytes_remaining;
  uint16_t _payload_index;
  bool _pending_is_dmx;
  uint32_t _last_byte_ms;
  uint32_t _skipped_bytes;
  uint32_t _discarded_frames;
};

class FrameBuilder {
 public:
  FrameBuilder();
  // Builds a framed message into buffer. Returns the frame length, or 0 if
  // the payload exceeds MAX_PAYLOAD_SIZE or the frame does not fit.
  size_t build(uint8_t* buffer, size_t buffer_size, uint8_t label,
               const uint8_t* payload, size_t payload_len);
};

const char* frameErrorName(FrameParser::Error error);

}  // namespace protocol
}  // namespace dmxusb

#endif  // WIDGET_FRAME_H
