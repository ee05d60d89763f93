/*
 * This file is part of the DMXUSB widget library.
 */
#ifndef IDLE_SUPERVISOR_H
#define IDLE_SUPERVISOR_H

#include <stdint.h>

#include "config/dmxusb_config.h"
#include "widget_frame.h"

namespace dmxusb {
namespace protocol {

/*
 * Bounds how long a half-received frame may block the link. A transport
 * glitch that loses bytes mid-frame would otherwise leave the parser waiting
 * for a length it will never see; after timeout_ms of silence the parser is
 * forced back to START with an empty DMX buffer.
 *
 * Elapsed time is computed with unsigned 32-bit arithmetic, so millis()
 * rollover is handled implicitly.
 */
class IdleSupervisor {
 public:
  static constexpr uint32_t kDefaultTimeoutMs = DMXUSB_IDLE_TIMEOUT_MS;

  explicit IdleSupervisor(uint32_t timeout_ms = kDefaultTimeoutMs)
      : _timeout_ms(timeout_ms) {}

  // Returns true if the parser was reset.
  bool poll(FrameParser& parser, uint32_t now_ms) const {
    if (parser.idle()) {
      return false;
    }
    const uint32_t elapsed = now_ms - parser.lastByteMillis();
    if (elapsed <= _timeout_ms) {
      return false;
    }
    parser.abort();
    return true;
  }

  uint32_t timeoutMs() const { return _timeout_ms; }

 private:
  uint32_t _timeout_ms;
};

}  // namespace protocol
}  // namespace dmxusb

#endif  // IDLE_SUPERVISOR_H
