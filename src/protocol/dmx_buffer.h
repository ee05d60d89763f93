/*
 * This file is part of the DMXUSB widget library.
 */
#ifndef DMX_BUFFER_H
#define DMX_BUFFER_H

#include <stddef.h>
#include <stdint.h>

#include <etl/array.h>

#include "widget_protocol.h"

namespace dmxusb {

/*
 * Channel values of one DMX universe plus the write cursor of the frame
 * currently streaming into it.
 *
 * The cursor counts DMX payload positions: position 0 carries the start code
 * and is never stored, position N (1..512) lands in slot N-1. Positions past
 * the last slot advance the cursor but are dropped.
 */
class DmxBuffer {
 public:
  static constexpr size_t kSlots = protocol::DMX_CHANNEL_COUNT;

  DmxBuffer() : _write_index(0) { _slots.fill(0); }

  // Zero-fills every slot and rewinds the cursor to the start code.
  void clear() {
    _slots.fill(0);
    _write_index = 0;
  }

  // Returns true if the byte was stored in a channel slot.
  bool push(uint8_t value) {
    const uint16_t index = _write_index;
    if (_write_index < 0xFFFF) {
      ++_write_index;
    }
    if (index == 0 || index > kSlots) {
      return false;
    }
    _slots[index - 1] = value;
    return true;
  }

  // 1-based channel accessor; out of range channels read as 0.
  uint8_t channel(uint16_t channel_number) const {
    if (channel_number == 0 || channel_number > kSlots) {
      return 0;
    }
    return _slots[channel_number - 1];
  }

  uint8_t operator[](size_t index) const { return _slots[index]; }

  const uint8_t* data() const { return _slots.data(); }
  size_t size() const { return kSlots; }
  uint16_t writeIndex() const { return _write_index; }

 private:
  etl::array<uint8_t, kSlots> _slots;
  uint16_t _write_index;
};

}  // namespace dmxusb

#endif  // DMX_BUFFER_H
