#ifndef DMXUSB_SERIAL_PORT_H
#define DMXUSB_SERIAL_PORT_H

#include <stddef.h>
#include <stdint.h>

namespace dmxusb {

// Duplex byte channel the widget talks over. Mirrors the subset of Arduino's
// Stream the protocol needs, so the core builds without the Arduino core.
class SerialPort {
 public:
  virtual ~SerialPort() {}

  // Bytes that can be read without blocking.
  virtual int available() = 0;

  // Next byte, or -1 if none. Only called after available() > 0.
  virtual int read() = 0;

  // Returns the number of bytes accepted.
  virtual size_t write(const uint8_t* buffer, size_t size) = 0;

  virtual void flush() {}
};

}  // namespace dmxusb

#endif  // DMXUSB_SERIAL_PORT_H
