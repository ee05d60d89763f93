/*
 * This file is part of the DMXUSB widget library.
 */
#ifndef WIDGET_PROTOCOL_H
#define WIDGET_PROTOCOL_H

#include <stddef.h>
#include <stdint.h>

namespace dmxusb {
namespace protocol {

// --- Endianness-safe helpers for Little Endian (widget byte order) ---

// Reads a uint16_t from a Little Endian buffer.
inline uint16_t read_u16_le(const uint8_t* buffer) {
  return static_cast<uint16_t>(buffer[0] | (static_cast<uint16_t>(buffer[1]) << 8));
}

// Writes a uint16_t to a Little Endian buffer.
inline void write_u16_le(uint8_t* buffer, uint16_t value) {
  buffer[0] = value & 0xFF;
  buffer[1] = (value >> 8) & 0xFF;
}

inline void write_u32_le(uint8_t* buffer, uint32_t value) {
  buffer[0] = value & 0xFF;
  buffer[1] = (value >> 8) & 0xFF;
  buffer[2] = (value >> 16) & 0xFF;
  buffer[3] = (value >> 24) & 0xFF;
}

constexpr uint8_t START_MARK = 0x7E;
constexpr uint8_t END_MARK = 0xE7;

// Start mark + label + 2 length bytes.
constexpr size_t FRAME_HEADER_SIZE = 4;
constexpr size_t FRAME_TRAILER_SIZE = 1;
constexpr size_t MAX_PAYLOAD_SIZE = 600;
constexpr size_t MAX_FRAME_SIZE =
    FRAME_HEADER_SIZE + MAX_PAYLOAD_SIZE + FRAME_TRAILER_SIZE;

constexpr size_t DMX_CHANNEL_COUNT = 512;

enum class Label : uint8_t {
  WIDGET_PARAMETER_REQUEST = 3,
  DMX_DATA = 6,
  SERIAL_NUMBER_REQUEST = 10,
  WIDGET_PARAMETER_EXTENDED_REQUEST = 53,
  ESTA_ID_REQUEST = 77,
  DEVICE_ID_REQUEST = 78,
  // First label of the per-universe family: universe N uses BASE + N.
  DMX_DATA_UNIVERSE_BASE = 100
};

constexpr uint8_t to_underlying(Label label) {
  return static_cast<uint8_t>(label);
}

// Labels 100..255 leave room for 156 universes.
constexpr uint16_t MAX_UNIVERSES_OUT =
    256U - to_underlying(Label::DMX_DATA_UNIVERSE_BASE);

// Manufacturer name carried by the ESTA id reply for every profile.
constexpr char MANUFACTURER_NAME[] = "DMXUSB";
constexpr size_t MANUFACTURER_NAME_LENGTH = sizeof(MANUFACTURER_NAME) - 1;

constexpr size_t SERIAL_NUMBER_SIZE = 4;
constexpr size_t WIDGET_PARAMETER_SIZE = 5;
constexpr size_t WIDGET_PARAMETER_EXTENDED_SIZE = 2;

}  // namespace protocol
}  // namespace dmxusb

#endif  // WIDGET_PROTOCOL_H
