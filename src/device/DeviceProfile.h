/*
 * This file is part of the DMXUSB widget library.
 */
#ifndef DEVICE_PROFILE_H
#define DEVICE_PROFILE_H

#include <stddef.h>
#include <stdint.h>

#include <etl/string_view.h>

#include "protocol/widget_protocol.h"

namespace dmxusb {

// Widget identities the library can impersonate.
enum class ProfileKind : uint8_t {
  EMULATED_ULTRA_DMX_MICRO = 0,  // single universe
  EMULATED_ULTRA_DMX_PRO = 1,    // two universes
  DMXUSB = 2,                    // N universes
  NUMBER_OF_PROFILES = 3
};

struct DeviceProfile {
  ProfileKind kind;
  const char* name;
  uint16_t esta_id;
  uint16_t device_id;
  uint8_t universes_out;
  uint8_t universes_in;

  etl::string_view nameView() const { return etl::string_view(name); }

  // DMX data arrives on the primary label or on BASE + N for every
  // configured output universe N. The parser (buffer clear) and the
  // dispatcher (universe routing) both rely on this single rule.
  bool isDmxLabel(uint8_t label) const {
    const uint8_t base = protocol::to_underlying(protocol::Label::DMX_DATA_UNIVERSE_BASE);
    return label == protocol::to_underlying(protocol::Label::DMX_DATA) ||
           (label >= base && static_cast<uint16_t>(label) < base + static_cast<uint16_t>(universes_out));
  }

  // Copy of this profile with a different output universe count. Only the
  // DMXUSB profile is resizable; a count of 0 or beyond the label space keeps
  // the registry value.
  DeviceProfile withUniversesOut(uint16_t count) const;
};

// Returns the registry entry for kind. Unknown kinds map to the
// single-universe widget.
const DeviceProfile& profile(ProfileKind kind);

const char* profileKindName(ProfileKind kind);

}  // namespace dmxusb

#endif  // DEVICE_PROFILE_H
