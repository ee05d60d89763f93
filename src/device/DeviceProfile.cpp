/*
 * This file is part of the DMXUSB widget library.
 */
#include "DeviceProfile.h"

namespace dmxusb {

namespace {

// Indexed by ProfileKind.
const DeviceProfile kProfiles[] = {
    {ProfileKind::EMULATED_ULTRA_DMX_MICRO, "emulated Ultra DMX Micro", 0x6A6B, 0x0003, 1, 0},
    {ProfileKind::EMULATED_ULTRA_DMX_PRO, "emulated DMXKing UltraDMXPro", 0x6A6B, 0x0002, 2, 0},
    {ProfileKind::DMXUSB, "DMXUSB", 0x7FF7, 0x0042, 3, 0},
};

static_assert(sizeof(kProfiles) / sizeof(kProfiles[0]) ==
                  static_cast<size_t>(ProfileKind::NUMBER_OF_PROFILES),
              "Profile table out of sync with ProfileKind");

}  // namespace

DeviceProfile DeviceProfile::withUniversesOut(uint16_t count) const {
  DeviceProfile copy = *this;
  // The emulated widgets have a fixed number of outputs.
  if (kind != ProfileKind::DMXUSB) {
    return copy;
  }
  if (count >= 1 && count <= protocol::MAX_UNIVERSES_OUT) {
    // MAX_UNIVERSES_OUT is 156, so the narrowing is lossless.
    copy.universes_out = static_cast<uint8_t>(count);
  }
  return copy;
}

const DeviceProfile& profile(ProfileKind kind) {
  const size_t index = static_cast<size_t>(kind);
  if (index >= static_cast<size_t>(ProfileKind::NUMBER_OF_PROFILES)) {
    return kProfiles[0];
  }
  return kProfiles[index];
}

const char* profileKindName(ProfileKind kind) {
  switch (kind) {
    case ProfileKind::EMULATED_ULTRA_DMX_MICRO:
      return "EMULATED_ULTRA_DMX_MICRO";
    case ProfileKind::EMULATED_ULTRA_DMX_PRO:
      return "EMULATED_ULTRA_DMX_PRO";
    case ProfileKind::DMXUSB:
      return "DMXUSB";
    default:
      return "UNKNOWN";
  }
}

}  // namespace dmxusb
