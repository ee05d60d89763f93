/*
 * This file is part of the DMXUSB widget library.
 */
#ifndef DMXUSB_H
#define DMXUSB_H

#include <stddef.h>
#include <stdint.h>

#include <etl/delegate.h>
#include <etl/string_view.h>

#include "config/dmxusb_config.h"
#include "device/DeviceProfile.h"
#include "protocol/dmx_buffer.h"
#include "protocol/widget_frame.h"
#include "protocol/widget_protocol.h"
#include "router/label_router.h"
#include "transport/SerialPort.h"
#include "transport/WidgetTransport.h"

// --- Configuration ---
constexpr uint32_t kDmxUsbDefaultSerialNumber = DMXUSB_SERIAL_NUMBER;
constexpr unsigned long kDmxUsbBaudrate = DMXUSB_DEFAULT_BAUDRATE;

namespace dmxusb {

namespace test {
class TestAccessor;
}

/*
 * Emulated USB-DMX widget.
 *
 * Reads widget frames from a SerialPort, answers identity and capability
 * requests on the same port and hands DMX payloads to the sketch through the
 * DMX handler. Everything happens inside process(); nothing blocks.
 */
class DmxUsbClass : private router::ILabelHandler {
  friend class test::TestAccessor;
 public:
  static constexpr uint16_t kFirmwareVersion = DMXUSB_FIRMWARE_VERSION;
  static constexpr uint8_t kBreakTime = DMXUSB_BREAK_TIME;
  static constexpr uint8_t kMarkAfterBreakTime = DMXUSB_MAB_TIME;
  static constexpr uint8_t kPacketRate = DMXUSB_PACKET_RATE;
  static constexpr size_t kMaxReplyPayload = 64;

  // Callbacks
  // The data pointer refers to the widget's own buffer: it is overwritten by
  // the next DMX frame, so copy what must outlive the call.
  using DmxHandler = etl::delegate<void(uint8_t universe, const uint8_t* data, uint16_t length)>;
  using LogHandler = etl::delegate<void(etl::string_view line)>;

  struct Stats {
    uint32_t frames_received;
    uint32_t frames_dispatched;
    uint32_t frames_ignored;
    uint32_t frames_discarded;
    uint32_t idle_resets;
    uint32_t bytes_skipped;
    uint32_t replies_sent;
    uint32_t reply_failures;
    uint32_t dmx_deliveries;
    uint8_t last_label;
  };

  // universes_out resizes the DMXUSB profile only; 0 keeps the default.
  explicit DmxUsbClass(SerialPort& port,
                       ProfileKind kind = ProfileKind::EMULATED_ULTRA_DMX_MICRO,
                       uint16_t universes_out = 0,
                       uint32_t serial_number = kDmxUsbDefaultSerialNumber);

  // The transport and router hold references into this object.
  DmxUsbClass(const DmxUsbClass&) = delete;
  DmxUsbClass& operator=(const DmxUsbClass&) = delete;

  // Drops any partial frame and clears statistics.
  void begin();

  // Handles every byte currently available on the port. now_ms is the
  // caller's monotonic clock (millis() on Arduino).
  void process(uint32_t now_ms);

  // Events
  void onDmxReceived(DmxHandler handler) { _dmx_handler = handler; }
  void onLog(LogHandler handler) { _log_handler = handler; }

  const DeviceProfile& deviceProfile() const { return _profile; }
  uint8_t universesOut() const { return _profile.universes_out; }
  uint32_t serialNumber() const { return _serial_number; }
  const DmxBuffer& dmxBuffer() const { return _dmx_buffer; }
  protocol::FrameParser::State parserState() const { return _transport.parserState(); }

  Stats getStats() const;
  void resetStats();

 private:
  // Declaration order matters: the transport keeps references to both.
  const DeviceProfile _profile;
  const uint32_t _serial_number;
  DmxBuffer _dmx_buffer;
  WidgetTransport _transport;
  router::LabelRouter _router;

  DmxHandler _dmx_handler;
  LogHandler _log_handler;
  Stats _stats;

  // router::ILabelHandler
  void onEstaIdRequest(const router::LabelContext& ctx) override;
  void onDeviceIdRequest(const router::LabelContext& ctx) override;
  void onSerialNumberRequest(const router::LabelContext& ctx) override;
  void onWidgetParameterRequest(const router::LabelContext& ctx) override;
  void onWidgetParameterExtendedRequest(const router::LabelContext& ctx) override;
  void onDmxData(const router::LabelContext& ctx) override;
  void onUnknownLabel(const router::LabelContext& ctx) override;

  void dispatch(const protocol::Frame& frame);
  void _deliverUniverse(uint8_t universe);
  bool _sendReply(uint8_t label, const uint8_t* payload, size_t length);
  void _trace(const char* event, uint8_t label, uint16_t length);
  void _trace(const char* event, const char* detail);
};

}  // namespace dmxusb

#endif  // DMXUSB_H
