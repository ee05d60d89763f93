/*
 * This file is part of the DMXUSB widget library.
 */
#include "DmxUsb.h"

#include <etl/string.h>
#include <etl/to_string.h>
#include <etl/vector.h>

#include "protocol/PayloadBuilder.h"

namespace dmxusb {

namespace {

using protocol::Label;
using protocol::to_underlying;

constexpr uint8_t kPrimaryDmxLabel = to_underlying(Label::DMX_DATA);
constexpr uint8_t kUniverseLabelBase = to_underlying(Label::DMX_DATA_UNIVERSE_BASE);

}  // namespace

DmxUsbClass::DmxUsbClass(SerialPort& port, ProfileKind kind,
                         uint16_t universes_out, uint32_t serial_number)
    : _profile(profile(kind).withUniversesOut(universes_out)),
      _serial_number(serial_number),
      _dmx_buffer(),
      _transport(port, _profile, _dmx_buffer),
      _router(_profile),
      _dmx_handler(),
      _log_handler(),
      _stats() {
  _router.setHandler(this);
}

void DmxUsbClass::begin() {
  _transport.reset();
  resetStats();
  _trace("begin", profileKindName(_profile.kind));
}

void DmxUsbClass::process(uint32_t now_ms) {
  // Dispatch inline: the DMX buffer belongs to this frame only until the
  // parser sees the next DMX label.
  while (_transport.processInput(now_ms)) {
    const protocol::FrameParser::Error error = _transport.getLastError();
    if (error != protocol::FrameParser::Error::NONE) {
      _trace("discard", protocol::frameErrorName(error));
      _transport.clearError();
      continue;
    }
    const protocol::Frame& frame = _transport.rxFrame();
    _stats.frames_received++;
    _stats.last_label = frame.header.label;
    _trace("rx", frame.header.label, frame.header.payload_length);
    dispatch(frame);
  }

  if (_transport.checkIdle(now_ms)) {
    _stats.idle_resets++;
    _trace("idle_reset", protocol::frameErrorName(_transport.getLastError()));
    _transport.clearError();
  }
}

void DmxUsbClass::dispatch(const protocol::Frame& frame) {
  _router.route(frame);
}

void DmxUsbClass::onEstaIdRequest(const router::LabelContext& ctx) {
  etl::vector<uint8_t, kMaxReplyPayload> payload;
  protocol::PayloadBuilder(payload)
      .add_u16_le(_profile.esta_id)
      .add_string(etl::string_view(protocol::MANUFACTURER_NAME,
                                   protocol::MANUFACTURER_NAME_LENGTH));
  (void)_sendReply(ctx.label, payload.data(), payload.size());
}

void DmxUsbClass::onDeviceIdRequest(const router::LabelContext& ctx) {
  etl::vector<uint8_t, kMaxReplyPayload> payload;
  protocol::PayloadBuilder(payload)
      .add_u16_le(_profile.device_id)
      .add_string(_profile.nameView());
  (void)_sendReply(ctx.label, payload.data(), payload.size());
}

void DmxUsbClass::onSerialNumberRequest(const router::LabelContext& ctx) {
  etl::vector<uint8_t, kMaxReplyPayload> payload;
  protocol::PayloadBuilder(payload).add_u32_le(_serial_number);
  (void)_sendReply(ctx.label, payload.data(), payload.size());
}

void DmxUsbClass::onWidgetParameterRequest(const router::LabelContext& ctx) {
  etl::vector<uint8_t, kMaxReplyPayload> payload;
  protocol::PayloadBuilder(payload)
      .add_u16_le(kFirmwareVersion)
      .add(kBreakTime)
      .add(kMarkAfterBreakTime)
      .add(kPacketRate);
  (void)_sendReply(ctx.label, payload.data(), payload.size());
}

void DmxUsbClass::onWidgetParameterExtendedRequest(const router::LabelContext& ctx) {
  etl::vector<uint8_t, kMaxReplyPayload> payload;
  protocol::PayloadBuilder(payload)
      .add(_profile.universes_out)
      .add(_profile.universes_in);
  (void)_sendReply(ctx.label, payload.data(), payload.size());
}

void DmxUsbClass::onDmxData(const router::LabelContext& ctx) {
  _stats.frames_dispatched++;
  const bool primary = (ctx.label == kPrimaryDmxLabel);
  // The router only sends labels the profile accepts, so a non-primary label
  // is always kUniverseLabelBase + N with N < universes_out.
  const uint8_t universe = primary ? 0 : static_cast<uint8_t>(ctx.label - kUniverseLabelBase);

  switch (_profile.kind) {
    case ProfileKind::EMULATED_ULTRA_DMX_MICRO:
      _deliverUniverse(0);
      break;

    case ProfileKind::EMULATED_ULTRA_DMX_PRO:
      if (primary) {
        // Legacy single-label senders drive both outputs.
        _deliverUniverse(0);
        _deliverUniverse(1);
      } else {
        _deliverUniverse(universe);
      }
      break;

    case ProfileKind::DMXUSB:
      if (primary) {
        for (uint16_t u = 0; u < _profile.universes_out; ++u) {
          _deliverUniverse(static_cast<uint8_t>(u));
        }
      } else {
        _deliverUniverse(universe);
      }
      break;

    case ProfileKind::NUMBER_OF_PROFILES:
      break;
  }
}

void DmxUsbClass::onUnknownLabel(const router::LabelContext& ctx) {
  _stats.frames_ignored++;
  _trace("ignore", ctx.label, ctx.frame->header.payload_length);
}

void DmxUsbClass::_deliverUniverse(uint8_t universe) {
  _stats.dmx_deliveries++;
  if (_dmx_handler.is_valid()) {
    _dmx_handler(universe, _dmx_buffer.data(), static_cast<uint16_t>(_dmx_buffer.size()));
  }
}

bool DmxUsbClass::_sendReply(uint8_t label, const uint8_t* payload, size_t length) {
  _stats.frames_dispatched++;
  const bool ok = _transport.sendFrame(label, payload, length);
  if (ok) {
    _stats.replies_sent++;
    _trace("tx", label, static_cast<uint16_t>(length));
  } else {
    _stats.reply_failures++;
    _trace("tx_failed", label, static_cast<uint16_t>(length));
  }
  return ok;
}

DmxUsbClass::Stats DmxUsbClass::getStats() const {
  Stats snapshot = _stats;
  snapshot.frames_discarded = _transport.discardedFrames();
  snapshot.bytes_skipped = _transport.skippedBytes();
  return snapshot;
}

void DmxUsbClass::resetStats() {
  _stats = Stats();
  _transport.resetCounters();
}

#if DMXUSB_ENABLE_TRACE

void DmxUsbClass::_trace(const char* event, uint8_t label, uint16_t length) {
  if (!_log_handler.is_valid()) {
    return;
  }
  etl::string<DMXUSB_TRACE_LINE_SIZE> line("[DmxUsb] ");
  line.append(event);
  line.append(" label=");
  etl::to_string(static_cast<uint32_t>(label), line, true);
  line.append(" len=");
  etl::to_string(static_cast<uint32_t>(length), line, true);
  _log_handler(etl::string_view(line.data(), line.size()));
}

void DmxUsbClass::_trace(const char* event, const char* detail) {
  if (!_log_handler.is_valid()) {
    return;
  }
  etl::string<DMXUSB_TRACE_LINE_SIZE> line("[DmxUsb] ");
  line.append(event);
  line.append(" ");
  line.append(detail);
  _log_handler(etl::string_view(line.data(), line.size()));
}

#else

void DmxUsbClass::_trace(const char*, uint8_t, uint16_t) {}
void DmxUsbClass::_trace(const char*, const char*) {}

#endif

}  // namespace dmxusb
