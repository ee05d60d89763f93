/**
 * @file label_router.h
 * @brief ETL-based label router for the DMXUSB widget.
 *
 * Completed frames are categorized by label and dispatched through ETL's
 * message_router to the handler that owns the reply or the universe fan-out.
 *
 * Label Categories (Message IDs):
 *   - MSG_ESTA_ID (0): label 77
 *   - MSG_DEVICE_ID (1): label 78
 *   - MSG_SERIAL_NUMBER (2): label 10
 *   - MSG_WIDGET_PARAMETER (3): label 3
 *   - MSG_WIDGET_PARAMETER_EXTENDED (4): label 53
 *   - MSG_DMX_DATA (5): label 6 and 100 + N, N < universes_out
 *   - MSG_UNKNOWN (6): anything else
 */
#ifndef LABEL_ROUTER_H
#define LABEL_ROUTER_H

#include "etl/message.h"
#include "etl/message_router.h"
#include "device/DeviceProfile.h"
#include "protocol/widget_frame.h"
#include "protocol/widget_protocol.h"

namespace dmxusb {
namespace router {

// ============================================================================
// Message IDs - One per label category
// ============================================================================
enum MessageId : etl::message_id_t {
  MSG_ESTA_ID = 0,
  MSG_DEVICE_ID = 1,
  MSG_SERIAL_NUMBER = 2,
  MSG_WIDGET_PARAMETER = 3,
  MSG_WIDGET_PARAMETER_EXTENDED = 4,
  MSG_DMX_DATA = 5,
  MSG_UNKNOWN = 6,
  NUMBER_OF_MESSAGES = 7
};

// Pointer to avoid copying the 600-byte payload during routing.
struct LabelContext {
  const protocol::Frame* frame;
  uint8_t label;
};

// ============================================================================
// Category-specific Messages
// ============================================================================
struct MsgEstaId : public etl::message<MSG_ESTA_ID> {
  LabelContext ctx;
  explicit MsgEstaId(const LabelContext& c) : ctx(c) {}
};

struct MsgDeviceId : public etl::message<MSG_DEVICE_ID> {
  LabelContext ctx;
  explicit MsgDeviceId(const LabelContext& c) : ctx(c) {}
};

struct MsgSerialNumber : public etl::message<MSG_SERIAL_NUMBER> {
  LabelContext ctx;
  explicit MsgSerialNumber(const LabelContext& c) : ctx(c) {}
};

struct MsgWidgetParameter : public etl::message<MSG_WIDGET_PARAMETER> {
  LabelContext ctx;
  explicit MsgWidgetParameter(const LabelContext& c) : ctx(c) {}
};

struct MsgWidgetParameterExtended : public etl::message<MSG_WIDGET_PARAMETER_EXTENDED> {
  LabelContext ctx;
  explicit MsgWidgetParameterExtended(const LabelContext& c) : ctx(c) {}
};

struct MsgDmxData : public etl::message<MSG_DMX_DATA> {
  LabelContext ctx;
  explicit MsgDmxData(const LabelContext& c) : ctx(c) {}
};

struct MsgUnknown : public etl::message<MSG_UNKNOWN> {
  LabelContext ctx;
  explicit MsgUnknown(const LabelContext& c) : ctx(c) {}
};

// ============================================================================
// Label Categorizer - Maps a label to its message category
// ============================================================================
inline MessageId categorize_label(uint8_t label, const DeviceProfile& profile) {
  using protocol::Label;
  using protocol::to_underlying;

  // DMX first: the profile rule is the same one the parser used to decide
  // whether the payload streamed into the DMX buffer.
  if (profile.isDmxLabel(label)) {
    return MSG_DMX_DATA;
  }
  switch (label) {
    case to_underlying(Label::ESTA_ID_REQUEST):
      return MSG_ESTA_ID;
    case to_underlying(Label::DEVICE_ID_REQUEST):
      return MSG_DEVICE_ID;
    case to_underlying(Label::SERIAL_NUMBER_REQUEST):
      return MSG_SERIAL_NUMBER;
    case to_underlying(Label::WIDGET_PARAMETER_REQUEST):
      return MSG_WIDGET_PARAMETER;
    case to_underlying(Label::WIDGET_PARAMETER_EXTENDED_REQUEST):
      return MSG_WIDGET_PARAMETER_EXTENDED;
    default:
      return MSG_UNKNOWN;
  }
}

// ============================================================================
// Handler Interface - the widget implements this to receive routed frames
// ============================================================================
class ILabelHandler {
public:
  virtual ~ILabelHandler() {}
  virtual void onEstaIdRequest(const LabelContext& ctx) = 0;
  virtual void onDeviceIdRequest(const LabelContext& ctx) = 0;
  virtual void onSerialNumberRequest(const LabelContext& ctx) = 0;
  virtual void onWidgetParameterRequest(const LabelContext& ctx) = 0;
  virtual void onWidgetParameterExtendedRequest(const LabelContext& ctx) = 0;
  virtual void onDmxData(const LabelContext& ctx) = 0;
  virtual void onUnknownLabel(const LabelContext& ctx) = 0;
};

// ============================================================================
// Label Router - ETL message_router for frame dispatch
// ============================================================================
class LabelRouter : public etl::message_router<LabelRouter,
                                                MsgEstaId,
                                                MsgDeviceId,
                                                MsgSerialNumber,
                                                MsgWidgetParameter,
                                                MsgWidgetParameterExtended,
                                                MsgDmxData,
                                                MsgUnknown>
{
public:
  explicit LabelRouter(const DeviceProfile& profile)
    : message_router(ROUTER_ID)
    , _profile(profile)
    , _handler(nullptr)
  {
  }

  void setHandler(ILabelHandler* handler) {
    _handler = handler;
  }

  // Route a completed frame to the appropriate handler
  void route(const protocol::Frame& frame) {
    const LabelContext ctx = {&frame, frame.header.label};
    switch (categorize_label(ctx.label, _profile)) {
      case MSG_ESTA_ID:                   receive(MsgEstaId(ctx));                  break;
      case MSG_DEVICE_ID:                 receive(MsgDeviceId(ctx));                break;
      case MSG_SERIAL_NUMBER:             receive(MsgSerialNumber(ctx));            break;
      case MSG_WIDGET_PARAMETER:          receive(MsgWidgetParameter(ctx));         break;
      case MSG_WIDGET_PARAMETER_EXTENDED: receive(MsgWidgetParameterExtended(ctx)); break;
      case MSG_DMX_DATA:                  receive(MsgDmxData(ctx));                 break;
      default:                            receive(MsgUnknown(ctx));                 break;
    }
  }

  // ETL message handlers - dispatch to ILabelHandler
  void on_receive(const MsgEstaId& msg)       { if (_handler) _handler->onEstaIdRequest(msg.ctx); }
  void on_receive(const MsgDeviceId& msg)     { if (_handler) _handler->onDeviceIdRequest(msg.ctx); }
  void on_receive(const MsgSerialNumber& msg) { if (_handler) _handler->onSerialNumberRequest(msg.ctx); }
  void on_receive(const MsgWidgetParameter& msg) { if (_handler) _handler->onWidgetParameterRequest(msg.ctx); }
  void on_receive(const MsgWidgetParameterExtended& msg) {
    if (_handler) _handler->onWidgetParameterExtendedRequest(msg.ctx);
  }
  void on_receive(const MsgDmxData& msg)      { if (_handler) _handler->onDmxData(msg.ctx); }
  void on_receive(const MsgUnknown& msg)      { if (_handler) _handler->onUnknownLabel(msg.ctx); }

  void on_receive_unknown(const etl::imessage&) {
    // Should not happen - all categories are handled
  }

private:
  static constexpr etl::message_router_id_t ROUTER_ID = 1;
  const DeviceProfile& _profile;
  ILabelHandler* _handler;
};

}  // namespace router
}  // namespace dmxusb

#endif // LABEL_ROUTER_H
