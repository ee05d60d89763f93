#ifndef PAYLOAD_BUILDER_H
#define PAYLOAD_BUILDER_H

#include "widget_protocol.h"
#include <etl/vector.h>
#include <etl/string_view.h>
#include <etl/algorithm.h>

namespace dmxusb {
namespace protocol {

/**
 * @brief Fluid interface for building reply payloads.
 * Writes into caller-owned static storage; bytes that do not fit are dropped.
 */
class PayloadBuilder {
public:
    explicit PayloadBuilder(etl::ivector<uint8_t>& payload)
        : _payload(payload) {
        _payload.clear();
    }

    PayloadBuilder& add(uint8_t byte) {
        if (!_payload.full()) {
            _payload.push_back(byte);
        }
        return *this;
    }

    PayloadBuilder& add(const uint8_t* data, size_t len) {
        const size_t available = _payload.capacity() - _payload.size();
        const size_t to_copy = etl::min(len, available);
        if (to_copy > 0) {
            _payload.insert(_payload.end(), data, data + to_copy);
        }
        return *this;
    }

    PayloadBuilder& add_u16_le(uint16_t value) {
        uint8_t buf[2];
        write_u16_le(buf, value);
        return add(buf, 2);
    }

    PayloadBuilder& add_u32_le(uint32_t value) {
        uint8_t buf[4];
        write_u32_le(buf, value);
        return add(buf, 4);
    }

    // Raw ASCII, no length prefix and no terminator.
    PayloadBuilder& add_string(etl::string_view str) {
        return add(reinterpret_cast<const uint8_t*>(str.data()), str.length());
    }

    size_t size() const { return _payload.size(); }
    const uint8_t* data() const { return _payload.data(); }

private:
    etl::ivector<uint8_t>& _payload;
};

} // namespace protocol
} // namespace dmxusb

#endif // PAYLOAD_BUILDER_H
