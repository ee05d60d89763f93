#include <stdint.h>

#include "protocol/dmx_buffer.h"
#include "test_constants.h"
#include "test_support.h"

using dmxusb::DmxBuffer;

static void test_starts_zeroed() {
  DmxBuffer buffer;
  TEST_ASSERT_EQ_UINT(buffer.size(), 512);
  TEST_ASSERT_EQ_UINT(buffer.writeIndex(), 0);
  for (size_t i = 0; i < buffer.size(); ++i) {
    TEST_ASSERT_EQ_UINT(buffer[i], 0);
  }
}

static void test_start_code_is_not_stored() {
  DmxBuffer buffer;
  TEST_ASSERT(!buffer.push(TEST_MARKER_BYTE));
  TEST_ASSERT_EQ_UINT(buffer.writeIndex(), 1);
  TEST_ASSERT_EQ_UINT(buffer[0], 0);

  TEST_ASSERT(buffer.push(0x10));
  TEST_ASSERT(buffer.push(0x20));
  TEST_ASSERT_EQ_UINT(buffer[0], 0x10);
  TEST_ASSERT_EQ_UINT(buffer[1], 0x20);
  TEST_ASSERT_EQ_UINT(buffer.channel(1), 0x10);
  TEST_ASSERT_EQ_UINT(buffer.channel(2), 0x20);
  TEST_ASSERT_EQ_UINT(buffer.writeIndex(), 3);
}

static void test_positions_past_512_are_dropped() {
  DmxBuffer buffer;
  TEST_ASSERT(!buffer.push(0x00));
  for (size_t i = 0; i < 512; ++i) {
    TEST_ASSERT(buffer.push(static_cast<uint8_t>(i)));
  }
  TEST_ASSERT_EQ_UINT(buffer.channel(512), 0xFF);

  // 600-byte payload: the extra 87 bytes advance the cursor only.
  for (size_t i = 0; i < 87; ++i) {
    TEST_ASSERT(!buffer.push(TEST_PAYLOAD_BYTE));
  }
  TEST_ASSERT_EQ_UINT(buffer.writeIndex(), 600);
  TEST_ASSERT_EQ_UINT(buffer.channel(512), 0xFF);
  TEST_ASSERT_EQ_UINT(buffer.channel(1), 0x00);
  TEST_ASSERT_EQ_UINT(buffer.channel(2), 0x01);
}

static void test_channel_out_of_range_reads_zero() {
  DmxBuffer buffer;
  TEST_ASSERT(!buffer.push(0x00));
  TEST_ASSERT(buffer.push(TEST_PAYLOAD_BYTE));
  TEST_ASSERT_EQ_UINT(buffer.channel(0), 0);
  TEST_ASSERT_EQ_UINT(buffer.channel(513), 0);
}

static void test_clear_zeroes_and_rewinds() {
  DmxBuffer buffer;
  for (size_t i = 0; i < 20; ++i) {
    (void)buffer.push(TEST_PAYLOAD_BYTE);
  }
  buffer.clear();
  TEST_ASSERT_EQ_UINT(buffer.writeIndex(), 0);
  for (size_t i = 0; i < buffer.size(); ++i) {
    TEST_ASSERT_EQ_UINT(buffer.data()[i], 0);
  }

  // The next byte is treated as a start code again.
  TEST_ASSERT(!buffer.push(TEST_MARKER_BYTE));
  TEST_ASSERT_EQ_UINT(buffer[0], 0);
}

static void test_cursor_saturates() {
  DmxBuffer buffer;
  for (uint32_t i = 0; i < 0x10005; ++i) {
    (void)buffer.push(0x01);
  }
  TEST_ASSERT_EQ_UINT(buffer.writeIndex(), 0xFFFF);
}

int main() {
  test_starts_zeroed();
  test_start_code_is_not_stored();
  test_positions_past_512_are_dropped();
  test_channel_out_of_range_reads_zero();
  test_clear_zeroes_and_rewinds();
  test_cursor_saturates();
  return 0;
}
