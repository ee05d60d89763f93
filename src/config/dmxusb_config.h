#pragma once

// Compile-time configuration for the widget library.
//
// These are *not* wire constants (see protocol/widget_protocol.h for those).
// They tune MCU-side behaviour and the values reported in capability replies.
// Define any of them before including DmxUsb.h to override.

// Mid-frame silence tolerated before the parser is forced back to Start.
#ifndef DMXUSB_IDLE_TIMEOUT_MS
#define DMXUSB_IDLE_TIMEOUT_MS 100UL
#endif

#ifndef DMXUSB_DEFAULT_BAUDRATE
#define DMXUSB_DEFAULT_BAUDRATE 115200UL
#endif

// Reported by the serial number reply when the sketch does not supply one.
#ifndef DMXUSB_SERIAL_NUMBER
#define DMXUSB_SERIAL_NUMBER 0xFFFFFFFFUL
#endif

// --- Widget parameter reply ---
#ifndef DMXUSB_FIRMWARE_VERSION
#define DMXUSB_FIRMWARE_VERSION 0x0003U
#endif

// Break time in 10.67 us units.
#ifndef DMXUSB_BREAK_TIME
#define DMXUSB_BREAK_TIME 9U
#endif

// Mark-after-break time in 10.67 us units.
#ifndef DMXUSB_MAB_TIME
#define DMXUSB_MAB_TIME 1U
#endif

// Packets per second.
#ifndef DMXUSB_PACKET_RATE
#define DMXUSB_PACKET_RATE 40U
#endif

// Set to 0 to compile the log trace calls out entirely (AVR flash savings).
#ifndef DMXUSB_ENABLE_TRACE
#define DMXUSB_ENABLE_TRACE 1
#endif

// Capacity of one formatted trace line.
#ifndef DMXUSB_TRACE_LINE_SIZE
#define DMXUSB_TRACE_LINE_SIZE 64U
#endif
