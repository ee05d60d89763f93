#ifndef ARDUINO_SERIAL_PORT_H
#define ARDUINO_SERIAL_PORT_H

#include <Arduino.h>
#include <Stream.h>

#include "../config/dmxusb_config.h"
#include "../transport/SerialPort.h"

namespace dmxusb {

// SerialPort over an Arduino Stream. Pass the HardwareSerial as well when
// the port needs begin(); USB CDC ports can be handed over as a plain Stream.
class ArduinoSerialPort : public SerialPort {
public:
    explicit ArduinoSerialPort(Stream& stream, HardwareSerial* hwSerial = nullptr);

    void begin(unsigned long baudrate = DMXUSB_DEFAULT_BAUDRATE);

    int available() override;
    int read() override;
    size_t write(const uint8_t* buffer, size_t size) override;
    void flush() override;

private:
    Stream& _stream;
    HardwareSerial* _hardware_serial;
};

} // namespace dmxusb

#endif // ARDUINO_SERIAL_PORT_H
