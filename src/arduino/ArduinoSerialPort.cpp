#include "ArduinoSerialPort.h"

namespace dmxusb {

ArduinoSerialPort::ArduinoSerialPort(Stream& stream, HardwareSerial* hwSerial)
    : _stream(stream),
      _hardware_serial(hwSerial) {}

void ArduinoSerialPort::begin(unsigned long baudrate) {
    if (_hardware_serial != nullptr) {
        _hardware_serial->begin(baudrate);
    }
}

int ArduinoSerialPort::available() {
    return _stream.available();
}

int ArduinoSerialPort::read() {
    return _stream.read();
}

size_t ArduinoSerialPort::write(const uint8_t* buffer, size_t size) {
    if (_hardware_serial != nullptr) {
        return _hardware_serial->write(buffer, size);
    }
    return _stream.write(buffer, size);
}

void ArduinoSerialPort::flush() {
    if (_hardware_serial != nullptr) {
        _hardware_serial->flush();
    } else {
        _stream.flush();
    }
}

} // namespace dmxusb
