#include "protocol/exceptions/DeviceError.h"

namespace renkei {

const char* describeDeviceError(int code) noexcept {
    switch (code) {
        // parameter / command class
        case 100: return "Unknown command";
        case 101: return "Invalid parameters";
        case 102: return "Motor busy";
        case 103: return "Motor unreachable";
        case 104: return "Checksum error";
        // hardware class
        case 300: return "Limits not set";
        case 301: return "UART Error";
        case 302: return "Voltage error";
        case 303: return "Over-current error";
        case 304: return "Encoder error";
        default:  return "Unknown error";
    }
}

} // namespace renkei
