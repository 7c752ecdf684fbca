#include "isotp.hpp"
#include "slcan_serial.hpp"
#include "slcan_transport.hpp"
#include <cstdlib>
#include <iomanip>
#include <iostream>

// Segments a UDS request with ISO-TP and sends it through an SLCAN adapter.
//
//   isotp_send_example /dev/ttyUSB0 [identifier] [length]
//
// Without a length a ReadDataByIdentifier request (0x22 F1 90) is sent as a
// Single Frame; with one, a dummy payload of that size is segmented.

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <serial_device> [identifier] [length]" << std::endl;
        std::cerr << "Example: " << argv[0] << " /dev/ttyUSB0 7e0 64" << std::endl;
        return 1;
    }

    slcan::SerialConfig serial;
    serial.device = argv[1];
    serial.read_timeout = std::chrono::milliseconds(1000);

    uint32_t identifier = 0x7E0;
    if (argc > 2) identifier = static_cast<uint32_t>(std::strtoul(argv[2], nullptr, 16));

    std::vector<uint8_t> payload = {0x22, 0xF1, 0x90};
    if (argc > 3) {
        payload.resize(std::strtoul(argv[3], nullptr, 10));
        for (size_t i = 0; i < payload.size(); i++) payload[i] = static_cast<uint8_t>(i);
    }

    auto segments = isotp::split(payload);
    if (!segments.ok) {
        std::cerr << segments.error.describe() << std::endl;
        return 1;
    }

    std::cout << "Payload of " << payload.size() << " bytes in "
              << segments.value.size() << " segment(s):" << std::endl;
    for (const auto& segment : segments.value) {
        std::cout << " ";
        for (uint8_t b : isotp::to_bytes(segment)) {
            std::cout << " " << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
        }
        std::cout << std::dec << std::setfill(' ') << std::endl;
    }

    slcan::SerialPort port;
    auto opened = port.open(serial);
    if (!opened.ok) {
        std::cerr << "Failed to open " << serial.device << ": " << opened.error.describe() << std::endl;
        return 1;
    }

    slcan::SerialCanBus bus(port);
    auto init = bus.initialize();
    if (!init.ok) {
        std::cerr << init.error.describe() << std::endl;
        return 1;
    }

    auto kind = identifier > CANProtocol::CAN_SFF_MASK ? CANProtocol::FrameKind::Extended
                                                       : CANProtocol::FrameKind::Standard;
    auto report = isotp::transmit(bus, kind, identifier, payload);
    if (!report.ok) {
        std::cerr << report.error.describe() << std::endl;
        return 1;
    }

    std::cout << "Sent " << report.value.segments_sent << "/" << report.value.segments_total
              << " segments, last status "
              << CANProtocol::SLCAN::toString(report.value.last_status) << std::endl;
    return report.value.complete() ? 0 : 2;
}
