#include "slcan_receiver.hpp"
#include "slcan_serial.hpp"
#include "slcan_transport.hpp"
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>

// Opens an SLCAN adapter, brings the CAN channel up and prints every frame
// until `count` frames were seen (or forever).
//
//   slcan_sniffer /dev/ttyUSB0 [baud] [bitrate] [count]

static void print_frame(const CANProtocol::CANFrame& frame) {
    std::cout << (frame.isExtended() ? "EXT " : "STD ")
              << "identifier " << std::hex << frame.getIdentifier()
              << " dlc " << std::dec << static_cast<int>(frame.dlc)
              << " data";
    for (uint8_t i = 0; i < frame.dlc; i++) {
        std::cout << " " << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(frame.data[i]);
    }
    std::cout << std::dec << std::setfill(' ') << std::endl;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <serial_device> [baud] [bitrate] [count]" << std::endl;
        std::cerr << "Example: " << argv[0] << " /dev/ttyUSB0 115200 500000 100" << std::endl;
        return 1;
    }

    slcan::SerialConfig serial;
    serial.device = argv[1];
    if (argc > 2) serial.baud_rate = static_cast<uint32_t>(std::strtoul(argv[2], nullptr, 10));

    slcan::BusConfig bus_config;
    if (argc > 3) bus_config.bitrate = static_cast<uint32_t>(std::strtoul(argv[3], nullptr, 10));

    std::optional<size_t> count;
    if (argc > 4) count = static_cast<size_t>(std::strtoul(argv[4], nullptr, 10));

    slcan::SerialPort port;
    auto opened = port.open(serial);
    if (!opened.ok) {
        std::cerr << "Failed to open " << serial.device << ": " << opened.error.describe() << std::endl;
        return 1;
    }

    slcan::SerialCanBus bus(port);
    auto init = bus.initialize(bus_config);
    if (!init.ok) {
        std::cerr << init.error.describe() << std::endl;
        return 1;
    }
    std::cout << "Channel open at " << bus_config.bitrate << " bit/s" << std::endl;

    slcan::FrameReceiver receiver(port);
    auto received = receiver.run(print_frame, count);

    std::cout << "\n=== Statistics ===" << std::endl;
    std::cout << "Frames received: " << receiver.stats().frames_received << std::endl;
    std::cout << "Stray CRs: " << receiver.stats().stray_terminators << std::endl;

    if (!received.ok) {
        std::cerr << received.error.describe() << std::endl;
        return 1;
    }
    return 0;
}
