#include "slcan_serial.hpp"
#include "slcan_transport.hpp"
#include <cstdlib>
#include <iostream>

// Queries an SLCAN adapter for its version, serial number and status flags.
// The version and serial number are read with the channel closed; the status
// flags need an open channel.
//
//   slcan_adapter_info /dev/ttyUSB0 [baud] [bitrate]

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <serial_device> [baud] [bitrate]" << std::endl;
        return 1;
    }

    slcan::SerialConfig serial;
    serial.device = argv[1];
    serial.read_timeout = std::chrono::milliseconds(1000);
    if (argc > 2) serial.baud_rate = static_cast<uint32_t>(std::strtoul(argv[2], nullptr, 10));

    slcan::BusConfig bus_config;
    if (argc > 3) bus_config.bitrate = static_cast<uint32_t>(std::strtoul(argv[3], nullptr, 10));

    slcan::SerialPort port;
    auto opened = port.open(serial);
    if (!opened.ok) {
        std::cerr << "Failed to open " << serial.device << ": " << opened.error.describe() << std::endl;
        return 1;
    }

    slcan::SerialCanBus bus(port);

    // Close first so N and V are answered
    auto closed = bus.issue(slcan::CloseChannelRequest{});
    if (!closed.ok) {
        std::cerr << closed.error.describe() << std::endl;
        return 1;
    }

    auto version = bus.issue(slcan::GetVersionRequest{});
    if (version.ok) {
        std::cout << "Version: " << version.value.describe() << std::endl;
    } else {
        std::cerr << "Version: " << version.error.describe() << std::endl;
    }

    auto serial_no = bus.issue(slcan::GetSerialRequest{});
    if (serial_no.ok) {
        std::cout << "Serial:  " << serial_no.value.serial << std::endl;
    } else {
        std::cerr << "Serial:  " << serial_no.error.describe() << std::endl;
    }

    auto init = bus.initialize(bus_config);
    if (!init.ok) {
        std::cerr << init.error.describe() << std::endl;
        return 1;
    }

    auto flags = bus.issue_command("status_flag");
    if (!flags.ok) {
        std::cerr << "Status:  " << flags.error.describe() << std::endl;
        return 1;
    }

    auto decoded = slcan::StatusFlagResponse::from_fields(flags.value.fields);
    if (decoded.ok) {
        std::cout << "Status:  " << decoded.value.describe() << std::endl;
    }

    auto reclosed = bus.issue(slcan::CloseChannelRequest{});
    if (!reclosed.ok) {
        std::cerr << reclosed.error.describe() << std::endl;
        return 1;
    }
    return 0;
}
