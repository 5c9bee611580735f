// Jackson Coxson

#include <boost/asio/io_context.hpp>
#include <cstdlib>
#include <iostream>
#include <usbmux++.hpp>

// Copies everything the device sends to stdout.
class StdoutRelay : public Usbmux::StreamHandler {
  public:
    void connection_made(const std::shared_ptr<Usbmux::Transport>&) override {
        std::cerr << "tunnel open\n";
    }

    void data_received(const uint8_t* data, size_t len) override {
        std::cout.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
        std::cout.flush();
    }

    void connection_lost(const Usbmux::Option<Usbmux::MuxError>& error) override {
        match_option(
            error,
            e,
            { std::cerr << "tunnel lost: " << e.message << "\n"; },
            { std::cerr << "tunnel closed\n"; });
    }
};

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "usage: " << argv[0] << " <port>\n";
        return 2;
    }
    char*         end  = nullptr;
    unsigned long port = std::strtoul(argv[1], &end, 10);
    if (*end != '\0' || port == 0 || port > 65535) {
        std::cerr << "invalid port: " << argv[1] << "\n";
        return 2;
    }

    Usbmux::init_logger(Usbmux::LogLevel::Info, Usbmux::LogLevel::Disabled)
        .expect("failed to set up logging");

    boost::asio::io_context io;
    int                     status = 0;

    Usbmux::connect_to_usbmux(
        io, Usbmux::MuxConfig{}, [&](Usbmux::MuxResult<std::shared_ptr<Usbmux::UsbmuxConnection>> res) {
            auto mux = res.expect("failed to connect to usbmuxd");
            mux->connect_to_first_device(
                [] { return std::make_shared<StdoutRelay>(); },
                static_cast<uint16_t>(port),
                [&, mux](Usbmux::MuxResult<Usbmux::DeviceConnection> conn) {
                    // the tunnel runs on its own daemon connection
                    mux->close();
                    match_result(
                        conn,
                        c,
                        { std::cerr << "connected to device " << c.device_id << "\n"; },
                        e,
                        {
                            std::cerr << "connect failed: " << e.to_string() << "\n";
                            status = 1;
                        });
                });
        });

    io.run();
    return status;
}
