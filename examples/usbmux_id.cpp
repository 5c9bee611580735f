// Jackson Coxson

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <iostream>
#include <usbmux++.hpp>

int main() {
    Usbmux::init_logger(Usbmux::LogLevel::Warn, Usbmux::LogLevel::Disabled)
        .expect("failed to set up logging");

    boost::asio::io_context   io;
    boost::asio::steady_timer settle(io);
    int                       status = 0;

    Usbmux::connect_to_usbmux(
        io, Usbmux::MuxConfig{}, [&](Usbmux::MuxResult<std::shared_ptr<Usbmux::UsbmuxConnection>> res) {
            if (res.is_err()) {
                std::cerr << "failed to connect to usbmuxd: " << res.unwrap_err().message << "\n";
                status = 1;
                return;
            }
            auto mux = res.unwrap();
            // the daemon reports attached devices right after Listen
            settle.expires_after(std::chrono::milliseconds(250));
            settle.async_wait([mux](const boost::system::error_code&) {
                for (auto& entry : mux->attached()) {
                    auto serial = entry.second.get_string("SerialNumber");
                    std::cout << entry.first << " "
                              << serial.unwrap_or("(no serial)") << "\n";
                }
                mux->close();
            });
        });

    io.run();
    return status;
}
