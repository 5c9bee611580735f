// Jackson Coxson

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <iostream>
#include <plist/plist++.h>
#include <usbmux++.hpp>

int main() {
    Usbmux::init_logger(Usbmux::LogLevel::Debug, Usbmux::LogLevel::Disabled)
        .expect("failed to set up logging");

    boost::asio::io_context io;
    int                     status = 1;

    Usbmux::connect_to_usbmux(
        io, Usbmux::MuxConfig{}, [&](Usbmux::MuxResult<std::shared_ptr<Usbmux::UsbmuxConnection>> res) {
            auto mux = res.expect("failed to connect to usbmuxd");

            // the first Attached event, or one already queued
            auto watcher = mux->attach_watcher(true);
            watcher->wait_for_next(
                Usbmux::Some(std::chrono::milliseconds(2000)),
                [&, mux, watcher](Usbmux::MuxResult<Usbmux::DeviceEvent> ev) {
                    match_result(
                        ev,
                        event,
                        {
                            std::cout << "device " << event.device_id << "\n";
                            PList::Dictionary props(plist_copy(event.properties.raw()));
                            std::cout << props.ToXml();
                            status = 0;
                        },
                        e,
                        { std::cerr << "no device: " << e.message << "\n"; });
                    mux->close();
                });
        });

    io.run();
    return status;
}
