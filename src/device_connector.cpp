// Jackson Coxson

#include <boost/endian/conversion.hpp>
#include <spdlog/spdlog.h>
#include <usbmux++/device_connector.hpp>

namespace Usbmux {

PlistDict make_listen_request(const MuxConfig& config) {
    PlistDict msg;
    msg.set_string("MessageType", "Listen");
    msg.set_string("ClientVersionString", config.client_version);
    msg.set_string("ProgName", config.prog_name);
    return msg;
}

PlistDict make_connect_request(const MuxConfig& config, uint32_t device_id, uint16_t port) {
    PlistDict msg;
    msg.set_string("MessageType", "Connect");
    msg.set_string("ClientVersionString", config.client_version);
    msg.set_string("ProgName", config.prog_name);
    msg.set_uint("DeviceID", device_id);
    msg.set_uint("PortNumber", boost::endian::native_to_big(port));
    return msg;
}

DeviceConnector::DeviceConnector(const MuxConfig&                  config,
                                 uint32_t                          device_id,
                                 uint16_t                          port,
                                 uint32_t                          tag,
                                 Completion<std::vector<uint8_t>> done)
    : config_(config),
      device_id_(device_id),
      port_(port),
      tag_(tag),
      done_(std::move(done)) {
}

void DeviceConnector::connection_made(const std::shared_ptr<Transport>& transport) {
    transport_ = transport;

    auto frame = encode_frame(make_connect_request(config_, device_id_, port_), tag_);
    if (frame.is_err()) {
        resolve(Err(frame.unwrap_err()));
        transport->abort();
        return;
    }
    spdlog::debug("usbmux: requesting device {} port {} (tag {})", device_id_, port_, tag_);
    transport->write(std::move(frame).unwrap());
}

void DeviceConnector::data_received(const uint8_t* data, size_t len) {
    if (resolved()) {
        return;
    }
    decoder_.append(data, len);

    while (true) {
        auto next = decoder_.next();
        if (next.is_err()) {
            resolve(Err(next.unwrap_err()));
            if (auto t = transport_.lock()) {
                t->abort();
            }
            return;
        }
        auto frame = std::move(next).unwrap();
        if (frame.is_none()) {
            return;
        }
        Frame f = std::move(frame).unwrap();

        auto type = f.payload.get_string("MessageType");
        if (type.is_none() || type.unwrap() != "Result") {
            spdlog::debug("usbmux: ignoring {} frame during connect",
                          type.unwrap_or("untyped"));
            continue;
        }
        if (f.header.tag != tag_) {
            spdlog::debug("usbmux: ignoring Result for tag {} (waiting on {})", f.header.tag, tag_);
            continue;
        }

        uint64_t number = f.payload.get_uint("Number").unwrap_or(UINT64_MAX);
        auto     t      = transport_.lock();
        if (number == 0) {
            spdlog::info("usbmux: connected to device {} port {}", device_id_, port_);
            // whatever follows the Result already belongs to the device
            if (t) {
                t->pause_reading();
            }
            resolve(Ok(decoder_.take_buffered()));
            return;
        }

        MuxError err = MuxError::from_result_number(number, device_id_, port_);
        spdlog::info("usbmux: connect to device {} port {} failed: {}",
                     device_id_,
                     port_,
                     err.to_string());
        resolve(Err(err));
        if (t) {
            t->close();
        }
        return;
    }
}

void DeviceConnector::connection_lost(const Option<MuxError>& error) {
    if (resolved()) {
        return;
    }
    std::string why = "connection closed";
    if_let_some(error, e, { why = e.to_string(); });
    resolve(Err(MuxError::ConnectionFailed(
        fmt::format("daemon connection lost before Result: {}", why))));
}

void DeviceConnector::resolve(MuxResult<std::vector<uint8_t>> result) {
    if (!done_) {
        return;
    }
    auto cb = std::move(done_);
    done_   = nullptr;
    cb(std::move(result));
}

} // namespace Usbmux
