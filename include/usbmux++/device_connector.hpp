// Jackson Coxson

#ifndef USBMUX_DEVICE_CONNECTOR_HPP
#define USBMUX_DEVICE_CONNECTOR_HPP

#include <cstdint>
#include <memory>
#include <usbmux++/frame_codec.hpp>
#include <usbmux++/mux_addr.hpp>
#include <usbmux++/transport.hpp>
#include <vector>

namespace Usbmux {

/// @brief Runs the Connect handshake on a fresh daemon connection.
/// @details Sends `Connect{DeviceID, PortNumber}` as soon as the transport is
/// up and waits for the Result carrying the same tag. On Number 0 the
/// transport is paused before `done` runs, and `done` receives the bytes that
/// followed the Result so they can be handed to the next handler. Any other
/// outcome closes the transport. `done` is called exactly once.
class DeviceConnector : public StreamHandler {
  public:
    DeviceConnector(const MuxConfig&                  config,
                    uint32_t                          device_id,
                    uint16_t                          port,
                    uint32_t                          tag,
                    Completion<std::vector<uint8_t>> done);

    void connection_made(const std::shared_ptr<Transport>& transport) override;
    void data_received(const uint8_t* data, size_t len) override;
    void connection_lost(const Option<MuxError>& error) override;

    bool resolved() const noexcept { return !done_; }

  private:
    void resolve(MuxResult<std::vector<uint8_t>> result);

    MuxConfig                        config_;
    uint32_t                         device_id_;
    uint16_t                         port_;
    uint32_t                         tag_;
    Completion<std::vector<uint8_t>> done_;
    std::weak_ptr<Transport>         transport_;
    FrameDecoder                     decoder_;
};

// Builds the Connect request body. PortNumber is stored in network byte order.
PlistDict make_connect_request(const MuxConfig& config, uint32_t device_id, uint16_t port);

// Builds the Listen request body.
PlistDict make_listen_request(const MuxConfig& config);

} // namespace Usbmux
#endif
