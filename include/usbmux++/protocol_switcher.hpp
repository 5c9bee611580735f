// Jackson Coxson

#ifndef USBMUX_PROTOCOL_SWITCHER_HPP
#define USBMUX_PROTOCOL_SWITCHER_HPP

#include <cstdint>
#include <memory>
#include <usbmux++/transport.hpp>
#include <vector>

namespace Usbmux {

/// @brief Forwards transport events to a replaceable inner handler.
/// @details A connection to a device starts out speaking the framed control
/// protocol. Once the daemon accepts the Connect request the very same socket
/// carries the device's bytes, so the control handler is swapped for the
/// application's handler with switch_protocol().
class ProtocolSwitcher : public StreamHandler,
                         public std::enable_shared_from_this<ProtocolSwitcher> {
  public:
    explicit ProtocolSwitcher(std::shared_ptr<StreamHandler> initial);

    /// @brief Installs the handler built by `factory`.
    /// @details The transport must already be paused so nothing reaches either
    /// handler mid-switch. The new handler then gets, in order and from the
    /// event loop: connection_made(), the `carry_over` bytes the previous
    /// handler had buffered but not consumed, and finally the transport's
    /// reads are resumed.
    /// @return The installed handler, or InvalidArgument if the transport is
    /// still reading or the factory produced nothing.
    MuxResult<std::shared_ptr<StreamHandler>> switch_protocol(const ProtocolFactory& factory,
                                                              std::vector<uint8_t>   carry_over = {});

    const std::shared_ptr<StreamHandler>&     protocol() const noexcept { return protocol_; }
    std::shared_ptr<Transport>                transport() const { return transport_.lock(); }

    void connection_made(const std::shared_ptr<Transport>& transport) override;
    void data_received(const uint8_t* data, size_t len) override;
    void eof_received() override;
    void connection_lost(const Option<MuxError>& error) override;

  private:
    void complete_switch(const std::shared_ptr<Transport>& transport,
                         std::vector<uint8_t>              carry_over);

    std::shared_ptr<StreamHandler> protocol_;
    std::weak_ptr<Transport>       transport_;
    bool                           switching_ = false;
    bool                           lost_      = false;
    Option<MuxError>               lost_error_;
};

} // namespace Usbmux
#endif
