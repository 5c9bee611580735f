// Jackson Coxson

#ifndef USBMUX_USBMUX_HPP
#define USBMUX_USBMUX_HPP

#include <boost/asio/io_context.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <usbmux++/deadline.hpp>
#include <usbmux++/device_registry.hpp>
#include <usbmux++/error.hpp>
#include <usbmux++/frame_codec.hpp>
#include <usbmux++/mux_addr.hpp>
#include <usbmux++/option.hpp>
#include <usbmux++/plist_dict.hpp>
#include <usbmux++/protocol_switcher.hpp>
#include <usbmux++/transport.hpp>

namespace Usbmux {

enum class MuxState : uint8_t { Disconnected, Connecting, Listening, Closed };

const char* to_string(MuxState state) noexcept;

// A connected tunnel to one device port. `handler` is the application's
// StreamHandler; the same transport now carries the device's bytes.
struct DeviceConnection {
    uint32_t                       device_id = 0;
    // Properties from the Attached event, empty if the device was not known.
    PlistDict                      device_info;
    std::shared_ptr<Transport>     transport;
    std::shared_ptr<StreamHandler> handler;
};

// Restricts which devices connect_to_first_device() may pick.
struct DeviceFilter {
    // None accepts every device id.
    Option<std::set<uint32_t>> include;
    std::set<uint32_t>         exclude;

    bool                       accepts(uint32_t device_id) const;
};

/// @brief A listen-mode connection to the usbmux daemon.
/// @details Keeps the registry of attached devices current and opens
/// per-device tunnels over fresh daemon connections. Everything runs on the
/// io_context passed to connect(); none of the methods are thread safe.
class UsbmuxConnection : public std::enable_shared_from_this<UsbmuxConnection> {
  public:
    /// @brief Connects to the daemon and enters listen mode.
    /// @details `done` receives the handle once the daemon accepted the
    /// Listen request. If the socket cannot be reached it gets the Io error;
    /// a non-zero Result gives ConnectionFailed.
    static void connect(boost::asio::io_context&                       io,
                        MuxConfig                                      config,
                        Completion<std::shared_ptr<UsbmuxConnection>> done);

    ~UsbmuxConnection();
    UsbmuxConnection(const UsbmuxConnection&)            = delete;
    UsbmuxConnection& operator=(const UsbmuxConnection&) = delete;

    /// @brief Opens a tunnel to `port` on `device_id`.
    /// @details A new daemon connection is opened for the request. Once the
    /// daemon answers with Result 0 the connection is handed to the handler
    /// `factory` builds, along with any bytes that followed the Result.
    /// Fails with DeviceNotConnected, ConnectionRefused or ConnectionFailed.
    void connect_to_device(ProtocolFactory              factory,
                           uint32_t                     device_id,
                           uint16_t                     port,
                           Completion<DeviceConnection> done);

    /// @brief Opens a tunnel to `port` on the first device that accepts.
    /// @details Tries the attached devices, then the ones that attach while
    /// waiting, each at most once. A device failing with a usbmux error is
    /// skipped; any other error ends the search. Fails with Timeout when
    /// `max_wait` (None: no limit) runs out.
    void connect_to_first_device(ProtocolFactory              factory,
                                 uint16_t                     port,
                                 Option<Millis>               max_wait,
                                 Completion<DeviceConnection> done,
                                 DeviceFilter                 filter = {});

    // Same, bounded by MuxConfig::default_max_wait.
    void connect_to_first_device(ProtocolFactory factory, uint16_t port, Completion<DeviceConnection> done);

    // Resolves with the next device to attach.
    void wait_for_attach(Option<Millis> timeout, Completion<uint32_t> done);

    /// @brief Resolves with the device whose SerialNumber matches `serial`,
    /// ignoring case. Devices already attached count. A zero timeout only
    /// looks at those.
    void wait_for_serial(std::string serial, Option<Millis> timeout, Completion<uint32_t> done);

    std::map<uint32_t, PlistDict>          attached() const { return registry_->snapshot(); }
    const std::shared_ptr<DeviceRegistry>& registry() const noexcept { return registry_; }
    std::shared_ptr<AttachWatcher>         attach_watcher(bool include_existing = false);

    // Tears down the listen connection. The registry keeps its last contents
    // but receives no further events.
    void                                   close();

    MuxState                               state() const noexcept { return state_; }
    bool                                   is_listening() const noexcept { return state_ == MuxState::Listening; }
    const MuxConfig&                       config() const noexcept { return config_; }

  private:
    friend class ListenProtocol;

    UsbmuxConnection(boost::asio::io_context& io, MuxConfig config);

    void start(Completion<std::shared_ptr<UsbmuxConnection>> done);
    void fail_connect(MuxError error);

    // Listen connection events
    void on_listen_frame(Frame frame);
    void on_listen_error(const MuxError& error);
    void on_listen_lost(const Option<MuxError>& error);

    boost::asio::io_context&                      io_;
    MuxConfig                                     config_;
    std::shared_ptr<DeviceRegistry>               registry_;
    std::shared_ptr<Transport>                    transport_;
    MuxState                                      state_ = MuxState::Disconnected;
    Completion<std::shared_ptr<UsbmuxConnection>> connect_done_;
    // keeps the handle alive until the Listen handshake resolves
    std::shared_ptr<UsbmuxConnection>             pending_self_;
    uint32_t                                      next_tag_ = kDefaultMessageTag + 1;
};

void connect_to_usbmux(boost::asio::io_context&                       io,
                       MuxConfig                                      config,
                       Completion<std::shared_ptr<UsbmuxConnection>> done);

// Unix-like platforms use `socket_path` and Windows uses `socket_port` on
// the loopback interface; the other argument is ignored. When the
// platform's argument is None, MuxAddr::default_new() applies.
void connect_to_usbmux(boost::asio::io_context&                       io,
                       Option<std::string>                            socket_path,
                       Option<uint16_t>                               socket_port,
                       Completion<std::shared_ptr<UsbmuxConnection>> done);

} // namespace Usbmux
#endif
