// Jackson Coxson

#ifndef USBMUX_MUX_ADDR_HPP
#define USBMUX_MUX_ADDR_HPP

#include <boost/asio/generic/stream_protocol.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <usbmux++/error.hpp>

namespace Usbmux {

constexpr const char* kDefaultSocketPath = "/var/run/usbmuxd";
constexpr const char* kDefaultSocketHost = "127.0.0.1";
constexpr uint16_t    kDefaultSocketPort = 27015;
// "UNIX:<path>" or "<host>:<port>"
constexpr const char* kSocketAddressEnv  = "USBMUXD_SOCKET_ADDRESS";

/// @brief Where the usbmux daemon listens.
/// @details A Unix domain socket on Unix-like platforms, a loopback TCP port
/// on Windows. Plain value type; resolving it into a socket endpoint happens
/// when a transport is opened.
class MuxAddr {
  public:
    enum class Kind : uint8_t { Unix = 1, Tcp = 2 };

    /// @brief Creates a TCP address.
    /// @param host An IPv4 or IPv6 literal.
    /// @param port The daemon's port.
    /// @return The address, or InvalidArgument if the host is not an IP literal.
    static MuxResult<MuxAddr> tcp_new(const std::string& host, uint16_t port);
#if defined(__unix__) || defined(__APPLE__)
    /// @brief Creates a Unix socket address.
    /// @param path The filesystem path of the socket.
    /// @return The address, or InvalidArgument if the path is empty or too long.
    static MuxResult<MuxAddr> unix_new(const std::string& path);
#endif
    /// @brief Parses the USBMUXD_SOCKET_ADDRESS syntax.
    static MuxResult<MuxAddr> parse(const std::string& text);

    /// @brief The platform default, overridden by USBMUXD_SOCKET_ADDRESS when
    /// it is set and valid.
    static MuxAddr            default_new();

    Kind                      kind() const noexcept { return kind_; }
    const std::string&        path() const noexcept { return path_; }
    const std::string&        host() const noexcept { return host_; }
    uint16_t                  port() const noexcept { return port_; }

    boost::asio::generic::stream_protocol::endpoint endpoint() const;
    std::string                                     to_string() const;

  private:
    MuxAddr(Kind kind, std::string path, std::string host, uint16_t port)
        : kind_(kind), path_(std::move(path)), host_(std::move(host)), port_(port) {}

    Kind        kind_;
    std::string path_;
    std::string host_;
    uint16_t    port_ = 0;
};

// Client identity sent with every request, plus the defaults of the
// high-level connect calls.
struct MuxConfig {
    MuxAddr                   addr           = MuxAddr::default_new();
    std::string               client_version = "usbmux++";
    std::string               prog_name      = "usbmux++";
    std::chrono::milliseconds default_max_wait{2000};
};

} // namespace Usbmux
#endif
