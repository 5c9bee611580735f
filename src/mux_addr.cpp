// Jackson Coxson

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include <usbmux++/mux_addr.hpp>

#if defined(__unix__) || defined(__APPLE__)
#include <boost/asio/local/stream_protocol.hpp>
#include <sys/un.h>
#endif

namespace Usbmux {

MuxResult<MuxAddr> MuxAddr::tcp_new(const std::string& host, uint16_t port) {
    boost::system::error_code ec;
    boost::asio::ip::make_address(host, ec);
    if (ec) {
        return Err(MuxError::InvalidArgument(fmt::format("'{}' is not an IP address", host)));
    }
    if (port == 0) {
        return Err(MuxError::InvalidArgument("port must be non-zero"));
    }
    return Ok(MuxAddr(Kind::Tcp, "", host, port));
}

#if defined(__unix__) || defined(__APPLE__)
MuxResult<MuxAddr> MuxAddr::unix_new(const std::string& path) {
    if (path.empty()) {
        return Err(MuxError::InvalidArgument("socket path is empty"));
    }
    if (path.size() >= sizeof(sockaddr_un::sun_path)) {
        return Err(MuxError::InvalidArgument(fmt::format("socket path too long: {}", path)));
    }
    return Ok(MuxAddr(Kind::Unix, path, "", 0));
}
#endif

MuxResult<MuxAddr> MuxAddr::parse(const std::string& text) {
    static const std::string unix_prefix = "UNIX:";
    if (text.compare(0, unix_prefix.size(), unix_prefix) == 0) {
#if defined(__unix__) || defined(__APPLE__)
        return unix_new(text.substr(unix_prefix.size()));
#else
        return Err(MuxError::InvalidArgument("unix sockets are not supported on this platform"));
#endif
    }

    auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) {
        return Err(MuxError::InvalidArgument(fmt::format("malformed socket address '{}'", text)));
    }

    std::string host = text.substr(0, colon);
    // [::1]:27015
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }

    const std::string port_text = text.substr(colon + 1);
    char*             end       = nullptr;
    unsigned long     port      = std::strtoul(port_text.c_str(), &end, 10);
    if (*end != '\0' || port == 0 || port > 0xFFFF) {
        return Err(MuxError::InvalidArgument(fmt::format("malformed port '{}'", port_text)));
    }
    return tcp_new(host, static_cast<uint16_t>(port));
}

MuxAddr MuxAddr::default_new() {
    if (const char* env = std::getenv(kSocketAddressEnv)) {
        auto parsed = parse(env);
        if (parsed.is_ok()) {
            return std::move(parsed).unwrap();
        }
        spdlog::warn("usbmux: ignoring {}: {}", kSocketAddressEnv, parsed.unwrap_err().message);
    }
#if defined(_WIN32)
    return MuxAddr(Kind::Tcp, "", kDefaultSocketHost, kDefaultSocketPort);
#else
    return MuxAddr(Kind::Unix, kDefaultSocketPath, "", 0);
#endif
}

boost::asio::generic::stream_protocol::endpoint MuxAddr::endpoint() const {
#if defined(__unix__) || defined(__APPLE__)
    if (kind_ == Kind::Unix) {
        return boost::asio::generic::stream_protocol::endpoint(
            boost::asio::local::stream_protocol::endpoint(path_));
    }
#endif
    // validated in tcp_new
    return boost::asio::generic::stream_protocol::endpoint(
        boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address(host_), port_));
}

std::string MuxAddr::to_string() const {
    if (kind_ == Kind::Unix) {
        return "UNIX:" + path_;
    }
    if (host_.find(':') != std::string::npos) {
        return fmt::format("[{}]:{}", host_, port_);
    }
    return fmt::format("{}:{}", host_, port_);
}

} // namespace Usbmux
