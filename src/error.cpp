// Jackson Coxson

#include <spdlog/fmt/fmt.h>
#include <usbmux++/error.hpp>

namespace Usbmux {

namespace {
// Result numbers sent by the daemon
constexpr uint64_t kResultOk          = 0;
constexpr uint64_t kResultBadDevice   = 2;
constexpr uint64_t kResultConnRefused = 3;
} // namespace

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::ProtocolError:
        return "ProtocolError";
    case ErrorKind::DeviceNotConnected:
        return "DeviceNotConnected";
    case ErrorKind::ConnectionRefused:
        return "ConnectionRefused";
    case ErrorKind::ConnectionFailed:
        return "ConnectionFailed";
    case ErrorKind::Timeout:
        return "Timeout";
    case ErrorKind::Io:
        return "Io";
    case ErrorKind::InvalidArgument:
        return "InvalidArgument";
    case ErrorKind::Closed:
        return "Closed";
    }
    return "UnknownErrorKind";
}

MuxError::MuxError() : kind(ErrorKind::None), code(0), message("") {
}

MuxError::MuxError(ErrorKind kind, int32_t code, std::string message)
    : kind(kind), code(code), message(std::move(message)) {
}

bool MuxError::is_usbmux_error() const noexcept {
    switch (kind) {
    case ErrorKind::ProtocolError:
    case ErrorKind::DeviceNotConnected:
    case ErrorKind::ConnectionRefused:
    case ErrorKind::ConnectionFailed:
        return true;
    default:
        return false;
    }
}

std::string MuxError::to_string() const {
    if (message.empty()) {
        return Usbmux::to_string(kind);
    }
    return fmt::format("{}: {}", Usbmux::to_string(kind), message);
}

MuxError MuxError::ProtocolError(std::string message) {
    return MuxError(ErrorKind::ProtocolError, 0, std::move(message));
}

MuxError MuxError::DeviceNotConnected(uint32_t device_id) {
    return MuxError(ErrorKind::DeviceNotConnected,
                    static_cast<int32_t>(kResultBadDevice),
                    fmt::format("Device {} is not currently connected", device_id));
}

MuxError MuxError::ConnectionRefused(uint32_t device_id, uint16_t port) {
    return MuxError(ErrorKind::ConnectionRefused,
                    static_cast<int32_t>(kResultConnRefused),
                    fmt::format("Connection refused to device_id={} port={}", device_id, port));
}

MuxError MuxError::ConnectionFailed(std::string message, int32_t number) {
    return MuxError(ErrorKind::ConnectionFailed, number, std::move(message));
}

MuxError MuxError::Timeout(std::string message, bool found_any) {
    MuxError err(ErrorKind::Timeout, 0, std::move(message));
    err.found_any_ = found_any;
    return err;
}

MuxError MuxError::Io(const boost::system::error_code& ec) {
    return MuxError(ErrorKind::Io, ec.value(), ec.message());
}

MuxError MuxError::InvalidArgument(std::string message) {
    return MuxError(ErrorKind::InvalidArgument, 0, std::move(message));
}

MuxError MuxError::Closed(std::string message) {
    return MuxError(ErrorKind::Closed, 0, std::move(message));
}

MuxError MuxError::from_result_number(uint64_t number, uint32_t device_id, uint16_t port) {
    switch (number) {
    case kResultOk:
        return MuxError();
    case kResultBadDevice:
        return DeviceNotConnected(device_id);
    case kResultConnRefused:
        return ConnectionRefused(device_id, port);
    default:
        return ConnectionFailed(
            fmt::format("Protocol error connecting to device {} (result {})", device_id, number),
            static_cast<int32_t>(number));
    }
}

} // namespace Usbmux
