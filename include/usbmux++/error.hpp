// Jackson Coxson

#ifndef USBMUX_ERROR_HPP
#define USBMUX_ERROR_HPP

#include <boost/system/error_code.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <usbmux++/result.hpp>

namespace Usbmux {

enum class ErrorKind : int32_t {
    None               = 0,
    ProtocolError      = -1,
    DeviceNotConnected = -2,
    ConnectionRefused  = -3,
    ConnectionFailed   = -4,
    Timeout            = -5,
    Io                 = -6,
    InvalidArgument    = -7,
    Closed             = -8,
};

const char* to_string(ErrorKind kind) noexcept;

class MuxError {
  public:
    ErrorKind   kind = ErrorKind::None;
    // Daemon result number, socket error value, or 0.
    int32_t     code = 0;
    std::string message;

    MuxError();
    MuxError(ErrorKind kind, int32_t code, std::string message);

    explicit operator bool() const { return kind != ErrorKind::None; }

    // ProtocolError, DeviceNotConnected, ConnectionRefused and ConnectionFailed.
    // Anything else means the mux itself is unusable.
    bool        is_usbmux_error() const noexcept;

    // Only meaningful for Timeout: whether a candidate device was seen and
    // failed before the deadline.
    bool        found_any() const noexcept { return found_any_; }

    std::string to_string() const;

    static MuxError ProtocolError(std::string message);
    static MuxError DeviceNotConnected(uint32_t device_id);
    static MuxError ConnectionRefused(uint32_t device_id, uint16_t port);
    static MuxError ConnectionFailed(std::string message, int32_t number = 0);
    static MuxError Timeout(std::string message, bool found_any);
    static MuxError Io(const boost::system::error_code& ec);
    static MuxError InvalidArgument(std::string message);
    static MuxError Closed(std::string message);

    // Maps the Number of a Result reply to a connect request.
    static MuxError from_result_number(uint64_t number, uint32_t device_id, uint16_t port);

  private:
    bool found_any_ = false;
};

template <typename T> using MuxResult  = Result<T, MuxError>;
template <typename T> using Completion = std::function<void(Result<T, MuxError>)>;

} // namespace Usbmux
#endif
