// Jackson Coxson

#ifndef USBMUX_LOGGING_HPP
#define USBMUX_LOGGING_HPP

#include <cstdint>
#include <string>
#include <usbmux++/error.hpp>
#include <usbmux++/option.hpp>

namespace Usbmux {

enum class LogLevel : uint8_t {
    Disabled = 0,
    Error    = 1,
    Warn     = 2,
    Info     = 3,
    Debug    = 4,
    Trace    = 5,
};

/// @brief Routes the library's log output.
/// @details Installs a logger named "usbmux" as the spdlog default, with a
/// colored stderr sink at `console_level` and, when `file_path` is given, a
/// file sink at `file_level`. Calling it again replaces the previous setup.
/// @return InvalidArgument if a file sink was requested without a path, Io if
/// the log file cannot be opened.
MuxResult<void> init_logger(LogLevel console_level,
                            LogLevel file_level,
                            Option<std::string> file_path = None);

} // namespace Usbmux
#endif
