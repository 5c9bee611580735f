// Jackson Coxson

#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <usbmux++/logging.hpp>
#include <vector>

namespace Usbmux {

namespace {

constexpr const char* kLoggerName = "usbmux";

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
    case LogLevel::Disabled:
        return spdlog::level::off;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Trace:
        return spdlog::level::trace;
    }
    return spdlog::level::info;
}

} // namespace

MuxResult<void> init_logger(LogLevel console_level, LogLevel file_level, Option<std::string> file_path) {
    if (file_level != LogLevel::Disabled && file_path.is_none()) {
        return Err(MuxError::InvalidArgument("file logging requested without a file path"));
    }

    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_level(to_spdlog(console_level));
    sinks.push_back(console);

    if (file_level != LogLevel::Disabled) {
        try {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path.unwrap());
            file->set_level(to_spdlog(file_level));
            sinks.push_back(file);
        } catch (const spdlog::spdlog_ex& e) {
            return Err(MuxError(ErrorKind::Io, 0, e.what()));
        }
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    // the sinks filter on their own levels
    logger->set_level(spdlog::level::trace);
    logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");

    spdlog::drop(kLoggerName);
    spdlog::set_default_logger(logger);
    return Ok();
}

} // namespace Usbmux
