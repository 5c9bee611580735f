// Jackson Coxson

#ifndef USBMUX_FRAME_CODEC_HPP
#define USBMUX_FRAME_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <usbmux++/error.hpp>
#include <usbmux++/option.hpp>
#include <usbmux++/plist_dict.hpp>
#include <vector>

namespace Usbmux {

constexpr size_t   kHeaderSize        = 16;
constexpr uint32_t kProtocolVersion   = 1;
constexpr uint32_t kPlistMessageType  = 8;
constexpr uint32_t kDefaultMessageTag = 1;
constexpr uint32_t kMaxFrameSize      = 16 * 1024 * 1024;

// All four fields are little-endian on the wire. `length` counts the header.
struct FrameHeader {
    uint32_t length       = 0;
    uint32_t version      = 0;
    uint32_t request_type = 0;
    uint32_t tag          = 0;
};

struct Frame {
    FrameHeader header;
    PlistDict   payload;
};

MuxResult<std::vector<uint8_t>> encode_frame(const PlistDict& message,
                                             uint32_t         tag = kDefaultMessageTag);

// Reassembles frames from an arbitrarily fragmented byte stream. Bytes of a
// partial frame stay buffered until the rest arrives.
class FrameDecoder {
  public:
    FrameDecoder() = default;

    void                    append(const uint8_t* data, size_t len);

    // Some(frame) when a complete frame is buffered, None when more bytes
    // are needed. A ProtocolError is sticky: the stream cannot be trusted
    // past a bad frame.
    MuxResult<Option<Frame>> next();

    // append() followed by next() until the buffer runs dry. Frames decoded
    // ahead of a bad one are returned; the error surfaces on the next call.
    MuxResult<std::vector<PlistDict>> feed(const uint8_t* data, size_t len);

    // Hands out whatever follows the last complete frame.
    std::vector<uint8_t>    take_buffered();

    size_t                  buffered() const noexcept { return buf_.size() - start_; }
    bool                    failed() const noexcept { return static_cast<bool>(error_); }

  private:
    void                 compact();

    std::vector<uint8_t> buf_;
    size_t               start_ = 0;
    MuxError             error_;
};

} // namespace Usbmux
#endif
