// Jackson Coxson

#include <algorithm>
#include <boost/endian/conversion.hpp>
#include <spdlog/spdlog.h>
#include <usbmux++/frame_codec.hpp>

namespace Usbmux {

namespace {
constexpr size_t kCompactThreshold = 64 * 1024;

FrameHeader read_header(const uint8_t* p) {
    FrameHeader h;
    h.length       = boost::endian::load_little_u32(p);
    h.version      = boost::endian::load_little_u32(p + 4);
    h.request_type = boost::endian::load_little_u32(p + 8);
    h.tag          = boost::endian::load_little_u32(p + 12);
    return h;
}
} // namespace

MuxResult<std::vector<uint8_t>> encode_frame(const PlistDict& message, uint32_t tag) {
    auto xml = message.to_xml();
    if (xml.is_err()) {
        return Err(xml.unwrap_err());
    }
    const std::string& body = xml.unwrap();

    if (body.size() > kMaxFrameSize - kHeaderSize) {
        return Err(MuxError::InvalidArgument("message too large for a single frame"));
    }

    std::vector<uint8_t> out(kHeaderSize + body.size());
    uint8_t*             p = out.data();
    boost::endian::store_little_u32(p, static_cast<uint32_t>(out.size()));
    boost::endian::store_little_u32(p + 4, kProtocolVersion);
    boost::endian::store_little_u32(p + 8, kPlistMessageType);
    boost::endian::store_little_u32(p + 12, tag);
    std::copy(body.begin(), body.end(), out.begin() + kHeaderSize);
    return Ok(std::move(out));
}

void FrameDecoder::append(const uint8_t* data, size_t len) {
    if (len == 0 || error_) {
        return;
    }
    buf_.insert(buf_.end(), data, data + len);
}

MuxResult<Option<Frame>> FrameDecoder::next() {
    if (error_) {
        return Err(error_);
    }

    // the header has to be complete before the declared length can be checked
    if (buffered() < kHeaderSize) {
        return Ok(Option<Frame>(None));
    }

    const uint8_t* p      = buf_.data() + start_;
    FrameHeader    header = read_header(p);

    if (header.length < kHeaderSize || header.length > kMaxFrameSize) {
        error_ = MuxError::ProtocolError(
            fmt::format("invalid frame length {} in usbmux stream", header.length));
        spdlog::error("usbmux: {}", error_.message);
        return Err(error_);
    }
    if (buffered() < header.length) {
        return Ok(Option<Frame>(None));
    }
    if (header.version != kProtocolVersion) {
        error_ = MuxError::ProtocolError(fmt::format(
            "Unsupported protocol version {} from usbmux stream", header.version));
        spdlog::error("usbmux: {}", error_.message);
        return Err(error_);
    }

    auto payload = PlistDict::from_bytes(p + kHeaderSize, header.length - kHeaderSize);
    if (payload.is_err()) {
        error_ = payload.unwrap_err();
        spdlog::error("usbmux: bad frame payload: {}", error_.message);
        return Err(error_);
    }

    start_ += header.length;
    compact();

    return Ok(Option<Frame>(Frame{header, std::move(payload).unwrap()}));
}

MuxResult<std::vector<PlistDict>> FrameDecoder::feed(const uint8_t* data, size_t len) {
    append(data, len);

    std::vector<PlistDict> out;
    while (true) {
        auto res = next();
        if (res.is_err()) {
            // frames ahead of the bad one still count; the error is sticky and
            // comes back on the next call
            if (!out.empty()) {
                break;
            }
            return Err(res.unwrap_err());
        }
        Option<Frame> frame = std::move(res).unwrap();
        if (frame.is_none()) {
            break;
        }
        out.push_back(std::move(frame.unwrap().payload));
    }
    return Ok(std::move(out));
}

std::vector<uint8_t> FrameDecoder::take_buffered() {
    std::vector<uint8_t> out(buf_.begin() + static_cast<std::ptrdiff_t>(start_), buf_.end());
    buf_.clear();
    start_ = 0;
    return out;
}

void FrameDecoder::compact() {
    if (start_ == buf_.size()) {
        buf_.clear();
        start_ = 0;
    } else if (start_ >= kCompactThreshold) {
        buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(start_));
        start_ = 0;
    }
}

} // namespace Usbmux
