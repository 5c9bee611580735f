// Jackson Coxson

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>
#include <usbmux++/protocol_switcher.hpp>

namespace Usbmux {

ProtocolSwitcher::ProtocolSwitcher(std::shared_ptr<StreamHandler> initial)
    : protocol_(std::move(initial)) {
}

MuxResult<std::shared_ptr<StreamHandler>>
ProtocolSwitcher::switch_protocol(const ProtocolFactory& factory, std::vector<uint8_t> carry_over) {
    auto transport = transport_.lock();
    if (transport && transport->is_reading()) {
        return Err(MuxError::InvalidArgument("transport must be paused before switching protocols"));
    }
    if (switching_) {
        return Err(MuxError::InvalidArgument("a protocol switch is already in progress"));
    }

    std::shared_ptr<StreamHandler> next = factory ? factory() : nullptr;
    if (!next) {
        return Err(MuxError::InvalidArgument("protocol factory returned no handler"));
    }

    protocol_ = next;
    if (!transport) {
        // not connected yet; connection_made() will reach the new handler directly
        return Ok(next);
    }

    switching_ = true;
    boost::asio::post(transport->get_executor(),
                      [self = shared_from_this(), transport, carry = std::move(carry_over)]() mutable {
                          self->complete_switch(transport, std::move(carry));
                      });
    return Ok(next);
}

void ProtocolSwitcher::complete_switch(const std::shared_ptr<Transport>& transport,
                                       std::vector<uint8_t>              carry_over) {
    switching_ = false;
    auto proto = protocol_;

    proto->connection_made(transport);
    if (!carry_over.empty() && !lost_) {
        spdlog::debug("usbmux: handing {} buffered bytes to the new protocol", carry_over.size());
        proto->data_received(carry_over.data(), carry_over.size());
    }

    if (lost_) {
        proto->connection_lost(lost_error_);
        return;
    }
    transport->resume_reading();
}

void ProtocolSwitcher::connection_made(const std::shared_ptr<Transport>& transport) {
    transport_ = transport;
    auto proto = protocol_;
    proto->connection_made(transport);
}

// The handler may switch protocols from inside these calls, which replaces
// protocol_; the local copy keeps it alive until it returns.
void ProtocolSwitcher::data_received(const uint8_t* data, size_t len) {
    auto proto = protocol_;
    proto->data_received(data, len);
}

void ProtocolSwitcher::eof_received() {
    auto proto = protocol_;
    proto->eof_received();
}

void ProtocolSwitcher::connection_lost(const Option<MuxError>& error) {
    lost_ = true;
    if (switching_) {
        // delivered after the new handler has seen connection_made()
        lost_error_ = error;
        return;
    }
    auto proto = protocol_;
    proto->connection_lost(error);
}

} // namespace Usbmux
