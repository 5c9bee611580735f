// Jackson Coxson

#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>
#include <spdlog/spdlog.h>
#include <usbmux++/transport.hpp>

namespace Usbmux {

void Transport::open(boost::asio::io_context&               io,
                     const MuxAddr&                         addr,
                     std::shared_ptr<StreamHandler>         handler,
                     Completion<std::shared_ptr<Transport>> done) {
    auto        socket = std::make_shared<Socket>(io);
    std::string where  = addr.to_string();

    // the socket is opened with the endpoint's protocol by async_connect
    socket->async_connect(
        addr.endpoint(),
        [socket, handler = std::move(handler), done = std::move(done), where](
            const boost::system::error_code& ec) mutable {
            if (ec) {
                spdlog::debug("usbmux: connect to {} failed: {}", where, ec.message());
                done(Err(MuxError::Io(ec)));
                return;
            }
            auto transport = adopt(std::move(*socket), std::move(handler));
            transport->start();
            done(Ok(transport));
        });
}

std::shared_ptr<Transport> Transport::adopt(Socket&& socket, std::shared_ptr<StreamHandler> handler) {
    return std::shared_ptr<Transport>(new Transport(std::move(socket), std::move(handler)));
}

Transport::Transport(Socket&& socket, std::shared_ptr<StreamHandler> handler)
    : socket_(std::move(socket)), handler_(std::move(handler)) {
}

Transport::~Transport() {
    shutdown_socket();
}

void Transport::start() {
    if (auto h = handler_) {
        h->connection_made(shared_from_this());
    }
    do_read();
}

void Transport::write(std::vector<uint8_t> data) {
    if (is_closing()) {
        spdlog::warn("usbmux: dropping {} byte write on closing transport", data.size());
        return;
    }
    if (data.empty()) {
        return;
    }
    bool idle = write_queue_.empty();
    write_queue_.push_back(std::move(data));
    if (idle) {
        do_write();
    }
}

void Transport::pause_reading() {
    paused_ = true;
}

void Transport::resume_reading() {
    if (closing_ || lost_ || !paused_) {
        return;
    }
    paused_ = false;
    if (!held_.empty() || held_eof_) {
        boost::asio::post(get_executor(), [self = shared_from_this()] { self->deliver_held(); });
        return;
    }
    do_read();
}

void Transport::close() {
    if (closing_ || lost_) {
        return;
    }
    closing_ = true;
    if (!write_queue_.empty()) {
        // on_write finishes the close once the queue drains
        return;
    }
    shutdown_socket();
    boost::asio::post(get_executor(), [self = shared_from_this()] { self->finish(None); });
}

void Transport::abort() {
    if (lost_) {
        return;
    }
    closing_ = true;
    write_queue_.clear();
    shutdown_socket();
    boost::asio::post(get_executor(), [self = shared_from_this()] { self->finish(None); });
}

void Transport::set_handler(std::shared_ptr<StreamHandler> handler) {
    handler_ = std::move(handler);
}

void Transport::do_read() {
    if (read_pending_ || !is_reading()) {
        return;
    }
    read_pending_ = true;
    socket_.async_read_some(boost::asio::buffer(read_buf_),
                            [self = shared_from_this()](const boost::system::error_code& ec,
                                                        size_t n) { self->on_read(ec, n); });
}

void Transport::on_read(const boost::system::error_code& ec, size_t n) {
    read_pending_ = false;
    if (lost_ || closing_) {
        return;
    }

    if (ec == boost::asio::error::eof) {
        if (paused_) {
            held_eof_ = true;
            return;
        }
        if (auto h = handler_) {
            h->eof_received();
        }
        close();
        return;
    }
    if (ec) {
        shutdown_socket();
        finish(Some(MuxError::Io(ec)));
        return;
    }

    if (paused_) {
        held_.insert(held_.end(), read_buf_.begin(), read_buf_.begin() + n);
        return;
    }

    // the handler may replace itself while handling the data
    if (auto h = handler_) {
        h->data_received(read_buf_.data(), n);
    }
    do_read();
}

void Transport::deliver_held() {
    if (!is_reading()) {
        return;
    }
    if (!held_.empty()) {
        std::vector<uint8_t> data;
        data.swap(held_);
        if (auto h = handler_) {
            h->data_received(data.data(), data.size());
        }
    }
    if (held_eof_ && is_reading()) {
        held_eof_ = false;
        if (auto h = handler_) {
            h->eof_received();
        }
        close();
        return;
    }
    do_read();
}

void Transport::do_write() {
    boost::asio::async_write(socket_,
                             boost::asio::buffer(write_queue_.front()),
                             [self = shared_from_this()](const boost::system::error_code& ec,
                                                         size_t n) { self->on_write(ec, n); });
}

void Transport::on_write(const boost::system::error_code& ec, size_t) {
    if (lost_) {
        return;
    }
    if (ec) {
        if (closing_ && ec == boost::asio::error::operation_aborted) {
            return;
        }
        write_queue_.clear();
        shutdown_socket();
        finish(Some(MuxError::Io(ec)));
        return;
    }

    write_queue_.pop_front();
    if (!write_queue_.empty()) {
        do_write();
    } else if (closing_) {
        shutdown_socket();
        finish(None);
    }
}

void Transport::shutdown_socket() {
    boost::system::error_code ignored;
    if (socket_.is_open()) {
        socket_.shutdown(Socket::shutdown_both, ignored);
        socket_.close(ignored);
    }
}

void Transport::finish(Option<MuxError> error) {
    if (lost_) {
        return;
    }
    lost_    = true;
    closing_ = true;
    held_.clear();
    // dropping the handler breaks the transport <-> handler reference cycle
    auto h = std::move(handler_);
    handler_.reset();
    if (h) {
        h->connection_lost(error);
    }
}

} // namespace Usbmux
