// Jackson Coxson

#ifndef USBMUX_TRANSPORT_HPP
#define USBMUX_TRANSPORT_HPP

#include <array>
#include <boost/asio/generic/stream_protocol.hpp>
#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <usbmux++/error.hpp>
#include <usbmux++/mux_addr.hpp>
#include <usbmux++/option.hpp>
#include <vector>

namespace Usbmux {

class Transport;

// Receives the lifecycle events and bytes of one transport. Exactly one
// handler is installed on a transport at any time.
class StreamHandler {
  public:
    virtual ~StreamHandler() = default;

    virtual void connection_made(const std::shared_ptr<Transport>& transport) = 0;
    virtual void data_received(const uint8_t* data, size_t len)                = 0;
    virtual void eof_received() {}
    // None on an orderly close.
    virtual void connection_lost(const Option<MuxError>& error)                = 0;
};

using ProtocolFactory = std::function<std::shared_ptr<StreamHandler>()>;

// One non-blocking stream socket to the daemon, driven by an io_context.
// All methods must be called from the thread running that io_context.
class Transport : public std::enable_shared_from_this<Transport> {
  public:
    using Socket = boost::asio::generic::stream_protocol::socket;

    // Connects to `addr`; on success calls handler->connection_made() and
    // starts reading before `done` runs.
    static void open(boost::asio::io_context&                    io,
                     const MuxAddr&                              addr,
                     std::shared_ptr<StreamHandler>              handler,
                     Completion<std::shared_ptr<Transport>>      done);

    // Wraps a socket that is already connected. Call start() to deliver
    // connection_made() and begin reading.
    static std::shared_ptr<Transport> adopt(Socket&& socket, std::shared_ptr<StreamHandler> handler);

    ~Transport();
    Transport(const Transport&)            = delete;
    Transport& operator=(const Transport&) = delete;

    void start();

    void write(std::vector<uint8_t> data);
    void write(const uint8_t* data, size_t len) { write(std::vector<uint8_t>(data, data + len)); }

    // While paused no data_received() or eof_received() is delivered; bytes
    // that are already in flight are held back until resume_reading().
    void pause_reading();
    void resume_reading();
    bool is_reading() const noexcept { return !paused_ && !closing_ && !lost_; }

    // Flushes queued writes, then closes. connection_lost(None) follows.
    void close();
    // Closes immediately, dropping queued writes.
    void abort();
    bool is_closing() const noexcept { return closing_ || lost_; }

    void                                  set_handler(std::shared_ptr<StreamHandler> handler);
    const std::shared_ptr<StreamHandler>& handler() const noexcept { return handler_; }

    Socket::executor_type                 get_executor() { return socket_.get_executor(); }

  private:
    Transport(Socket&& socket, std::shared_ptr<StreamHandler> handler);

    void do_read();
    void on_read(const boost::system::error_code& ec, size_t n);
    void deliver_held();
    void do_write();
    void on_write(const boost::system::error_code& ec, size_t n);
    void shutdown_socket();
    void finish(Option<MuxError> error);

    Socket                           socket_;
    std::shared_ptr<StreamHandler>   handler_;
    std::array<uint8_t, 16 * 1024>   read_buf_{};
    std::vector<uint8_t>             held_;
    bool                             held_eof_     = false;
    std::deque<std::vector<uint8_t>> write_queue_;
    bool                             read_pending_ = false;
    bool                             paused_       = false;
    bool                             closing_      = false;
    bool                             lost_         = false;
};

} // namespace Usbmux
#endif
