// Jackson Coxson

#include <boost/algorithm/string/predicate.hpp>
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>
#include <usbmux++/device_connector.hpp>
#include <usbmux++/usbmux.hpp>

namespace Usbmux {

// Reads the listen connection: the answer to Listen, then a stream of
// Attached and Detached notifications.
class ListenProtocol : public StreamHandler {
  public:
    ListenProtocol(std::weak_ptr<UsbmuxConnection> mux, MuxConfig identity)
        : mux_(std::move(mux)), identity_(std::move(identity)) {}

    void connection_made(const std::shared_ptr<Transport>& transport) override {
        transport_ = transport;
        auto frame = encode_frame(make_listen_request(identity_));
        if (frame.is_err()) {
            if (auto mux = mux_.lock()) {
                mux->on_listen_error(frame.unwrap_err());
            }
            transport->abort();
            return;
        }
        transport->write(std::move(frame).unwrap());
    }

    void data_received(const uint8_t* data, size_t len) override {
        decoder_.append(data, len);
        while (true) {
            auto next = decoder_.next();
            auto mux  = mux_.lock();
            if (next.is_err()) {
                if (mux) {
                    mux->on_listen_error(next.unwrap_err());
                }
                if (auto t = transport_.lock()) {
                    t->abort();
                }
                return;
            }
            auto frame = std::move(next).unwrap();
            if (frame.is_none() || !mux) {
                return;
            }
            mux->on_listen_frame(std::move(frame).unwrap());
        }
    }

    void connection_lost(const Option<MuxError>& error) override {
        if (auto mux = mux_.lock()) {
            mux->on_listen_lost(error);
        }
    }

  private:
    std::weak_ptr<UsbmuxConnection> mux_;
    MuxConfig                       identity_;
    std::weak_ptr<Transport>        transport_;
    FrameDecoder                    decoder_;
};

namespace {

// One connect_to_first_device() call.
struct FirstDeviceSearch : std::enable_shared_from_this<FirstDeviceSearch> {
    std::weak_ptr<UsbmuxConnection> mux;
    std::shared_ptr<AttachWatcher>  watcher;
    ProtocolFactory                 factory;
    uint16_t                        port;
    Deadline                        deadline;
    DeviceFilter                    filter;
    std::set<uint32_t>              seen;
    Completion<DeviceConnection>    done;

    FirstDeviceSearch(std::weak_ptr<UsbmuxConnection> m,
                      std::shared_ptr<AttachWatcher>  w,
                      ProtocolFactory                 f,
                      uint16_t                        p,
                      Option<Millis>                  max_wait,
                      DeviceFilter                    flt,
                      Completion<DeviceConnection>    cb)
        : mux(std::move(m)),
          watcher(std::move(w)),
          factory(std::move(f)),
          port(p),
          deadline(max_wait),
          filter(std::move(flt)),
          done(std::move(cb)) {}

    void next() {
        // a spent budget still allows one attempt, so a zero budget checks
        // the devices already attached
        if (deadline.expired() && !seen.empty()) {
            finish(Err(MuxError::Timeout("No available devices", true)));
            return;
        }
        auto self = shared_from_this();
        watcher->wait_for_next(deadline.remaining(), [self](MuxResult<DeviceEvent> res) {
            if (res.is_err()) {
                MuxError err = std::move(res).unwrap_err();
                if (err.kind == ErrorKind::Timeout) {
                    err = MuxError::Timeout("No available devices", !self->seen.empty());
                }
                self->finish(Err(err));
                return;
            }
            DeviceEvent ev = std::move(res).unwrap();
            if (ev.action != DeviceAction::Attached || self->seen.count(ev.device_id) ||
                !self->filter.accepts(ev.device_id)) {
                self->next();
                return;
            }
            self->try_device(ev.device_id);
        });
    }

    void try_device(uint32_t device_id) {
        seen.insert(device_id);
        auto m = mux.lock();
        if (!m) {
            finish(Err(MuxError::Closed("usbmux connection destroyed")));
            return;
        }
        auto self = shared_from_this();
        m->connect_to_device(factory, device_id, port, [self, device_id](MuxResult<DeviceConnection> res) {
            if (res.is_ok()) {
                self->finish(std::move(res));
                return;
            }
            const MuxError& err = res.unwrap_err();
            if (!err.is_usbmux_error()) {
                self->finish(std::move(res));
                return;
            }
            spdlog::debug("usbmux: device {} unavailable ({}), trying the next one",
                          device_id,
                          err.to_string());
            self->next();
        });
    }

    void finish(MuxResult<DeviceConnection> res) {
        auto cb = std::move(done);
        done    = nullptr;
        watcher.reset();
        if (cb) {
            cb(std::move(res));
        }
    }
};

// One wait_for_serial() call.
struct SerialWait : std::enable_shared_from_this<SerialWait> {
    std::shared_ptr<AttachWatcher> watcher;
    std::string                    serial;
    Deadline                       deadline;
    Completion<uint32_t>           done;

    SerialWait(std::shared_ptr<AttachWatcher> w, std::string s, Option<Millis> timeout, Completion<uint32_t> cb)
        : watcher(std::move(w)), serial(std::move(s)), deadline(timeout), done(std::move(cb)) {}

    void next() {
        auto self = shared_from_this();
        watcher->wait_for_next(deadline.remaining(), [self](MuxResult<DeviceEvent> res) {
            if (res.is_err()) {
                MuxError err = std::move(res).unwrap_err();
                if (err.kind == ErrorKind::Timeout) {
                    err = MuxError::Timeout(
                        fmt::format("No device with serial {} attached", self->serial), false);
                }
                self->finish(Err(err));
                return;
            }
            const DeviceEvent& ev = res.unwrap();
            if (ev.action == DeviceAction::Attached) {
                auto sn = ev.properties.get_string("SerialNumber");
                if (sn.is_some() && boost::algorithm::iequals(sn.unwrap(), self->serial)) {
                    self->finish(Ok(ev.device_id));
                    return;
                }
            }
            self->next();
        });
    }

    void finish(MuxResult<uint32_t> res) {
        auto cb = std::move(done);
        done    = nullptr;
        watcher.reset();
        if (cb) {
            cb(std::move(res));
        }
    }
};

template <typename T> void post_result(boost::asio::io_context& io, Completion<T> done, MuxError err) {
    boost::asio::post(io, [done = std::move(done), err = std::move(err)] { done(Err(err)); });
}

} // namespace

const char* to_string(MuxState state) noexcept {
    switch (state) {
    case MuxState::Disconnected:
        return "disconnected";
    case MuxState::Connecting:
        return "connecting";
    case MuxState::Listening:
        return "listening";
    case MuxState::Closed:
        return "closed";
    }
    return "unknown";
}

bool DeviceFilter::accepts(uint32_t device_id) const {
    if (exclude.count(device_id)) {
        return false;
    }
    return include.is_none() || include.unwrap().count(device_id) != 0;
}

// ---------- UsbmuxConnection ----------
UsbmuxConnection::UsbmuxConnection(boost::asio::io_context& io, MuxConfig config)
    : io_(io), config_(std::move(config)), registry_(DeviceRegistry::create(io)) {
}

UsbmuxConnection::~UsbmuxConnection() {
    if (transport_) {
        transport_->abort();
    }
    registry_->close(MuxError::Closed("usbmux connection destroyed"));
}

void UsbmuxConnection::connect(boost::asio::io_context&                       io,
                               MuxConfig                                      config,
                               Completion<std::shared_ptr<UsbmuxConnection>> done) {
    auto mux = std::shared_ptr<UsbmuxConnection>(new UsbmuxConnection(io, std::move(config)));
    mux->start(std::move(done));
}

void UsbmuxConnection::start(Completion<std::shared_ptr<UsbmuxConnection>> done) {
    state_        = MuxState::Connecting;
    connect_done_ = std::move(done);
    pending_self_ = shared_from_this();

    spdlog::debug("usbmux: connecting to {}", config_.addr.to_string());
    auto listener = std::make_shared<ListenProtocol>(weak_from_this(), config_);
    Transport::open(io_,
                    config_.addr,
                    listener,
                    [weak = weak_from_this()](MuxResult<std::shared_ptr<Transport>> res) {
                        auto self = weak.lock();
                        if (!self) {
                            if (res.is_ok()) {
                                res.unwrap()->abort();
                            }
                            return;
                        }
                        if (res.is_err()) {
                            self->fail_connect(std::move(res).unwrap_err());
                            return;
                        }
                        self->transport_ = std::move(res).unwrap();
                        // close() may have run while the socket was connecting
                        if (self->state_ == MuxState::Closed) {
                            self->transport_->abort();
                        }
                    });
}

void UsbmuxConnection::fail_connect(MuxError error) {
    spdlog::error("usbmux: listen handshake failed: {}", error.to_string());
    state_ = MuxState::Closed;
    registry_->close(error);

    auto self = std::move(pending_self_);
    pending_self_.reset();
    auto cb = std::move(connect_done_);
    connect_done_ = nullptr;
    if (cb) {
        cb(Err(error));
    }
}

void UsbmuxConnection::on_listen_frame(Frame frame) {
    if (state_ == MuxState::Closed) {
        return;
    }
    auto type = frame.payload.get_string("MessageType");
    if (type.is_none()) {
        spdlog::warn("usbmux: ignoring message without MessageType");
        return;
    }
    const std::string& kind = type.unwrap();

    if (kind == "Result") {
        if (state_ != MuxState::Connecting) {
            spdlog::debug("usbmux: ignoring unsolicited Result (tag {})", frame.header.tag);
            return;
        }
        uint64_t number = frame.payload.get_uint("Number").unwrap_or(UINT64_MAX);
        if (number != 0) {
            if (transport_) {
                transport_->close();
            }
            fail_connect(MuxError::ConnectionFailed(
                fmt::format("daemon rejected Listen with Result {}", number),
                static_cast<int32_t>(number)));
            return;
        }
        spdlog::info("usbmux: listening on {}", config_.addr.to_string());
        state_        = MuxState::Listening;
        auto self     = std::move(pending_self_);
        pending_self_.reset();
        auto cb       = std::move(connect_done_);
        connect_done_ = nullptr;
        if (cb) {
            cb(Ok(self));
        }
        return;
    }

    if (kind == "Attached") {
        auto props = frame.payload.get_dict("Properties");
        if (props.is_none()) {
            spdlog::warn("usbmux: Attached message without Properties");
            return;
        }
        auto id = props.unwrap().get_uint("DeviceID");
        if (id.is_none()) {
            spdlog::warn("usbmux: Attached message without DeviceID");
            return;
        }
        registry_->device_attached(static_cast<uint32_t>(id.unwrap()), std::move(props).unwrap());
        return;
    }

    if (kind == "Detached") {
        auto id = frame.payload.get_uint("DeviceID");
        if (id.is_none()) {
            spdlog::warn("usbmux: Detached message without DeviceID");
            return;
        }
        registry_->device_detached(static_cast<uint32_t>(id.unwrap()));
        return;
    }

    spdlog::debug("usbmux: ignoring {} message", kind);
}

void UsbmuxConnection::on_listen_error(const MuxError& error) {
    if (state_ == MuxState::Connecting) {
        fail_connect(error);
        return;
    }
    if (state_ == MuxState::Listening) {
        spdlog::error("usbmux: listen connection unusable: {}", error.to_string());
        state_ = MuxState::Closed;
        registry_->close(error);
    }
}

void UsbmuxConnection::on_listen_lost(const Option<MuxError>& error) {
    if (state_ == MuxState::Connecting) {
        fail_connect(error.is_some()
                         ? error.unwrap()
                         : MuxError::ConnectionFailed("daemon closed the connection before answering Listen"));
        return;
    }
    if (state_ == MuxState::Listening) {
        spdlog::warn("usbmux: listen connection lost");
        state_ = MuxState::Closed;
        registry_->close(error.is_some() ? error.unwrap()
                                         : MuxError::Closed("daemon closed the listen connection"));
    }
}

void UsbmuxConnection::close() {
    if (state_ == MuxState::Closed) {
        return;
    }
    if (transport_) {
        transport_->close();
    }
    if (state_ == MuxState::Connecting) {
        fail_connect(MuxError::Closed("usbmux connection closed"));
        return;
    }
    state_ = MuxState::Closed;
    registry_->close(MuxError::Closed("usbmux connection closed"));
}

std::shared_ptr<AttachWatcher> UsbmuxConnection::attach_watcher(bool include_existing) {
    return registry_->watch(include_existing);
}

void UsbmuxConnection::connect_to_device(ProtocolFactory              factory,
                                         uint32_t                     device_id,
                                         uint16_t                     port,
                                         Completion<DeviceConnection> done) {
    if (!factory) {
        post_result(io_, std::move(done), MuxError::InvalidArgument("no protocol factory given"));
        return;
    }

    uint32_t tag      = next_tag_++;
    auto     result   = std::make_shared<Completion<DeviceConnection>>(std::move(done));
    auto     switcher = std::make_shared<std::shared_ptr<ProtocolSwitcher>>();

    auto connector = std::make_shared<DeviceConnector>(
        config_,
        device_id,
        port,
        tag,
        [switcher, factory, device_id, result, registry = std::weak_ptr<DeviceRegistry>(registry_)](
            MuxResult<std::vector<uint8_t>> res) {
            // the switcher owns this connector; drop the back reference
            auto sw = std::move(*switcher);
            switcher->reset();

            if (res.is_err()) {
                (*result)(Err(std::move(res).unwrap_err()));
                return;
            }
            auto transport = sw ? sw->transport() : nullptr;
            if (!transport) {
                (*result)(Err(MuxError::ConnectionFailed("transport gone after Result")));
                return;
            }

            auto installed = sw->switch_protocol(factory, std::move(res).unwrap());
            if (installed.is_err()) {
                transport->abort();
                (*result)(Err(std::move(installed).unwrap_err()));
                return;
            }

            PlistDict info;
            if (auto reg = registry.lock()) {
                auto known = reg->properties(device_id);
                if (known.is_some()) {
                    info = std::move(known).unwrap();
                }
            }
            (*result)(Ok(DeviceConnection{device_id, std::move(info), transport, installed.unwrap()}));
        });

    *switcher = std::make_shared<ProtocolSwitcher>(connector);
    Transport::open(io_, config_.addr, *switcher, [switcher, result](MuxResult<std::shared_ptr<Transport>> res) {
        if (res.is_ok()) {
            return;
        }
        // the connector never ran; resolve here and break the cycle
        switcher->reset();
        (*result)(Err(std::move(res).unwrap_err()));
    });
}

void UsbmuxConnection::connect_to_first_device(ProtocolFactory              factory,
                                               uint16_t                     port,
                                               Option<Millis>               max_wait,
                                               Completion<DeviceConnection> done,
                                               DeviceFilter                 filter) {
    if (!factory) {
        post_result(io_, std::move(done), MuxError::InvalidArgument("no protocol factory given"));
        return;
    }
    auto search = std::make_shared<FirstDeviceSearch>(weak_from_this(),
                                                      registry_->watch(true),
                                                      std::move(factory),
                                                      port,
                                                      max_wait,
                                                      std::move(filter),
                                                      std::move(done));
    search->next();
}

void UsbmuxConnection::connect_to_first_device(ProtocolFactory              factory,
                                               uint16_t                     port,
                                               Completion<DeviceConnection> done) {
    connect_to_first_device(std::move(factory), port, Some(config_.default_max_wait), std::move(done));
}

void UsbmuxConnection::wait_for_attach(Option<Millis> timeout, Completion<uint32_t> done) {
    registry_->wait_for_attach(timeout, std::move(done));
}

void UsbmuxConnection::wait_for_serial(std::string serial, Option<Millis> timeout, Completion<uint32_t> done) {
    if (serial.empty()) {
        post_result(io_, std::move(done), MuxError::InvalidArgument("empty serial number"));
        return;
    }
    auto wait = std::make_shared<SerialWait>(registry_->watch(true), std::move(serial), timeout, std::move(done));
    wait->next();
}

// ---------- free functions ----------
void connect_to_usbmux(boost::asio::io_context&                       io,
                       MuxConfig                                      config,
                       Completion<std::shared_ptr<UsbmuxConnection>> done) {
    UsbmuxConnection::connect(io, std::move(config), std::move(done));
}

void connect_to_usbmux(boost::asio::io_context&                       io,
                       Option<std::string>                            socket_path,
                       Option<uint16_t>                               socket_port,
                       Completion<std::shared_ptr<UsbmuxConnection>> done) {
    // the platform decides the transport; the other argument is ignored
    MuxConfig config;
#if defined(__unix__) || defined(__APPLE__)
    (void)socket_port;
    if (socket_path.is_some()) {
        auto addr = MuxAddr::unix_new(socket_path.unwrap());
        if (addr.is_err()) {
            post_result(io, std::move(done), std::move(addr).unwrap_err());
            return;
        }
        config.addr = std::move(addr).unwrap();
    }
#else
    (void)socket_path;
    if (socket_port.is_some()) {
        auto addr = MuxAddr::tcp_new(kDefaultSocketHost, socket_port.unwrap());
        if (addr.is_err()) {
            post_result(io, std::move(done), std::move(addr).unwrap_err());
            return;
        }
        config.addr = std::move(addr).unwrap();
    }
#endif
    UsbmuxConnection::connect(io, std::move(config), std::move(done));
}

} // namespace Usbmux
