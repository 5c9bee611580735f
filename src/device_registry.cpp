// Jackson Coxson

#include <algorithm>
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>
#include <usbmux++/device_registry.hpp>

namespace Usbmux {

namespace {

// Waits on a private watcher until an Attached event shows up.
struct AttachWait : std::enable_shared_from_this<AttachWait> {
    std::shared_ptr<AttachWatcher> watcher;
    Deadline                       deadline;
    Completion<uint32_t>           done;

    AttachWait(std::shared_ptr<AttachWatcher> w, Option<Millis> timeout, Completion<uint32_t> cb)
        : watcher(std::move(w)), deadline(timeout), done(std::move(cb)) {}

    void next() {
        auto self = shared_from_this();
        watcher->wait_for_next(deadline.remaining(), [self](MuxResult<DeviceEvent> res) {
            if (res.is_err()) {
                MuxError err = std::move(res).unwrap_err();
                if (err.kind == ErrorKind::Timeout) {
                    err = MuxError::Timeout("No device attached before the timeout", false);
                }
                self->finish(Err(err));
                return;
            }
            const DeviceEvent& ev = res.unwrap();
            if (ev.action != DeviceAction::Attached) {
                self->next();
                return;
            }
            self->finish(Ok(ev.device_id));
        });
    }

    void finish(MuxResult<uint32_t> res) {
        auto cb = std::move(done);
        done    = nullptr;
        // drops the registration so a late attach cannot reach this wait
        watcher.reset();
        if (cb) {
            cb(std::move(res));
        }
    }
};

} // namespace

const char* to_string(DeviceAction action) noexcept {
    switch (action) {
    case DeviceAction::Attached:
        return "attached";
    case DeviceAction::Detached:
        return "detached";
    }
    return "unknown";
}

// ---------- AttachWatcher ----------
AttachWatcher::AttachWatcher(boost::asio::io_context& io, std::weak_ptr<DeviceRegistry> registry)
    : io_(io), registry_(std::move(registry)), timer_(io) {
}

AttachWatcher::~AttachWatcher() {
    if (waiter_) {
        boost::asio::post(io_, [cb = std::move(waiter_)] {
            cb(Err(MuxError::Closed("attach watcher destroyed while waiting")));
        });
    }
    if (auto registry = registry_.lock()) {
        registry->prune_watchers();
    }
}

void AttachWatcher::wait_for_next(Option<Millis> timeout, Completion<DeviceEvent> done) {
    if (waiter_) {
        boost::asio::post(io_, [done = std::move(done)] {
            done(Err(MuxError::InvalidArgument("a wait is already pending on this watcher")));
        });
        return;
    }

    if (!queue_.empty()) {
        auto ev = std::make_shared<DeviceEvent>(std::move(queue_.front()));
        queue_.pop_front();
        boost::asio::post(io_, [done = std::move(done), ev] { done(Ok(std::move(*ev))); });
        return;
    }

    if (closed_.is_some()) {
        std::string reason = closed_.unwrap().message;
        boost::asio::post(io_, [done = std::move(done), reason] {
            done(Err(MuxError::Closed(reason)));
        });
        return;
    }

    if (timeout.is_some() && timeout.unwrap().count() <= 0) {
        boost::asio::post(io_, [done = std::move(done)] {
            done(Err(MuxError::Timeout("no device event before the deadline", false)));
        });
        return;
    }

    waiter_     = std::move(done);
    uint64_t id = ++wait_id_;
    if (timeout.is_some()) {
        timer_.expires_after(timeout.unwrap());
        timer_.async_wait([weak = weak_from_this(), id](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            auto self = weak.lock();
            // an event may have won the race after the timer fired
            if (!self || !self->waiter_ || self->wait_id_ != id) {
                return;
            }
            self->resolve(Err(MuxError::Timeout("no device event before the deadline", false)));
        });
    }
}

void AttachWatcher::notify(const DeviceEvent& event) {
    if (closed_.is_some()) {
        return;
    }
    if (waiter_) {
        resolve(Ok(event.copy()));
        return;
    }
    queue_.push_back(event.copy());
}

void AttachWatcher::close(const MuxError& reason) {
    if (closed_.is_some()) {
        return;
    }
    closed_ = Some(reason);
    if (waiter_) {
        resolve(Err(MuxError::Closed(reason.message)));
    }
}

void AttachWatcher::resolve(MuxResult<DeviceEvent> result) {
    timer_.cancel();
    auto cb = std::move(waiter_);
    waiter_ = nullptr;
    cb(std::move(result));
}

// ---------- DeviceRegistry ----------
std::shared_ptr<DeviceRegistry> DeviceRegistry::create(boost::asio::io_context& io) {
    return std::shared_ptr<DeviceRegistry>(new DeviceRegistry(io));
}

void DeviceRegistry::device_attached(uint32_t device_id, PlistDict properties) {
    if (closed_.is_some()) {
        spdlog::debug("usbmux: ignoring attach of device {} after close", device_id);
        return;
    }
    spdlog::info("usbmux: device {} attached", device_id);
    attached_.insert_or_assign(device_id, properties.copy());

    // listeners may add or remove listeners while being called
    auto listeners = attach_listeners_;
    for (auto& entry : listeners) {
        entry.second(device_id, properties);
    }

    DeviceEvent event{DeviceAction::Attached, device_id, std::move(properties)};
    for (auto& watcher : live_watchers()) {
        watcher->notify(event);
    }
}

void DeviceRegistry::device_detached(uint32_t device_id) {
    if (closed_.is_some()) {
        spdlog::debug("usbmux: ignoring detach of device {} after close", device_id);
        return;
    }

    auto it = attached_.find(device_id);
    if (it != attached_.end()) {
        spdlog::info("usbmux: device {} detached", device_id);
        DeviceEvent event{DeviceAction::Detached, device_id, std::move(it->second)};
        attached_.erase(it);
        for (auto& watcher : live_watchers()) {
            watcher->notify(event);
        }
    } else {
        spdlog::debug("usbmux: detach for unknown device {}", device_id);
    }

    auto listeners = detach_listeners_;
    for (auto& entry : listeners) {
        entry.second(device_id);
    }
}

void DeviceRegistry::close(const MuxError& reason) {
    if (closed_.is_some()) {
        return;
    }
    spdlog::warn("usbmux: device registry closed: {}", reason.to_string());
    closed_ = Some(reason);
    for (auto& watcher : live_watchers()) {
        watcher->close(reason);
    }
}

bool DeviceRegistry::contains(uint32_t device_id) const {
    return attached_.count(device_id) != 0;
}

std::vector<uint32_t> DeviceRegistry::device_ids() const {
    std::vector<uint32_t> out;
    out.reserve(attached_.size());
    for (const auto& entry : attached_) {
        out.push_back(entry.first);
    }
    return out;
}

Option<PlistDict> DeviceRegistry::properties(uint32_t device_id) const {
    auto it = attached_.find(device_id);
    if (it == attached_.end()) {
        return None;
    }
    return Some(it->second.copy());
}

std::map<uint32_t, PlistDict> DeviceRegistry::snapshot() const {
    std::map<uint32_t, PlistDict> out;
    for (const auto& entry : attached_) {
        out.emplace(entry.first, entry.second.copy());
    }
    return out;
}

DeviceRegistry::ListenerId DeviceRegistry::add_attach_listener(AttachListener listener) {
    ListenerId id = next_listener_id_++;
    attach_listeners_.emplace(id, std::move(listener));
    return id;
}

DeviceRegistry::ListenerId DeviceRegistry::add_detach_listener(DetachListener listener) {
    ListenerId id = next_listener_id_++;
    detach_listeners_.emplace(id, std::move(listener));
    return id;
}

bool DeviceRegistry::remove_listener(ListenerId id) {
    return attach_listeners_.erase(id) + detach_listeners_.erase(id) > 0;
}

std::shared_ptr<AttachWatcher> DeviceRegistry::watch(bool include_existing) {
    auto watcher = std::shared_ptr<AttachWatcher>(new AttachWatcher(io_, weak_from_this()));
    if (include_existing) {
        for (const auto& entry : attached_) {
            watcher->queue_.push_back(
                DeviceEvent{DeviceAction::Attached, entry.first, entry.second.copy()});
        }
    }
    watcher->closed_ = closed_;
    prune_watchers();
    watchers_.push_back(watcher);
    return watcher;
}

void DeviceRegistry::wait_for_attach(Option<Millis> timeout, Completion<uint32_t> done) {
    auto wait = std::make_shared<AttachWait>(watch(false), timeout, std::move(done));
    wait->next();
}

void DeviceRegistry::prune_watchers() {
    watchers_.erase(std::remove_if(watchers_.begin(),
                                   watchers_.end(),
                                   [](const std::weak_ptr<AttachWatcher>& w) { return w.expired(); }),
                    watchers_.end());
}

std::vector<std::shared_ptr<AttachWatcher>> DeviceRegistry::live_watchers() {
    std::vector<std::shared_ptr<AttachWatcher>> out;
    out.reserve(watchers_.size());
    for (const auto& w : watchers_) {
        if (auto locked = w.lock()) {
            out.push_back(std::move(locked));
        }
    }
    prune_watchers();
    return out;
}

} // namespace Usbmux
