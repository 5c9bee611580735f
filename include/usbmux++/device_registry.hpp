// Jackson Coxson

#ifndef USBMUX_DEVICE_REGISTRY_HPP
#define USBMUX_DEVICE_REGISTRY_HPP

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <usbmux++/deadline.hpp>
#include <usbmux++/error.hpp>
#include <usbmux++/option.hpp>
#include <usbmux++/plist_dict.hpp>
#include <vector>

namespace Usbmux {

class DeviceRegistry;

enum class DeviceAction : uint8_t { Attached = 1, Detached = 2 };

const char* to_string(DeviceAction action) noexcept;

struct DeviceEvent {
    DeviceAction action    = DeviceAction::Attached;
    uint32_t     device_id = 0;
    PlistDict    properties;

    DeviceEvent  copy() const { return DeviceEvent{action, device_id, properties.copy()}; }
};

/// @brief Queue of attach/detach events seen since the watcher was created.
/// @details Obtained from DeviceRegistry::watch(). Every live watcher gets its
/// own copy of each event. The watcher stops receiving events once the last
/// reference to it is dropped.
class AttachWatcher : public std::enable_shared_from_this<AttachWatcher> {
  public:
    ~AttachWatcher();
    AttachWatcher(const AttachWatcher&)            = delete;
    AttachWatcher& operator=(const AttachWatcher&) = delete;

    /// @brief Delivers the next event.
    /// @details Completes right away (through the event loop) when an event
    /// is already queued; otherwise waits up to `timeout`, None waiting
    /// forever. Fails with Timeout when the time runs out and with Closed once
    /// the registry has shut down and the queue is drained. Only one wait may
    /// be outstanding per watcher.
    void   wait_for_next(Option<Millis> timeout, Completion<DeviceEvent> done);

    size_t pending() const noexcept { return queue_.size(); }
    bool   waiting() const noexcept { return static_cast<bool>(waiter_); }

  private:
    friend class DeviceRegistry;

    AttachWatcher(boost::asio::io_context& io, std::weak_ptr<DeviceRegistry> registry);

    void notify(const DeviceEvent& event);
    void close(const MuxError& reason);
    void resolve(MuxResult<DeviceEvent> result);

    boost::asio::io_context&      io_;
    std::weak_ptr<DeviceRegistry> registry_;
    std::deque<DeviceEvent>       queue_;
    Completion<DeviceEvent>       waiter_;
    boost::asio::steady_timer     timer_;
    uint64_t                      wait_id_ = 0;
    Option<MuxError>              closed_;
};

/// @brief The set of devices the daemon currently reports as attached.
/// @details Written only by the listen connection's event handlers; all other
/// access is a read. The registry is not thread safe: everything runs on the
/// io_context that owns the mux connection.
class DeviceRegistry : public std::enable_shared_from_this<DeviceRegistry> {
  public:
    using ListenerId     = uint64_t;
    using AttachListener = std::function<void(uint32_t device_id, const PlistDict& properties)>;
    using DetachListener = std::function<void(uint32_t device_id)>;

    static std::shared_ptr<DeviceRegistry> create(boost::asio::io_context& io);

    DeviceRegistry(const DeviceRegistry&)            = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // Event sinks for the listen connection.
    void device_attached(uint32_t device_id, PlistDict properties);
    void device_detached(uint32_t device_id);
    // No further events will arrive. Pending waits fail with Closed.
    void close(const MuxError& reason);

    bool                          is_closed() const noexcept { return closed_.is_some(); }
    const Option<MuxError>&       close_reason() const noexcept { return closed_; }

    bool                          contains(uint32_t device_id) const;
    size_t                        size() const noexcept { return attached_.size(); }
    std::vector<uint32_t>         device_ids() const;
    Option<PlistDict>             properties(uint32_t device_id) const;
    // Point-in-time copy; later events do not change it.
    std::map<uint32_t, PlistDict> snapshot() const;

    ListenerId                    add_attach_listener(AttachListener listener);
    ListenerId                    add_detach_listener(DetachListener listener);
    bool                          remove_listener(ListenerId id);

    // With `include_existing` the queue starts with an Attached event for
    // every device already present.
    std::shared_ptr<AttachWatcher> watch(bool include_existing = false);

    // Resolves with the id of the next device to attach after this call.
    void wait_for_attach(Option<Millis> timeout, Completion<uint32_t> done);

  private:
    explicit DeviceRegistry(boost::asio::io_context& io) : io_(io) {}

    void                                       prune_watchers();
    std::vector<std::shared_ptr<AttachWatcher>> live_watchers();

    boost::asio::io_context&                   io_;
    std::map<uint32_t, PlistDict>              attached_;
    std::map<ListenerId, AttachListener>       attach_listeners_;
    std::map<ListenerId, DetachListener>       detach_listeners_;
    ListenerId                                 next_listener_id_ = 1;
    std::vector<std::weak_ptr<AttachWatcher>>  watchers_;
    Option<MuxError>                           closed_;

    friend class AttachWatcher;
};

} // namespace Usbmux
#endif
