// Jackson Coxson

#ifndef USBMUX_PLIST_DICT_HPP
#define USBMUX_PLIST_DICT_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <plist/plist.h>
#include <string>
#include <usbmux++/error.hpp>
#include <usbmux++/option.hpp>

namespace Usbmux {

struct PlistDeleter {
    void operator()(void* p) const noexcept;
};

using PlistPtr = std::unique_ptr<void, PlistDeleter>;

// Owns a libplist dictionary node. Every message on the control connection
// is one of these, as are the device property records.
class PlistDict {
  public:
    PlistDict();

    // Parses an XML or binary plist. Anything that is not a dictionary is a
    // ProtocolError.
    static MuxResult<PlistDict> from_bytes(const uint8_t* data, size_t size);

    // Deep copy of a borrowed node, which must be a dictionary.
    static MuxResult<PlistDict> copy_of(plist_t node);

    ~PlistDict() noexcept                   = default;
    PlistDict(PlistDict&&) noexcept         = default;
    PlistDict& operator=(PlistDict&&) noexcept = default;
    PlistDict(const PlistDict&)             = delete;
    PlistDict& operator=(const PlistDict&)  = delete;

    PlistDict                   copy() const;

    bool                        contains(const std::string& key) const;
    size_t                      size() const;
    bool                        empty() const { return size() == 0; }

    Option<std::string>         get_string(const std::string& key) const;
    Option<uint64_t>            get_uint(const std::string& key) const;
    Option<PlistDict>           get_dict(const std::string& key) const;

    void                        set_string(const std::string& key, const std::string& value);
    void                        set_uint(const std::string& key, uint64_t value);
    void                        set_dict(const std::string& key, PlistDict&& value);

    MuxResult<std::string>      to_xml() const;

    bool                        operator==(const PlistDict& other) const;
    bool                        operator!=(const PlistDict& other) const { return !(*this == other); }

    plist_t                     raw() const noexcept { return ptr_.get(); }
    plist_t                     release() noexcept { return ptr_.release(); }

  private:
    explicit PlistDict(plist_t node) noexcept : ptr_(node) {}
    PlistPtr ptr_{};
};

} // namespace Usbmux
#endif
