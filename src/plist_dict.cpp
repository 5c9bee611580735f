// Jackson Coxson

#include <cstdlib>
#include <usbmux++/plist_dict.hpp>

namespace Usbmux {

namespace {

bool nodes_equal(plist_t a, plist_t b);

bool dicts_equal(plist_t a, plist_t b) {
    if (plist_dict_get_size(a) != plist_dict_get_size(b)) {
        return false;
    }

    plist_dict_iter it = nullptr;
    plist_dict_new_iter(a, &it);
    if (!it) {
        return false;
    }

    bool equal = true;
    while (equal) {
        char*   key = nullptr;
        plist_t val = nullptr;
        plist_dict_next_item(a, it, &key, &val);
        if (!key) {
            break;
        }
        equal = nodes_equal(val, plist_dict_get_item(b, key));
        plist_mem_free(key);
    }
    free(it);
    return equal;
}

bool arrays_equal(plist_t a, plist_t b) {
    uint32_t n = plist_array_get_size(a);
    if (n != plist_array_get_size(b)) {
        return false;
    }
    for (uint32_t i = 0; i < n; ++i) {
        if (!nodes_equal(plist_array_get_item(a, i), plist_array_get_item(b, i))) {
            return false;
        }
    }
    return true;
}

bool nodes_equal(plist_t a, plist_t b) {
    if (!a || !b) {
        return a == b;
    }
    plist_type type = plist_get_node_type(a);
    if (type != plist_get_node_type(b)) {
        return false;
    }
    switch (type) {
    case PLIST_DICT:
        return dicts_equal(a, b);
    case PLIST_ARRAY:
        return arrays_equal(a, b);
    default:
        return plist_compare_node_value(a, b) != 0;
    }
}

} // namespace

void PlistDeleter::operator()(void* p) const noexcept {
    if (p) {
        plist_free(static_cast<plist_t>(p));
    }
}

PlistDict::PlistDict() : ptr_(plist_new_dict()) {
}

MuxResult<PlistDict> PlistDict::from_bytes(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return Err(MuxError::ProtocolError("empty plist payload"));
    }

    plist_t     node = nullptr;
    plist_err_t e    = plist_from_memory(
        reinterpret_cast<const char*>(data), static_cast<uint32_t>(size), &node, nullptr);
    if (e != PLIST_ERR_SUCCESS || !node) {
        return Err(MuxError::ProtocolError("malformed plist payload"));
    }

    PlistDict out(node);
    if (plist_get_node_type(node) != PLIST_DICT) {
        return Err(MuxError::ProtocolError("plist payload is not a dictionary"));
    }
    return Ok(std::move(out));
}

MuxResult<PlistDict> PlistDict::copy_of(plist_t node) {
    if (!node || plist_get_node_type(node) != PLIST_DICT) {
        return Err(MuxError::InvalidArgument("node is not a dictionary"));
    }
    return Ok(PlistDict(plist_copy(node)));
}

PlistDict PlistDict::copy() const {
    return PlistDict(plist_copy(ptr_.get()));
}

bool PlistDict::contains(const std::string& key) const {
    return plist_dict_get_item(ptr_.get(), key.c_str()) != nullptr;
}

size_t PlistDict::size() const {
    return plist_dict_get_size(ptr_.get());
}

Option<std::string> PlistDict::get_string(const std::string& key) const {
    plist_t node = plist_dict_get_item(ptr_.get(), key.c_str());
    if (!node || plist_get_node_type(node) != PLIST_STRING) {
        return None;
    }
    char* c = nullptr;
    plist_get_string_val(node, &c);
    if (!c) {
        return None;
    }
    std::string out(c);
    plist_mem_free(c);
    return Some(out);
}

Option<uint64_t> PlistDict::get_uint(const std::string& key) const {
    plist_t node = plist_dict_get_item(ptr_.get(), key.c_str());
    if (!node || plist_get_node_type(node) != PLIST_UINT) {
        return None;
    }
    uint64_t v = 0;
    plist_get_uint_val(node, &v);
    return Some(v);
}

Option<PlistDict> PlistDict::get_dict(const std::string& key) const {
    plist_t node = plist_dict_get_item(ptr_.get(), key.c_str());
    if (!node || plist_get_node_type(node) != PLIST_DICT) {
        return None;
    }
    return Some(PlistDict(plist_copy(node)));
}

void PlistDict::set_string(const std::string& key, const std::string& value) {
    plist_dict_set_item(ptr_.get(), key.c_str(), plist_new_string(value.c_str()));
}

void PlistDict::set_uint(const std::string& key, uint64_t value) {
    plist_dict_set_item(ptr_.get(), key.c_str(), plist_new_uint(value));
}

void PlistDict::set_dict(const std::string& key, PlistDict&& value) {
    // the parent dictionary takes ownership of the node
    plist_dict_set_item(ptr_.get(), key.c_str(), value.release());
}

MuxResult<std::string> PlistDict::to_xml() const {
    char*       xml = nullptr;
    uint32_t    len = 0;
    plist_err_t e   = plist_to_xml(ptr_.get(), &xml, &len);
    if (e != PLIST_ERR_SUCCESS || !xml) {
        return Err(MuxError::InvalidArgument("failed to serialize plist"));
    }
    std::string out(xml, len);
    plist_mem_free(xml);
    return Ok(std::move(out));
}

bool PlistDict::operator==(const PlistDict& other) const {
    return nodes_equal(ptr_.get(), other.ptr_.get());
}

} // namespace Usbmux
