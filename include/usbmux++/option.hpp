// Option<T> mirrors the Rust type of the same name. Timeouts, device
// properties and other "maybe" values in this library are spelled with it,
// so a missing value always has to be handled explicitly. The value lives in
// raw storage inside the Option; no std::optional is involved.

#pragma once

#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace Usbmux {

struct none_t {};
constexpr none_t None{};

template <typename T> class Option {
    alignas(T) unsigned char buf_[sizeof(T)];
    bool engaged_ = false;

    T*       get() noexcept { return reinterpret_cast<T*>(buf_); }
    const T* get() const noexcept { return reinterpret_cast<const T*>(buf_); }

    template <typename... Args> void emplace(Args&&... args) {
        ::new (static_cast<void*>(buf_)) T(std::forward<Args>(args)...);
        engaged_ = true;
    }

    [[noreturn]] static void empty_unwrap() { throw std::runtime_error("unwrap on None"); }

  public:
    Option() noexcept {}
    Option(none_t) noexcept {}
    Option(const T& v) { emplace(v); }
    Option(T&& v) { emplace(std::move(v)); }

    Option(const Option& other) {
        if (other.engaged_) {
            emplace(*other.get());
        }
    }
    // the source is left None
    Option(Option&& other) noexcept(std::is_nothrow_move_constructible<T>::value) {
        if (other.engaged_) {
            emplace(std::move(*other.get()));
            other.reset();
        }
    }

    Option& operator=(Option other) noexcept(std::is_nothrow_move_constructible<T>::value) {
        swap(other);
        return *this;
    }

    ~Option() { reset(); }

    void reset() noexcept {
        if (engaged_) {
            get()->~T();
            engaged_ = false;
        }
    }

    void swap(Option& other) noexcept(std::is_nothrow_move_constructible<T>::value) {
        if (engaged_ && other.engaged_) {
            using std::swap;
            swap(*get(), *other.get());
            return;
        }
        Option* from = engaged_ ? this : &other;
        Option* to   = engaged_ ? &other : this;
        if (from->engaged_) {
            to->emplace(std::move(*from->get()));
            from->reset();
        }
    }

    bool is_some() const noexcept { return engaged_; }
    bool is_none() const noexcept { return !engaged_; }

    T& unwrap() & {
        if (!engaged_) {
            empty_unwrap();
        }
        return *get();
    }
    const T& unwrap() const& {
        if (!engaged_) {
            empty_unwrap();
        }
        return *get();
    }
    // Leaves None behind.
    T unwrap() && {
        if (!engaged_) {
            empty_unwrap();
        }
        T out = std::move(*get());
        reset();
        return out;
    }

    T unwrap_or(T fallback) const& { return engaged_ ? *get() : std::move(fallback); }
    T unwrap_or(T fallback) && { return engaged_ ? std::move(*get()) : std::move(fallback); }

    template <typename F> T unwrap_or_else(F&& f) const& { return engaged_ ? *get() : static_cast<T>(f()); }

    template <typename F>
    auto map(F&& f) const& -> Option<typename std::decay<decltype(f(std::declval<const T&>()))>::type> {
        using U = typename std::decay<decltype(f(std::declval<const T&>()))>::type;
        if (engaged_) {
            return Option<U>(f(*get()));
        }
        return None;
    }

    bool operator==(const Option& other) const {
        if (engaged_ != other.engaged_) {
            return false;
        }
        return !engaged_ || *get() == *other.get();
    }
    bool operator!=(const Option& other) const { return !(*this == other); }
};

template <typename T> inline Option<typename std::decay<T>::type> Some(T&& v) {
    return Option<typename std::decay<T>::type>(std::forward<T>(v));
}

#define match_option(opt, some_name, some_block, none_block)                                       \
    /* NOTE: you may return in a block, but not break/continue */                                  \
    do {                                                                                           \
        auto&& _option_val = (opt);                                                                \
        if (_option_val.is_some()) {                                                               \
            auto&& some_name = _option_val.unwrap();                                               \
            some_block                                                                             \
        } else {                                                                                   \
            none_block                                                                             \
        }                                                                                          \
    } while (0)

#define _opt_concat(a, b) a##b
#define _opt_unique(base) _opt_concat(base, __LINE__)

/* Bind a reference to the contained value if Some(...) */
#define if_let_some(expr, name, block)                                                             \
    /* NOTE: you may return in a block, but not break/continue */                                  \
    do {                                                                                           \
        auto&& _opt_unique(_opt_) = (expr);                                                        \
        if (_opt_unique(_opt_).is_some()) {                                                        \
            auto&& name = _opt_unique(_opt_).unwrap();                                             \
            block                                                                                  \
        }                                                                                          \
    } while (0)

} // namespace Usbmux
