// Jackson Coxson

#ifndef USBMUX_RESULT_HPP
#define USBMUX_RESULT_HPP

#include <cstdio>
#include <exception>
#include <new>
#include <type_traits>
#include <utility>

namespace Usbmux {
namespace types {
template <typename T> struct Ok {
    T val;

    Ok(const T& val) : val(val) {}
    Ok(T&& val) : val(std::move(val)) {}
};

template <> struct Ok<void> {};

template <typename E> struct Err {
    E val;

    Err(const E& val) : val(val) {}
    Err(E&& val) : val(std::move(val)) {}
};
} // namespace types

template <typename T> inline types::Ok<typename std::decay<T>::type> Ok(T&& val) {
    return types::Ok<typename std::decay<T>::type>(std::forward<T>(val));
}

inline types::Ok<void> Ok() {
    return types::Ok<void>();
}

template <typename E> inline types::Err<typename std::decay<E>::type> Err(E&& val) {
    return types::Err<typename std::decay<E>::type>(std::forward<E>(val));
}

namespace detail {
[[noreturn]] inline void result_fatal(const char* what, const char* message = nullptr) {
    if (message) {
        std::fprintf(stderr, "%s: %s\n", what, message);
    } else {
        std::fprintf(stderr, "%s\n", what);
    }
    std::terminate();
}
} // namespace detail

// Result<T, E> holds either a value or an error. Completion handlers of the
// async API always receive one of these.
template <typename T, typename E> class Result {
    bool is_ok_;
    union {
        T ok_value_;
        E err_value_;
    };

    void destroy() noexcept {
        if (is_ok_) {
            ok_value_.~T();
        } else {
            err_value_.~E();
        }
    }

    template <typename R> void construct_from(R&& other) {
        is_ok_ = other.is_ok_;
        if (is_ok_) {
            new (&ok_value_) T(std::forward<R>(other).ok_value_);
        } else {
            new (&err_value_) E(std::forward<R>(other).err_value_);
        }
    }

    template <typename U, typename F> friend class Result;

  public:
    Result(types::Ok<T> ok_val) : is_ok_(true), ok_value_(std::move(ok_val.val)) {}
    Result(types::Err<E> err_val) : is_ok_(false), err_value_(std::move(err_val.val)) {}

    Result(const Result& other) { construct_from(other); }
    Result(Result&& other) noexcept { construct_from(std::move(other)); }

    ~Result() { destroy(); }

    Result& operator=(const Result& other) {
        if (this != &other) {
            destroy();
            construct_from(other);
        }
        return *this;
    }

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            destroy();
            construct_from(std::move(other));
        }
        return *this;
    }

    bool is_ok() const { return is_ok_; }
    bool is_err() const { return !is_ok_; }

    T&   unwrap() & {
        if (!is_ok_) {
            detail::result_fatal("unwrap on Err");
        }
        return ok_value_;
    }

    const T& unwrap() const& {
        if (!is_ok_) {
            detail::result_fatal("unwrap on Err");
        }
        return ok_value_;
    }

    T unwrap() && {
        if (!is_ok_) {
            detail::result_fatal("unwrap on Err");
        }
        return std::move(ok_value_);
    }

    E& unwrap_err() & {
        if (is_ok_) {
            detail::result_fatal("unwrap_err on Ok");
        }
        return err_value_;
    }

    const E& unwrap_err() const& {
        if (is_ok_) {
            detail::result_fatal("unwrap_err on Ok");
        }
        return err_value_;
    }

    E unwrap_err() && {
        if (is_ok_) {
            detail::result_fatal("unwrap_err on Ok");
        }
        return std::move(err_value_);
    }

    T unwrap_or(T&& default_value) const { return is_ok_ ? ok_value_ : std::move(default_value); }

    T expect(const char* message) && {
        if (is_err()) {
            detail::result_fatal("Fatal (expect) error", message);
        }
        return std::move(ok_value_);
    }

    T& expect(const char* message) & {
        if (is_err()) {
            detail::result_fatal("Fatal (expect) error", message);
        }
        return ok_value_;
    }

    // Converts the value while passing any error through untouched.
    template <typename F>
    auto map(F&& f) && -> Result<typename std::decay<decltype(f(std::move(ok_value_)))>::type, E> {
        using U = typename std::decay<decltype(f(std::move(ok_value_)))>::type;
        if (is_ok_) {
            return Result<U, E>(types::Ok<U>(f(std::move(ok_value_))));
        }
        return Result<U, E>(types::Err<E>(std::move(err_value_)));
    }
};

// Result<void, E> specialization

template <typename E> class Result<void, E> {
    bool is_ok_;
    union {
        char dummy_;
        E    err_value_;
    };

    void destroy() noexcept {
        if (!is_ok_) {
            err_value_.~E();
        }
    }

  public:
    Result(types::Ok<void>) : is_ok_(true), dummy_() {}
    Result(types::Err<E> err_val) : is_ok_(false), err_value_(std::move(err_val.val)) {}

    Result(const Result& other) : is_ok_(other.is_ok_), dummy_() {
        if (!is_ok_) {
            new (&err_value_) E(other.err_value_);
        }
    }

    Result(Result&& other) noexcept : is_ok_(other.is_ok_), dummy_() {
        if (!is_ok_) {
            new (&err_value_) E(std::move(other.err_value_));
        }
    }

    ~Result() { destroy(); }

    Result& operator=(Result other) noexcept {
        destroy();
        is_ok_ = other.is_ok_;
        if (!is_ok_) {
            new (&err_value_) E(std::move(other.err_value_));
        }
        return *this;
    }

    bool is_ok() const { return is_ok_; }
    bool is_err() const { return !is_ok_; }

    void unwrap() const {
        if (!is_ok_) {
            detail::result_fatal("Attempted to unwrap an error Result<void, E>");
        }
    }

    const E& unwrap_err() const {
        if (is_ok_) {
            detail::result_fatal("Attempted to unwrap_err on an ok Result<void, E>");
        }
        return err_value_;
    }

    E& unwrap_err() {
        if (is_ok_) {
            detail::result_fatal("Attempted to unwrap_err on an ok Result<void, E>");
        }
        return err_value_;
    }

    void expect(const char* message) const {
        if (is_err()) {
            detail::result_fatal("Fatal (expect) error", message);
        }
    }
};

#define match_result(res, ok_name, ok_block, err_name, err_block)                                  \
    do {                                                                                           \
        auto&& _result_val = (res);                                                                \
        if (_result_val.is_ok()) {                                                                 \
            auto&& ok_name = _result_val.unwrap();                                                 \
            ok_block                                                                               \
        } else {                                                                                   \
            auto&& err_name = _result_val.unwrap_err();                                            \
            err_block                                                                              \
        }                                                                                          \
    } while (0)
} // namespace Usbmux
#endif
