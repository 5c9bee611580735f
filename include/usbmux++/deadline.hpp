// Jackson Coxson

#pragma once

#include <chrono>
#include <usbmux++/option.hpp>

namespace Usbmux {

using Millis = std::chrono::milliseconds;

// Tracks an optional time budget across several waits. None means unbounded.
class Deadline {
  public:
    using Clock = std::chrono::steady_clock;

    explicit Deadline(Option<Millis> budget) : budget_(budget), start_(Clock::now()) {}

    Option<Millis> remaining() const {
        if (budget_.is_none()) {
            return None;
        }
        auto elapsed = std::chrono::duration_cast<Millis>(Clock::now() - start_);
        auto left    = budget_.unwrap() - elapsed;
        return Some(left.count() > 0 ? left : Millis(0));
    }

    bool expired() const {
        auto left = remaining();
        return left.is_some() && left.unwrap().count() <= 0;
    }

    bool bounded() const noexcept { return budget_.is_some(); }

  private:
    Option<Millis>    budget_;
    Clock::time_point start_;
};

} // namespace Usbmux
