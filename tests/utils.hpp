#pragma once

#include <oxenc/hex.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "roomchat/types.hpp"

using roomchat::ustring;
using roomchat::ustring_view;

using namespace std::literals;

inline ustring operator""_bytes(const char* x, size_t n) {
    return {reinterpret_cast<const unsigned char*>(x), n};
}
inline ustring operator""_hexbytes(const char* x, size_t n) {
    ustring bytes;
    oxenc::from_hex(x, x + n, std::back_inserter(bytes));
    return bytes;
}

inline std::string to_hex(ustring_view bytes) {
    std::string hex;
    oxenc::to_hex(bytes.begin(), bytes.end(), std::back_inserter(hex));
    return hex;
}
template <size_t N>
std::string to_hex(const std::array<unsigned char, N>& data) {
    return to_hex(ustring_view{data.data(), N});
}

inline constexpr auto operator""_kiB(unsigned long long kiB) {
    return kiB * 1024;
}

inline std::string_view to_sv(ustring_view x) {
    return {reinterpret_cast<const char*>(x.data()), x.size()};
}
inline ustring_view to_usv(std::string_view x) {
    return {reinterpret_cast<const unsigned char*>(x.data()), x.size()};
}

inline std::string printable(ustring_view x) {
    std::string p;
    for (auto c : x) {
        if (c >= 0x20 && c <= 0x7e)
            p += c;
        else
            p += "\\x" + oxenc::to_hex(&c, &c + 1);
    }
    return p;
}
inline std::string printable(std::string_view x) {
    return printable(to_usv(x));
}

template <typename Container>
std::set<typename Container::value_type> as_set(const Container& c) {
    return {c.begin(), c.end()};
}

// Polls `pred` until it returns true or `timeout` elapses; returns the last result.  Connect
// attempts and their callbacks complete on a worker thread, so tests wait on the observable
// effect rather than sleeping a fixed time.
inline bool wait_for(
        const std::function<bool()>& pred, std::chrono::milliseconds timeout = 5s) {
    auto until = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= until)
            return pred();
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

// Thread-safe recorder for values handed to callbacks.
template <typename T>
class recorder {
  public:
    void add(T v) {
        std::lock_guard lock{mutex_};
        values_.push_back(std::move(v));
    }
    std::vector<T> values() const {
        std::lock_guard lock{mutex_};
        return values_;
    }
    size_t size() const {
        std::lock_guard lock{mutex_};
        return values_.size();
    }
    void clear() {
        std::lock_guard lock{mutex_};
        values_.clear();
    }

  private:
    mutable std::mutex mutex_;
    std::vector<T> values_;
};
