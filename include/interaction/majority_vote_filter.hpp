#pragma once

#include <cstddef>
#include <vector>

namespace camio {

// Bounded history of the last N samples reporting their mode. The buffer
// starts full of fill_value. On a tie the value whose first occurrence has
// the lowest slot index wins.
template <typename T>
class MajorityVoteFilter {
public:
    MajorityVoteFilter(std::size_t capacity, const T& fill_value)
        : buffer_(capacity, fill_value) {}

    bool valid() const { return !buffer_.empty(); }
    std::size_t capacity() const { return buffer_.size(); }
    std::size_t cursor() const { return cursor_; }
    const std::vector<T>& samples() const { return buffer_; }

    T push(const T& value) {
        if (buffer_.empty()) {
            return value;
        }
        buffer_[cursor_] = value;
        cursor_ = (cursor_ + 1) % buffer_.size();
        return mode();
    }

    T mode() const {
        if (buffer_.empty()) {
            return T{};
        }
        std::size_t best_idx = 0;
        std::size_t best_count = 0;
        for (std::size_t i = 0; i < buffer_.size(); ++i) {
            // Count each distinct value once, at its first slot.
            bool seen = false;
            for (std::size_t j = 0; j < i; ++j) {
                if (buffer_[j] == buffer_[i]) {
                    seen = true;
                    break;
                }
            }
            if (seen) {
                continue;
            }
            std::size_t count = 0;
            for (std::size_t j = i; j < buffer_.size(); ++j) {
                if (buffer_[j] == buffer_[i]) {
                    ++count;
                }
            }
            if (count > best_count) {
                best_count = count;
                best_idx = i;
            }
        }
        return buffer_[best_idx];
    }

private:
    std::vector<T> buffer_;
    std::size_t cursor_{0};
};

}  // namespace camio
