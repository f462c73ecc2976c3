#pragma once
#include <algorithm>
#include <cstddef>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Bounded history of session log lines
 *
 * Fixed-capacity circular store: once full, each append overwrites the
 * oldest line. Lines are optionally mirrored to an output stream as they
 * arrive (stdout for the service, nullptr in tests).
 *
 * Thread Safety:
 * - append() and snapshot() may be called from any thread; a mutex guards
 *   the storage because lines are heap-allocated strings.
 */
class ScanLog {
private:
    std::vector<std::string> buf_;
    std::size_t head_{0};
    mutable std::mutex mutex_;
    std::ostream* mirror_;

public:
    /**
     * @param capacity Number of lines kept
     * @param mirror Stream each line is echoed to (may be nullptr)
     */
    explicit ScanLog(std::size_t capacity = 256, std::ostream* mirror = &std::cout)
        : buf_(std::max<std::size_t>(capacity, 1)), mirror_(mirror) {}

    void append(const std::string& line) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            buf_[head_ % buf_.size()] = line;
            ++head_;
        }
        if (mirror_) {
            *mirror_ << line << std::endl;
        }
    }

    std::size_t capacity() const {
        return buf_.size();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::min(head_, buf_.size());
    }

    /// Total lines ever appended, including overwritten ones
    std::size_t total_appended() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return head_;
    }

    /**
     * @brief Copy the newest lines, oldest first
     * @param max_lines Upper bound on lines returned (0 = everything kept)
     */
    std::vector<std::string> snapshot(std::size_t max_lines = 0) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::size_t kept = std::min(head_, buf_.size());
        const std::size_t count = (max_lines == 0) ? kept : std::min(kept, max_lines);

        std::vector<std::string> result;
        result.reserve(count);
        for (std::size_t i = head_ - count; i < head_; ++i) {
            result.push_back(buf_[i % buf_.size()]);
        }
        return result;
    }

    std::string latest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (head_ == 0) return {};
        return buf_[(head_ - 1) % buf_.size()];
    }
};
