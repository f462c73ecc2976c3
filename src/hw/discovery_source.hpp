#pragma once
#include <chrono>
#include <cstdint>
#include <cstring>
#include <exception>
#include <map>
#include <set>
#include <string>

/**
 * @brief Abstract device discovery interface
 *
 * "Scan nearby devices now" as a capability. The attendance loop only ever
 * talks to this interface and never knows whether the addresses came from a
 * radio or from the simulator.
 *
 * Contract:
 * - scan() may block for up to the configured scan duration
 * - an empty set means "nothing found"
 * - scan_normalized() never throws: variant failures are recorded in the
 *   statistics and reported as an empty result
 */
class IDiscoverySource {
public:
    /**
     * @brief Discovery error states
     */
    enum class ErrorState {
        OK = 0,                ///< Last scan completed
        ADAPTER_UNAVAILABLE,   ///< No adapter / could not open device
        SCAN_FAILED,           ///< Inquiry returned an error
        NOT_INITIALIZED,       ///< Source used before initialize()
        UNKNOWN_ERROR          ///< Any other exception from scan()
    };

    /**
     * @brief Discovery statistics
     */
    struct Statistics {
        uint64_t total_scans{0};          ///< scan_normalized() calls
        uint64_t successful_scans{0};     ///< Scans that returned normally
        uint64_t failed_scans{0};         ///< Scans normalized to empty
        uint64_t devices_reported{0};     ///< Sum of result sizes
        double mean_scan_time_ms{0.0};    ///< Mean duration of successful scans
        double max_scan_time_ms{0.0};     ///< Longest successful scan
        std::string last_error_message;   ///< what() of the last failure

        void update_on_success(double scan_time_ms, std::size_t found) {
            total_scans++;
            successful_scans++;
            devices_reported += found;
            mean_scan_time_ms = ((mean_scan_time_ms * (successful_scans - 1)) + scan_time_ms) / successful_scans;
            if (scan_time_ms > max_scan_time_ms) {
                max_scan_time_ms = scan_time_ms;
            }
        }

        void update_on_error(const std::string& message) {
            total_scans++;
            failed_scans++;
            last_error_message = message;
        }
    };

protected:
    Statistics stats_;
    ErrorState last_error_{ErrorState::OK};
    std::string source_id_;
    bool initialized_{false};

public:
    virtual ~IDiscoverySource() = default;

    /**
     * @brief Discover nearby device addresses (may throw)
     */
    virtual std::set<std::string> scan() = 0;

    /**
     * @brief Discover nearby devices with a human-readable name each
     *
     * Used by the registration flow. Default: scan() with every device named
     * "Unknown Device".
     */
    virtual std::map<std::string, std::string> scan_named() {
        std::map<std::string, std::string> named;
        for (const auto& addr : scan()) {
            named.emplace(addr, "Unknown Device");
        }
        return named;
    }

    /**
     * @brief scan() with failures folded into an empty result
     */
    std::set<std::string> scan_normalized() {
        if (!initialized_) {
            last_error_ = ErrorState::NOT_INITIALIZED;
            stats_.update_on_error("discovery source not initialized");
            return {};
        }

        last_error_ = ErrorState::OK;
        auto start_time = std::chrono::steady_clock::now();
        try {
            auto found = scan();
            auto end_time = std::chrono::steady_clock::now();
            stats_.update_on_success(
                std::chrono::duration<double, std::milli>(end_time - start_time).count(),
                found.size());
            return found;
        } catch (const std::exception& e) {
            if (last_error_ == ErrorState::OK) {
                last_error_ = ErrorState::UNKNOWN_ERROR;
            }
            stats_.update_on_error(e.what());
            return {};
        }
    }

    virtual bool initialize() {
        initialized_ = true;
        return true;
    }

    virtual void shutdown() {
        initialized_ = false;
    }

    bool is_initialized() const {
        return initialized_;
    }

    std::string get_id() const {
        return source_id_;
    }

    void set_id(const std::string& id) {
        source_id_ = id;
    }

    ErrorState get_last_error() const {
        return last_error_;
    }

    const Statistics& get_statistics() const {
        return stats_;
    }

    void reset_statistics() {
        stats_ = Statistics{};
    }

    /**
     * @brief Source type name for logs ("simulated", "bluetooth")
     */
    virtual std::string get_type_name() const = 0;

    /**
     * @brief Usable right now: initialized and last scan did not fail
     */
    virtual bool is_healthy() const {
        return initialized_ && last_error_ == ErrorState::OK;
    }

    static std::string error_to_string(ErrorState error) {
        switch (error) {
            case ErrorState::OK: return "OK";
            case ErrorState::ADAPTER_UNAVAILABLE: return "ADAPTER_UNAVAILABLE";
            case ErrorState::SCAN_FAILED: return "SCAN_FAILED";
            case ErrorState::NOT_INITIALIZED: return "NOT_INITIALIZED";
            case ErrorState::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
            default: return "INVALID_ERROR_STATE";
        }
    }
};

/**
 * @brief Device name from a fixed-size name buffer
 *
 * Reads at most max_len bytes; the buffer need not be NUL-terminated when
 * the name fills it. An empty name becomes "Unknown Device".
 */
inline std::string device_name_from_buffer(const char* raw, std::size_t max_len) {
    const std::size_t len = ::strnlen(raw, max_len);
    if (len == 0) {
        return "Unknown Device";
    }
    return std::string(raw, len);
}
