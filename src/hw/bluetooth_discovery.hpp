#pragma once
#include "discovery_source.hpp"
#include <chrono>
#include <vector>
#include <bluetooth/bluetooth.h>

/**
 * @brief Classic Bluetooth inquiry on the local adapter (BlueZ)
 *
 * Runs one hci_inquiry per scan for roughly the configured duration
 * (inquiry length is counted in 1.28 s units, rounded up) with the device
 * cache flushed, so every scan reflects devices that answered this time.
 *
 * Adapter errors are thrown from scan() and folded into an empty result by
 * scan_normalized(). Only compiled when the build has BlueZ
 * (ATTENDANCE_WITH_BLUEZ).
 */
class BluetoothDiscovery : public IDiscoverySource {
private:
    std::chrono::milliseconds duration_;
    int dev_id_{-1};
    int max_responses_{255};

    std::vector<bdaddr_t> inquire();

public:
    /**
     * @param duration Inquiry duration per scan
     * @param dev_id HCI device id (-1 = first available adapter)
     */
    explicit BluetoothDiscovery(std::chrono::milliseconds duration, int dev_id = -1);
    ~BluetoothDiscovery() override;

    bool initialize() override;
    std::set<std::string> scan() override;
    std::map<std::string, std::string> scan_named() override;

    std::string get_type_name() const override {
        return "bluetooth";
    }

    int get_device_id() const {
        return dev_id_;
    }
};
