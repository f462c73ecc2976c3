#include "bluetooth_discovery.hpp"

#include <bluetooth/bluetooth.h>
#include <bluetooth/hci.h>
#include <bluetooth/hci_lib.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <vector>

namespace {

// inquiry_info array allocated by hci_inquiry
struct InquiryDeleter {
    void operator()(inquiry_info* p) const { bt_free(p); }
};
using InquiryResults = std::unique_ptr<inquiry_info, InquiryDeleter>;

std::string address_string(const bdaddr_t& addr) {
    char buf[19] = {0};
    ba2str(&addr, buf);
    return std::string(buf);
}

}  // namespace

BluetoothDiscovery::BluetoothDiscovery(std::chrono::milliseconds duration, int dev_id)
    : duration_(duration), dev_id_(dev_id) {
    set_id("HCI");
}

BluetoothDiscovery::~BluetoothDiscovery() = default;

bool BluetoothDiscovery::initialize() {
    if (dev_id_ < 0) {
        dev_id_ = hci_get_route(nullptr);
    }
    if (dev_id_ < 0) {
        last_error_ = ErrorState::ADAPTER_UNAVAILABLE;
        return false;
    }
    set_id("hci" + std::to_string(dev_id_));
    initialized_ = true;
    return true;
}

std::vector<bdaddr_t> BluetoothDiscovery::inquire() {
    const int length = std::max(1, static_cast<int>(std::ceil(duration_.count() / 1280.0)));

    inquiry_info* raw = nullptr;
    const int num_rsp = hci_inquiry(dev_id_, length, max_responses_, nullptr, &raw, IREQ_CACHE_FLUSH);
    InquiryResults results(raw);
    if (num_rsp < 0) {
        last_error_ = ErrorState::SCAN_FAILED;
        throw std::runtime_error(std::string("hci_inquiry failed: ") + std::strerror(errno));
    }

    std::vector<bdaddr_t> addresses;
    addresses.reserve(static_cast<std::size_t>(num_rsp));
    for (int i = 0; i < num_rsp; ++i) {
        addresses.push_back(results.get()[i].bdaddr);
    }
    return addresses;
}

std::set<std::string> BluetoothDiscovery::scan() {
    std::set<std::string> found;
    for (const auto& addr : inquire()) {
        found.insert(address_string(addr));
    }
    return found;
}

std::map<std::string, std::string> BluetoothDiscovery::scan_named() {
    const auto addresses = inquire();

    const int sock = hci_open_dev(dev_id_);
    if (sock < 0) {
        last_error_ = ErrorState::ADAPTER_UNAVAILABLE;
        throw std::runtime_error(std::string("hci_open_dev failed: ") + std::strerror(errno));
    }

    std::map<std::string, std::string> named;
    for (const auto& addr : addresses) {
        // Up to 248 bytes, not NUL-terminated when the name fills the buffer
        char name[248] = {0};
        std::string display = "Unknown Device";
        if (hci_read_remote_name(sock, &addr, sizeof(name), name, 25000) >= 0) {
            display = device_name_from_buffer(name, sizeof(name));
        }
        named.emplace(address_string(addr), display);
    }
    close(sock);
    return named;
}
