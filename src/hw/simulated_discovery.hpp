#pragma once
#include "discovery_source.hpp"
#include "../core/identity.hpp"
#include <algorithm>
#include <chrono>
#include <functional>
#include <random>
#include <thread>
#include <vector>

/**
 * @brief Synthetic discovery source for running without a radio
 *
 * Candidates are the currently registered devices (fetched through a
 * provider on every scan, so devices registered between sessions show up),
 * padded with two filler addresses when fewer than two are registered.
 * Each candidate is reported with a fixed probability, modelling a phone
 * that misses an inquiry now and then. Optional "stranger" addresses are
 * devices that are nearby but never registered.
 */
class SimulatedDiscovery : public IDiscoverySource {
public:
    using CandidateProvider = std::function<std::vector<Identity>()>;

    static constexpr const char* kFillerA = "AA:BB:CC:DD:EE:01";
    static constexpr const char* kFillerB = "AA:BB:CC:DD:EE:02";

private:
    CandidateProvider candidates_;
    std::vector<std::string> strangers_;
    double detection_probability_{0.75};
    std::chrono::milliseconds latency_{0};

    std::mt19937_64 rng_;
    std::uniform_real_distribution<double> uniform_{0.0, 1.0};

    bool detected() {
        if (detection_probability_ >= 1.0) return true;
        if (detection_probability_ <= 0.0) return false;
        return uniform_(rng_) < detection_probability_;
    }

    std::vector<Identity> candidate_list() const {
        std::vector<Identity> list = candidates_ ? candidates_() : std::vector<Identity>{};
        if (list.size() < 2) {
            list.push_back(Identity{kFillerA, "Unknown Device"});
            list.push_back(Identity{kFillerB, "Unknown Device"});
        }
        return list;
    }

public:
    /**
     * @param candidates Registered identities to simulate
     * @param detection_probability Chance each candidate is seen per scan
     * @param seed Random seed (0 = random device)
     * @param latency Simulated inquiry time per scan
     */
    explicit SimulatedDiscovery(CandidateProvider candidates,
                                double detection_probability = 0.75,
                                uint64_t seed = 0,
                                std::chrono::milliseconds latency = std::chrono::milliseconds(0))
        : candidates_(std::move(candidates))
        , detection_probability_(std::clamp(detection_probability, 0.0, 1.0))
        , latency_(latency)
        , rng_(seed == 0 ? std::random_device{}() : seed)
    {
        set_id("SIM_01");
    }

    std::set<std::string> scan() override {
        std::set<std::string> found;
        for (const auto& c : candidate_list()) {
            if (detected()) {
                found.insert(c.identifier);
            }
        }
        for (const auto& s : strangers_) {
            if (detected()) {
                found.insert(s);
            }
        }
        if (latency_.count() > 0) {
            std::this_thread::sleep_for(latency_);
        }
        return found;
    }

    std::map<std::string, std::string> scan_named() override {
        std::map<std::string, std::string> named;
        const auto list = candidate_list();
        for (const auto& addr : scan()) {
            auto it = std::find_if(list.begin(), list.end(),
                                   [&](const Identity& c) { return c.identifier == addr; });
            named.emplace(addr, it != list.end() ? it->display_name : "Unknown Device");
        }
        return named;
    }

    void set_detection_probability(double p) {
        detection_probability_ = std::clamp(p, 0.0, 1.0);
    }

    double get_detection_probability() const {
        return detection_probability_;
    }

    void set_strangers(std::vector<std::string> strangers) {
        strangers_ = std::move(strangers);
    }

    void set_latency(std::chrono::milliseconds latency) {
        latency_ = latency;
    }

    std::string get_type_name() const override {
        return "simulated";
    }
};
