#include "../src/core/scan_log.hpp"
#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Test ScanLog history and mirroring
 */
int main() {
    std::cout << "Testing ScanLog functionality..." << std::endl;

    // Test 1: Basic operations
    {
        std::cout << "Test 1: Basic operations" << std::endl;

        ScanLog log(3, nullptr);
        assert(log.capacity() == 3);
        assert(log.size() == 0);
        assert(log.latest().empty());
        assert(log.snapshot().empty());

        log.append("one");
        log.append("two");
        assert(log.size() == 2);
        assert(log.latest() == "two");
        auto snap = log.snapshot();
        assert(snap.size() == 2 && snap[0] == "one" && snap[1] == "two");

        std::cout << "  Basic operations test passed" << std::endl;
    }

    // Test 2: Overflow keeps newest lines in order
    {
        std::cout << "Test 2: Overflow" << std::endl;

        ScanLog log(3, nullptr);
        for (int i = 1; i <= 7; ++i) {
            log.append("line " + std::to_string(i));
        }
        assert(log.size() == 3);
        assert(log.total_appended() == 7);
        auto snap = log.snapshot();
        assert(snap.size() == 3);
        assert(snap[0] == "line 5");
        assert(snap[1] == "line 6");
        assert(snap[2] == "line 7");

        auto last_two = log.snapshot(2);
        assert(last_two.size() == 2);
        assert(last_two[0] == "line 6");
        assert(last_two[1] == "line 7");

        std::cout << "  Overflow test passed" << std::endl;
    }

    // Test 3: Mirroring
    {
        std::cout << "Test 3: Mirroring" << std::endl;

        std::ostringstream out;
        ScanLog log(4, &out);
        log.append("[SCAN 1] Detected: Alice (1)");
        log.append("[SCAN 2] Detected: none");
        assert(out.str() == "[SCAN 1] Detected: Alice (1)\n[SCAN 2] Detected: none\n");

        std::cout << "  Mirroring test passed" << std::endl;
    }

    // Test 4: Concurrent writers
    {
        std::cout << "Test 4: Concurrent writers" << std::endl;

        ScanLog log(64, nullptr);
        std::vector<std::thread> writers;
        for (int t = 0; t < 4; ++t) {
            writers.emplace_back([&log, t]() {
                for (int i = 0; i < 1000; ++i) {
                    log.append("writer " + std::to_string(t) + " line " + std::to_string(i));
                }
            });
        }
        std::thread reader([&log]() {
            for (int i = 0; i < 200; ++i) {
                auto snap = log.snapshot();
                assert(snap.size() <= 64);
            }
        });
        for (auto& w : writers) w.join();
        reader.join();

        assert(log.total_appended() == 4000);
        assert(log.size() == 64);

        std::cout << "  Concurrent writers test passed" << std::endl;
    }

    std::cout << "✅ All ScanLog tests passed!" << std::endl;
    return 0;
}
