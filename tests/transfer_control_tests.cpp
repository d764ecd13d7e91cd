// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <splice/core/transfer_control.hpp>
#include <atomic>
#include <chrono>
#include <thread>

using namespace splicer::core;
using namespace std::chrono_literals;

TEST_CASE("TransferControl flags", "[control]") {
    TransferControl control;
    CHECK_FALSE(control.paused());
    CHECK_FALSE(control.cancelled());

    control.pause();
    CHECK(control.paused());
    control.resume();
    CHECK_FALSE(control.paused());

    control.pause();
    control.rearm();
    CHECK_FALSE(control.paused());

    control.cancel();
    control.rearm();
    CHECK(control.cancelled());
}

TEST_CASE("wait_while_paused returns at once when running", "[control]") {
    TransferControl control;
    CHECK(control.wait_while_paused());
}

TEST_CASE("wait_while_paused blocks until resume", "[control]") {
    TransferControl control;
    control.pause();

    std::atomic<bool> returned{false};
    bool result = false;
    std::thread waiter([&] {
        result = control.wait_while_paused();
        returned = true;
    });

    std::this_thread::sleep_for(50ms);
    CHECK_FALSE(returned.load());

    control.resume();
    waiter.join();
    CHECK(returned.load());
    CHECK(result);
}

TEST_CASE("wait_while_paused wakes on cancel", "[control]") {
    TransferControl control;
    control.pause();

    bool result = true;
    std::thread waiter([&] { result = control.wait_while_paused(); });

    std::this_thread::sleep_for(20ms);
    control.cancel();
    waiter.join();
    CHECK_FALSE(result);
}

TEST_CASE("wait_for_cancel", "[control]") {
    TransferControl control;

    SECTION("Times out without cancel") {
        auto start = std::chrono::steady_clock::now();
        CHECK_FALSE(control.wait_for_cancel(30ms));
        CHECK(std::chrono::steady_clock::now() - start >= 30ms);
    }

    SECTION("Cancel ends the wait early") {
        std::thread canceller([&] {
            std::this_thread::sleep_for(20ms);
            control.cancel();
        });
        auto start = std::chrono::steady_clock::now();
        CHECK(control.wait_for_cancel(10s));
        CHECK(std::chrono::steady_clock::now() - start < 5s);
        canceller.join();
    }
}
