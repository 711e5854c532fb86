#include <catch2/catch_test_macros.hpp>
#include "vitalmon/bounded_series.hpp"
#include "vitalmon/history_buffer.hpp"
#include <thread>

TEST_CASE("BoundedSeries keeps the newest values in order", "[history]") {
    vitalmon::BoundedSeries<int> series(3);

    SECTION("below capacity") {
        series.push(1);
        series.push(2);
        REQUIRE(series.snapshot() == std::vector<int>{1, 2});
    }

    SECTION("wrapping around several times") {
        for (int i = 1; i <= 8; ++i) {
            series.push(i);
        }
        REQUIRE(series.size() == 3);
        REQUIRE(series.snapshot() == std::vector<int>{6, 7, 8});
    }

    SECTION("capacity below one is raised to one") {
        vitalmon::BoundedSeries<int> tiny(0);
        tiny.push(1);
        tiny.push(2);
        REQUIRE(tiny.capacity() == 1);
        REQUIRE(tiny.snapshot() == std::vector<int>{2});
    }
}

TEST_CASE("BoundedSeries set_capacity keeps the newest values", "[history]") {
    vitalmon::BoundedSeries<int> series(5);
    for (int i = 1; i <= 7; ++i) {
        series.push(i);
    }

    series.set_capacity(2);
    REQUIRE(series.snapshot() == std::vector<int>{6, 7});

    series.set_capacity(4);
    series.push(8);
    series.push(9);
    series.push(10);
    REQUIRE(series.snapshot() == std::vector<int>{7, 8, 9, 10});
}

TEST_CASE("HistoryBuffer evicts the oldest points beyond capacity", "[history]") {
    vitalmon::HistoryBuffer history(60);

    // capacity + k pushes
    for (int i = 0; i < 65; ++i) {
        history.push("memory.percent", static_cast<double>(i));
    }

    auto points = history.snapshot("memory.percent");
    REQUIRE(points.size() == 60);
    REQUIRE(points.front() == 5.0);
    REQUIRE(points.back() == 64.0);
}

TEST_CASE("HistoryBuffer keeps series independent", "[history]") {
    vitalmon::HistoryBuffer history(3);
    history.push(vitalmon::series::cpu_core(0), 1.0);
    history.push(vitalmon::series::cpu_core(1), 2.0);
    history.push(vitalmon::series::cpu_core(1), 3.0);

    REQUIRE(vitalmon::series::cpu_core(1) == "cpu.1");
    REQUIRE(history.size("cpu.0") == 1);
    REQUIRE(history.size("cpu.1") == 2);
    REQUIRE(history.snapshot("net.sent").empty());
    REQUIRE(history.series_ids() == std::vector<std::string>{"cpu.0", "cpu.1"});
}

TEST_CASE("HistoryBuffer reset_all empties every series", "[history]") {
    vitalmon::HistoryBuffer history(10);
    history.push(vitalmon::series::kMemoryPercent, 50.0);
    history.push(vitalmon::series::kNetSent, 100.0);
    history.push(vitalmon::series::kNetRecv, 200.0);

    history.reset_all();
    REQUIRE(history.snapshot(vitalmon::series::kMemoryPercent).empty());
    REQUIRE(history.snapshot(vitalmon::series::kNetSent).empty());
    REQUIRE(history.snapshot(vitalmon::series::kNetRecv).empty());

    // Still usable afterwards
    history.push(vitalmon::series::kMemoryPercent, 51.0);
    REQUIRE(history.snapshot(vitalmon::series::kMemoryPercent) == std::vector<double>{51.0});
}

TEST_CASE("HistoryBuffer set_capacity applies to existing and new series", "[history]") {
    vitalmon::HistoryBuffer history(5);
    for (int i = 0; i < 5; ++i) {
        history.push("a", static_cast<double>(i));
    }

    history.set_capacity(2);
    REQUIRE(history.capacity() == 2);
    REQUIRE(history.snapshot("a") == std::vector<double>{3.0, 4.0});

    for (int i = 0; i < 4; ++i) {
        history.push("b", static_cast<double>(i));
    }
    REQUIRE(history.size("b") == 2);
}

TEST_CASE("HistoryBuffer snapshots never exceed capacity under concurrent pushes", "[history]") {
    vitalmon::HistoryBuffer history(16);
    std::thread writer([&history] {
        for (int i = 0; i < 2000; ++i) {
            history.push("cpu.0", static_cast<double>(i));
            if (i % 500 == 0) {
                history.reset_all();
            }
        }
    });

    for (int i = 0; i < 200; ++i) {
        REQUIRE(history.snapshot("cpu.0").size() <= 16);
    }
    writer.join();
    REQUIRE(history.snapshot("cpu.0").back() == 1999.0);
}
