#include <catch2/catch_test_macros.hpp>
#include "vitalmon/metrics_provider.hpp"

TEST_CASE("Linux provider reads CPU and memory from /proc", "[provider]") {
    auto provider = vitalmon::create_metrics_provider();
    REQUIRE(provider != nullptr);

    auto cores = provider->sample_cpu_per_core();
    REQUIRE_FALSE(cores.empty());
    for (double usage : cores) {
        REQUIRE(usage >= 0.0);
        REQUIRE(usage <= 100.0);
    }

    auto memory = provider->sample_memory();
    REQUIRE(memory.total_bytes > 0);
    REQUIRE(memory.used_bytes + memory.available_bytes == memory.total_bytes);
    REQUIRE(memory.percent >= 0.0);
    REQUIRE(memory.percent <= 100.0);
}

TEST_CASE("Linux provider counters never go backwards between close reads", "[provider]") {
    auto provider = vitalmon::create_metrics_provider();

    auto first = provider->sample_network_counters();
    auto second = provider->sample_network_counters();
    REQUIRE(second.bytes_recv >= first.bytes_recv);
    REQUIRE(second.packets_recv >= first.packets_recv);

    REQUIRE(provider->boot_time() < vitalmon::Clock::now());
}
