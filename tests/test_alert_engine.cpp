#include <catch2/catch_test_macros.hpp>
#include "vitalmon/alert_engine.hpp"
#include "fake_provider.hpp"
#include <cmath>
#include <limits>

using vitalmon::testing::test_time;

namespace {

std::map<std::string, vitalmon::ThresholdConfig> cpu_policy(double enter, double clear) {
    return {{vitalmon::alert_quantity::kCpuMean, vitalmon::ThresholdConfig{enter, clear}}};
}

} // namespace

TEST_CASE("next_state applies hysteresis", "[alerts]") {
    vitalmon::ThresholdConfig thresholds{90.0, 70.0};
    using vitalmon::AlertState;

    REQUIRE(vitalmon::next_state(AlertState::Normal, 95.0, thresholds) == AlertState::Alerted);
    REQUIRE(vitalmon::next_state(AlertState::Normal, 90.0, thresholds) == AlertState::Normal);
    REQUIRE(vitalmon::next_state(AlertState::Alerted, 80.0, thresholds) == AlertState::Alerted);
    REQUIRE(vitalmon::next_state(AlertState::Alerted, 70.0, thresholds) == AlertState::Alerted);
    REQUIRE(vitalmon::next_state(AlertState::Alerted, 69.9, thresholds) == AlertState::Normal);
}

TEST_CASE("AlertEngine emits one event per transition", "[alerts]") {
    vitalmon::AlertEngine engine(cpu_policy(90.0, 70.0));
    const std::string cpu = vitalmon::alert_quantity::kCpuMean;

    // Sequence 95, 85, 75, 65
    auto first = engine.evaluate(cpu, 95.0, test_time(0));
    REQUIRE(first.has_value());
    REQUIRE(first->kind == vitalmon::AlertEventKind::Raised);
    REQUIRE(first->value == 95.0);
    REQUIRE(engine.state(cpu) == vitalmon::AlertState::Alerted);

    REQUIRE_FALSE(engine.evaluate(cpu, 85.0, test_time(1)).has_value());
    REQUIRE_FALSE(engine.evaluate(cpu, 75.0, test_time(2)).has_value());
    REQUIRE(engine.state(cpu) == vitalmon::AlertState::Alerted);

    auto cleared = engine.evaluate(cpu, 65.0, test_time(3));
    REQUIRE(cleared.has_value());
    REQUIRE(cleared->kind == vitalmon::AlertEventKind::Cleared);
    REQUIRE(cleared->timestamp == test_time(3));
    REQUIRE(engine.state(cpu) == vitalmon::AlertState::Normal);
}

TEST_CASE("AlertEngine does not repeat a raised alert", "[alerts]") {
    vitalmon::AlertEngine engine(cpu_policy(90.0, 70.0));
    const std::string cpu = vitalmon::alert_quantity::kCpuMean;

    REQUIRE(engine.evaluate(cpu, 99.0, test_time(0)).has_value());
    for (int i = 1; i < 10; ++i) {
        REQUIRE_FALSE(engine.evaluate(cpu, 99.0, test_time(i)).has_value());
    }
}

TEST_CASE("AlertEngine treats unknown values as no change", "[alerts]") {
    vitalmon::AlertEngine engine(cpu_policy(90.0, 70.0));
    const std::string cpu = vitalmon::alert_quantity::kCpuMean;
    const double nan = std::numeric_limits<double>::quiet_NaN();

    REQUIRE(engine.evaluate(cpu, 95.0, test_time(0)).has_value());
    REQUIRE_FALSE(engine.evaluate(cpu, nan, test_time(1)).has_value());
    REQUIRE(engine.state(cpu) == vitalmon::AlertState::Alerted);

    auto statuses = engine.statuses();
    REQUIRE(statuses.size() == 1);
    REQUIRE(statuses[0].last_value == 95.0);
}

TEST_CASE("AlertEngine ignores quantities without thresholds", "[alerts]") {
    vitalmon::AlertEngine engine(cpu_policy(90.0, 70.0));
    REQUIRE_FALSE(engine.evaluate("memory_percent", 100.0, test_time(0)).has_value());
    REQUIRE(engine.state("memory_percent") == vitalmon::AlertState::Normal);
}

TEST_CASE("AlertEngine applies the generic disk thresholds per mount", "[alerts]") {
    std::map<std::string, vitalmon::ThresholdConfig> policy{
        {"disk_percent", {95.0, 90.0}},
        {"disk_percent:/home", {80.0, 60.0}},
    };
    vitalmon::AlertEngine engine(policy);

    REQUIRE(engine.thresholds_for("disk_percent:/")->enter == 95.0);
    REQUIRE(engine.thresholds_for("disk_percent:/home")->enter == 80.0);
    REQUIRE_FALSE(engine.thresholds_for("cpu_mean").has_value());

    vitalmon::Sample sample;
    sample.timestamp = test_time(0);
    sample.disks = std::vector<vitalmon::DiskReading>{
        {"/dev/sda1", "/", "ext4", 100, 85, 15, 85.0},
        {"/dev/sdb1", "/home", "ext4", 100, 85, 15, 85.0},
    };

    auto events = engine.evaluate_sample(sample);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].quantity == "disk_percent:/home");
    REQUIRE(engine.state("disk_percent:/") == vitalmon::AlertState::Normal);
}

TEST_CASE("AlertEngine evaluates a whole sample", "[alerts]") {
    vitalmon::AlertEngine engine;

    vitalmon::Sample sample;
    sample.timestamp = test_time(0);
    sample.cpu_per_core = std::vector<double>{100.0, 90.0};
    sample.memory = vitalmon::MemoryReading{100, 10, 90, 5, 90.0};

    auto events = engine.evaluate_sample(sample);
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].quantity == "cpu_mean");
    REQUIRE(events[0].value == 95.0);
    REQUIRE(events[1].quantity == "memory_percent");

    SECTION("unknown categories are skipped") {
        vitalmon::Sample empty;
        empty.timestamp = test_time(1);
        REQUIRE(engine.evaluate_sample(empty).empty());
        REQUIRE(engine.state("cpu_mean") == vitalmon::AlertState::Alerted);
    }
}

TEST_CASE("AlertEngine keeps state across threshold updates", "[alerts]") {
    vitalmon::AlertEngine engine(cpu_policy(90.0, 70.0));
    const std::string cpu = vitalmon::alert_quantity::kCpuMean;
    REQUIRE(engine.evaluate(cpu, 95.0, test_time(0)).has_value());

    SECTION("new clear level applies to the next evaluation") {
        engine.update_thresholds(cpu_policy(90.0, 50.0));
        REQUIRE(engine.state(cpu) == vitalmon::AlertState::Alerted);
        REQUIRE_FALSE(engine.evaluate(cpu, 60.0, test_time(1)).has_value());
        REQUIRE(engine.evaluate(cpu, 40.0, test_time(2)).has_value());
    }

    SECTION("removed thresholds drop the state") {
        engine.update_thresholds({});
        REQUIRE(engine.state(cpu) == vitalmon::AlertState::Normal);
        REQUIRE(engine.statuses().empty());
    }
}

TEST_CASE("AlertEngine statuses list configured quantities", "[alerts]") {
    vitalmon::AlertEngine engine;
    auto statuses = engine.statuses();

    REQUIRE(statuses.size() == 2);
    REQUIRE(statuses[0].quantity == "cpu_mean");
    REQUIRE(statuses[0].thresholds.enter == 90.0);
    REQUIRE(std::isnan(statuses[0].last_value));
    REQUIRE(statuses[1].quantity == "memory_percent");
    REQUIRE(statuses[1].thresholds.enter == 85.0);
    REQUIRE(statuses[1].thresholds.clear == 75.0);
}

TEST_CASE("AlertEngine reset returns every quantity to Normal", "[alerts]") {
    vitalmon::AlertEngine engine(cpu_policy(90.0, 70.0));
    engine.evaluate("cpu_mean", 95.0, test_time(0));

    engine.reset();
    REQUIRE(engine.state("cpu_mean") == vitalmon::AlertState::Normal);
    REQUIRE(engine.evaluate("cpu_mean", 95.0, test_time(1)).has_value());
}

TEST_CASE("AlertEvent message describes the transition", "[alerts]") {
    vitalmon::AlertEvent event;
    event.kind = vitalmon::AlertEventKind::Raised;
    event.quantity = "cpu_mean";
    event.value = 95.0;
    event.thresholds = {90.0, 70.0};
    REQUIRE(event.message() == "cpu_mean at 95.0% exceeded 90.0%");

    event.kind = vitalmon::AlertEventKind::Cleared;
    event.value = 65.0;
    REQUIRE(event.message() == "cpu_mean at 65.0% back below 70.0%");

    REQUIRE(vitalmon::to_string(vitalmon::AlertEventKind::Raised) == "AlertRaised");
    REQUIRE(vitalmon::to_string(vitalmon::AlertState::Alerted) == "Alerted");
}
