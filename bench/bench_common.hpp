// bench/bench_common.hpp
// Shared benchmark scenarios.

#pragma once

#include "pushgate/notification.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace pushgate_bench {

struct BenchScenario {
    const char* name;
    size_t alert_size;
    size_t custom_fields;
};

constexpr BenchScenario SCENARIOS[] = {
    {"badge_only", 0, 0},
    {"short_alert", 40, 0},
    {"typical", 120, 4},
    {"near_limit", 1800, 8},
};

constexpr size_t SCENARIO_COUNT = sizeof(SCENARIOS) / sizeof(SCENARIOS[0]);

constexpr const char* DEVICE_TOKEN =
    "4a8b9c0d1e2f30415263748596a7b8c9dae0f1021324354657687980a1b2c3d4";

// Build a notification whose payload roughly matches the scenario.
inline std::shared_ptr<pushgate::Notification> make_notification(const BenchScenario& scenario) {
    pushgate::Payload payload;
    payload.badge(1);
    if (scenario.alert_size > 0) {
        payload.alert(std::string(scenario.alert_size, 'x'));
    }
    pushgate::Fields custom;
    for (size_t i = 0; i < scenario.custom_fields; i++) {
        custom.add("k" + std::to_string(i), "value");
    }
    payload.custom(std::move(custom));
    return std::make_shared<pushgate::Notification>(DEVICE_TOKEN, std::move(payload));
}

} // namespace pushgate_bench
