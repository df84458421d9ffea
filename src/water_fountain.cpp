#include "devices/water_fountain.hpp"

namespace vmc {

WaterFountain::WaterFountain(VendingEngine& engine, LaneManager& lanes)
    : engine_(engine), lanes_(lanes) {}

void WaterFountain::log(const std::string& msg)
{
    if (log_callback_) {
        log_callback_(msg);
    }
}

Result<std::string> WaterFountain::initialize(const SerialConfig& config, bool auto_clear_faults)
{
    initialized_ = false;

    auto connected = engine_.connect(config);
    if (!connected.ok()) {
        return Result<std::string>::failure(connected.failure_info());
    }

    // The device id doubles as a link test
    auto id = engine_.get_device_id();
    if (!id.ok()) {
        log("[FOUNTAIN] Device id query failed: " + id.message());
        return id;
    }
    device_id_ = id.value();
    log("[FOUNTAIN] VMC device id " + device_id_);

    if (auto_clear_faults) {
        auto cleared = engine_.clear_faults();
        if (!cleared.ok() || !cleared.value()) {
            log("[FOUNTAIN] Initial fault clearing did not succeed");
        }
    }

    initialized_ = true;
    return id;
}

void WaterFountain::shutdown()
{
    engine_.disconnect();
    initialized_ = false;
}

DispenseResult WaterFountain::dispense_from_lane(int lane)
{
    DispenseResult result = engine_.dispense_water(lane);
    if (result.success) {
        lanes_.record_success(lane, result.elapsed_ms);
    } else {
        lanes_.record_failure(lane, result.error_code, result.error_message.value_or(""));
    }
    return result;
}

DispenseResult WaterFountain::dispense_water()
{
    if (!is_ready()) {
        DispenseResult result;
        result.slot = lanes_.current_lane();
        result.error_message = "Water fountain not ready. Please try again.";
        return result;
    }

    const int primary = lanes_.next_lane();
    DispenseResult result = dispense_from_lane(primary);
    if (result.success) {
        return result;
    }

    for (int lane : lanes_.fallback_lanes(primary)) {
        log("[FOUNTAIN] Lane " + std::to_string(primary) + " failed, trying lane " + std::to_string(lane));
        result = dispense_from_lane(lane);
        if (result.success) {
            return result;
        }
    }

    DispenseResult all_failed;
    all_failed.slot = primary;
    all_failed.error_code = result.error_code;
    all_failed.error_message = "All water lanes are currently unavailable. Please contact support.";
    all_failed.elapsed_ms = result.elapsed_ms;
    return all_failed;
}

Result<bool> WaterFountain::clear_faults()
{
    if (!is_ready()) {
        return Result<bool>::failure(Error::CONNECTION, "water fountain not initialized");
    }
    return engine_.clear_faults();
}

HealthCheckResult WaterFountain::health_check()
{
    HealthCheckResult health;
    if (!is_ready()) {
        health.message = "Manager not initialized";
        health.details.push_back("Call initialize() first");
        return health;
    }

    bool all_passed = true;

    auto id = engine_.get_device_id();
    if (id.ok()) {
        health.details.push_back("OK   Device ID: " + id.value());
    } else {
        health.details.push_back("FAIL Device ID: " + id.message());
        all_passed = false;
    }

    auto cleared = engine_.clear_faults();
    if (cleared.ok() && cleared.value()) {
        health.details.push_back("OK   Fault clearing");
    } else {
        health.details.push_back("FAIL Fault clearing" + (cleared.ok() ? std::string(": rejected") : ": " + cleared.message()));
        all_passed = false;
    }

    auto report = lanes_.status_report();
    health.details.push_back("OK   Current lane: " + std::to_string(report.current_lane));
    health.details.push_back("OK   Usable lanes: " + std::to_string(report.usable_lanes) + "/" +
        std::to_string(report.lanes.size()));
    for (const auto& lane : report.lanes) {
        if (!lane.usable) {
            health.details.push_back("FAIL Lane " + std::to_string(lane.lane) + ": " +
                lane_status_name(lane.status) + " (" + std::to_string(lane.failure_count) + " failures)");
        }
    }
    // one usable lane is enough to keep serving
    if (report.usable_lanes == 0) {
        all_passed = false;
    }

    health.success = all_passed;
    health.message = all_passed ? "All systems operational" : "Some issues detected";
    return health;
}

} // namespace vmc
