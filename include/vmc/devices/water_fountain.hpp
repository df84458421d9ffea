#pragma once

#include "devices/vending_engine.hpp"
#include "devices/lane_manager.hpp"
#include "transport/transport.hpp"
#include "common/types.hpp"
#include "common/response.hpp"

#include <string>
#include <vector>

namespace vmc {

struct HealthCheckResult
{
    bool success = false;
    std::string message;
    std::vector<std::string> details;
};

// Front door for the fountain: brings the VMC up, then dispenses on the lane
// the LaneManager picks and falls back to other lanes when that fails.
class WaterFountain
{
public:
    using LogCallback = std::function<void(const std::string&)>;

    WaterFountain(VendingEngine& engine, LaneManager& lanes);

    Result<std::string> initialize(const SerialConfig& config, bool auto_clear_faults = true);
    void shutdown();
    bool is_ready() const { return initialized_ && engine_.is_connected(); }
    const std::string& device_id() const { return device_id_; }

    DispenseResult dispense_water();
    DispenseResult dispense_from_lane(int lane);
    Result<bool> clear_faults();
    HealthCheckResult health_check();

    void set_log_callback(LogCallback cb) { log_callback_ = std::move(cb); }

private:
    VendingEngine& engine_;
    LaneManager& lanes_;
    bool initialized_ = false;
    std::string device_id_;
    LogCallback log_callback_;

    void log(const std::string& msg);
};

} // namespace vmc
