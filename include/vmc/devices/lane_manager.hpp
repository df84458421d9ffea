#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <stdint.h>

namespace vmc {

enum class LaneStatus
{
    ACTIVE,
    EMPTY,
    FAILED,
    DISABLED
};

const char* lane_status_name(LaneStatus status);

struct LaneInfo
{
    int lane = 0;
    LaneStatus status = LaneStatus::ACTIVE;
    int failure_count = 0;
    int success_count = 0;
    bool usable = true;
};

struct LaneStatusReport
{
    int current_lane = 0;
    int total_dispenses = 0;
    std::vector<LaneInfo> lanes;
    int usable_lanes = 0;

    std::string to_string() const;
};

// Picks the lane to dispense from, spreads load across lanes and keeps
// failing or empty lanes out of rotation.
class LaneManager
{
public:
    using LogCallback = std::function<void(const std::string&)>;

    static constexpr int MAX_CONSECUTIVE_FAILURES = 3;
    static constexpr int LOAD_BALANCE_THRESHOLD = 10;
    static constexpr size_t MAX_FALLBACK_LANES = 3;

    explicit LaneManager(std::vector<int> lanes = {1, 2, 3, 4, 5, 6, 7, 8});

    int current_lane() const;
    int next_lane();
    std::vector<int> fallback_lanes(int exclude_lane) const;

    void record_success(int lane, long long dispensing_ms);
    void record_failure(int lane, std::optional<uint8_t> error_code, const std::string& message);

    void reset_lane(int lane);
    void reset_all();
    void disable_lane(int lane);

    LaneStatusReport status_report() const;

    void set_log_callback(LogCallback cb) { log_callback_ = std::move(cb); }

private:
    struct Lane
    {
        int number;
        LaneStatus status = LaneStatus::ACTIVE;
        int failures = 0;
        int successes = 0;
    };

    std::vector<Lane> lanes_;
    size_t current_ = 0;
    int total_dispenses_ = 0;
    mutable std::mutex mutex_;
    LogCallback log_callback_;

    void log(const std::string& msg) const;
    Lane* find(int lane);
    const Lane* find(int lane) const;
    static bool usable(const Lane& lane);
    size_t next_usable_from(size_t start) const;
};

} // namespace vmc
