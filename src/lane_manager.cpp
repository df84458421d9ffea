#include "devices/lane_manager.hpp"
#include "common/protocol.hpp"

#include <algorithm>
#include <sstream>

namespace vmc {

const char* lane_status_name(LaneStatus status)
{
    switch (status) {
        case LaneStatus::ACTIVE:   return "Active";
        case LaneStatus::EMPTY:    return "Empty";
        case LaneStatus::FAILED:   return "Failed";
        case LaneStatus::DISABLED: return "Disabled";
    }
    return "Unknown";
}

std::string LaneStatusReport::to_string() const
{
    std::ostringstream oss;
    oss << "=== Lane Status Report ===\n";
    oss << "Current Lane: " << current_lane << "\n";
    oss << "Total Dispenses: " << total_dispenses << "\n";
    oss << "Usable Lanes: " << usable_lanes << "/" << lanes.size() << "\n";
    for (const auto& lane : lanes) {
        oss << "Lane " << lane.lane << ": " << lane_status_name(lane.status)
            << " | Failures: " << lane.failure_count
            << " | Success: " << lane.success_count << "\n";
    }
    return oss.str();
}

LaneManager::LaneManager(std::vector<int> lanes)
{
    for (int number : lanes) {
        lanes_.push_back(Lane{number});
    }
}

void LaneManager::log(const std::string& msg) const
{
    if (log_callback_) {
        log_callback_(msg);
    }
}

LaneManager::Lane* LaneManager::find(int lane)
{
    auto it = std::find_if(lanes_.begin(), lanes_.end(),
        [lane](const Lane& l) { return l.number == lane; });
    return it == lanes_.end() ? nullptr : &*it;
}

const LaneManager::Lane* LaneManager::find(int lane) const
{
    auto it = std::find_if(lanes_.begin(), lanes_.end(),
        [lane](const Lane& l) { return l.number == lane; });
    return it == lanes_.end() ? nullptr : &*it;
}

bool LaneManager::usable(const Lane& lane)
{
    return lane.status == LaneStatus::ACTIVE && lane.failures < MAX_CONSECUTIVE_FAILURES;
}

// Ring search starting after `start`; returns `start` when nothing else is usable.
size_t LaneManager::next_usable_from(size_t start) const
{
    for (size_t step = 1; step <= lanes_.size(); ++step) {
        size_t idx = (start + step) % lanes_.size();
        if (usable(lanes_[idx])) {
            return idx;
        }
    }
    return start;
}

int LaneManager::current_lane() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return lanes_.empty() ? 0 : lanes_[current_].number;
}

int LaneManager::next_lane()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (lanes_.empty()) {
        return 0;
    }

    const Lane& current = lanes_[current_];
    if (usable(current)) {
        bool rotate = current.successes > 0 && current.successes % LOAD_BALANCE_THRESHOLD == 0;
        if (rotate) {
            size_t next = next_usable_from(current_);
            if (next != current_) {
                log("[LANE] Switching from lane " + std::to_string(current.number) +
                    " to lane " + std::to_string(lanes_[next].number) + " for load balancing");
                current_ = next;
            }
        }
        return lanes_[current_].number;
    }

    size_t next = next_usable_from(current_);
    if (next != current_) {
        log("[LANE] Lane " + std::to_string(current.number) + " not usable, switching to lane " +
            std::to_string(lanes_[next].number));
        current_ = next;
    } else {
        log("[LANE] No usable lanes available, staying on lane " + std::to_string(current.number));
    }
    return lanes_[current_].number;
}

std::vector<int> LaneManager::fallback_lanes(int exclude_lane) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<const Lane*> candidates;
    for (const auto& lane : lanes_) {
        if (lane.number != exclude_lane && lane.status != LaneStatus::DISABLED) {
            candidates.push_back(&lane);
        }
    }
    std::stable_sort(candidates.begin(), candidates.end(),
        [](const Lane* a, const Lane* b) { return a->failures < b->failures; });

    std::vector<int> result;
    for (const Lane* lane : candidates) {
        if (result.size() == MAX_FALLBACK_LANES) break;
        result.push_back(lane->number);
    }
    return result;
}

void LaneManager::record_success(int lane, long long dispensing_ms)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Lane* l = find(lane);
    if (!l) {
        return;
    }
    l->failures = 0;
    l->successes++;
    l->status = LaneStatus::ACTIVE;
    total_dispenses_++;
    log("[LANE] Lane " + std::to_string(lane) + " success #" + std::to_string(l->successes) +
        " (" + std::to_string(dispensing_ms) + "ms)");
}

void LaneManager::record_failure(int lane, std::optional<uint8_t> error_code, const std::string& message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Lane* l = find(lane);
    if (!l) {
        return;
    }
    l->failures++;
    log("[LANE] Lane " + std::to_string(lane) + " failure #" + std::to_string(l->failures) + ": " + message);

    if (error_code == Protocol::Fault::OPTICAL_EYE_FAILURE) {
        l->status = LaneStatus::EMPTY;
        log("[LANE] Lane " + std::to_string(lane) + " marked empty");
    } else if (l->failures >= MAX_CONSECUTIVE_FAILURES) {
        l->status = LaneStatus::FAILED;
        log("[LANE] Lane " + std::to_string(lane) + " disabled after " +
            std::to_string(l->failures) + " failures");
    }
}

void LaneManager::reset_lane(int lane)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Lane* l = find(lane);
    if (!l) {
        return;
    }
    l->status = LaneStatus::ACTIVE;
    l->failures = 0;
    log("[LANE] Lane " + std::to_string(lane) + " reset");
}

void LaneManager::reset_all()
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& lane : lanes_) {
        lane.status = LaneStatus::ACTIVE;
        lane.failures = 0;
        lane.successes = 0;
    }
    current_ = 0;
    total_dispenses_ = 0;
    log("[LANE] All lanes reset");
}

void LaneManager::disable_lane(int lane)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (Lane* l = find(lane)) {
        l->status = LaneStatus::DISABLED;
    }
}

LaneStatusReport LaneManager::status_report() const
{
    std::lock_guard<std::mutex> lock(mutex_);

    LaneStatusReport report;
    report.current_lane = lanes_.empty() ? 0 : lanes_[current_].number;
    report.total_dispenses = total_dispenses_;
    for (const auto& lane : lanes_) {
        LaneInfo info;
        info.lane = lane.number;
        info.status = lane.status;
        info.failure_count = lane.failures;
        info.success_count = lane.successes;
        info.usable = usable(lane);
        if (info.usable) report.usable_lanes++;
        report.lanes.push_back(info);
    }
    return report;
}

} // namespace vmc
