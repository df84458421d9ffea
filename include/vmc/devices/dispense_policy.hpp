#pragma once

#include "devices/vending_engine.hpp"
#include "common/response.hpp"

#include <atomic>

namespace vmc {

struct DispensePolicy
{
    int max_attempts = 2;
    bool clear_faults_between = true;
};

struct PolicyOutcome
{
    DispenseResult result;
    int attempts = 0;
};

// Retry wrapper around VendingEngine::dispense_water. The engine never
// retries on its own; this is where "clear faults then try again" lives.
class FaultRecoveryDispenser
{
public:
    using LogCallback = std::function<void(const std::string&)>;

    explicit FaultRecoveryDispenser(VendingEngine& engine, DispensePolicy policy = {});

    PolicyOutcome dispense(int slot);
    PolicyOutcome dispense(int slot, const std::atomic<bool>& running);

    const DispensePolicy& policy() const { return policy_; }
    void set_log_callback(LogCallback cb) { log_callback_ = std::move(cb); }

private:
    VendingEngine& engine_;
    DispensePolicy policy_;
    LogCallback log_callback_;

    void log(const std::string& msg);
};

} // namespace vmc
