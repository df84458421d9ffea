#include "devices/dispense_policy.hpp"
#include "devices/slot_layout.hpp"
#include "common/types.hpp"

namespace vmc {

FaultRecoveryDispenser::FaultRecoveryDispenser(VendingEngine& engine, DispensePolicy policy)
    : engine_(engine), policy_(policy)
{
    if (policy_.max_attempts < 1) {
        policy_.max_attempts = 1;
    }
}

void FaultRecoveryDispenser::log(const std::string& msg)
{
    if (log_callback_) {
        log_callback_(msg);
    }
}

PolicyOutcome FaultRecoveryDispenser::dispense(int slot)
{
    std::atomic<bool> running{true};
    return dispense(slot, running);
}

PolicyOutcome FaultRecoveryDispenser::dispense(int slot, const std::atomic<bool>& running)
{
    PolicyOutcome outcome;

    for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        outcome.attempts = attempt;
        outcome.result = engine_.dispense_water(slot, running);

        if (outcome.result.success) {
            return outcome;
        }
        // a bad slot or a cancelled run will not get better by retrying
        if (!SlotLayout::is_valid_slot(slot) || !running.load()) {
            return outcome;
        }
        if (attempt == policy_.max_attempts) {
            break;
        }

        log("[POLICY] Attempt " + std::to_string(attempt) + " on slot " + std::to_string(slot) +
            " failed: " + outcome.result.error_message.value_or("unknown error"));

        if (policy_.clear_faults_between) {
            auto cleared = engine_.clear_faults();
            if (!cleared.ok()) {
                log(std::string("[POLICY] Clearing faults failed (") + error_name(cleared.error()) +
                    "): " + cleared.message());
            } else if (!cleared.value()) {
                log("[POLICY] VMC rejected fault clearing");
            }
        }
    }

    return outcome;
}

} // namespace vmc
