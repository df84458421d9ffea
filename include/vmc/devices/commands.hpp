#pragma once

#include "transport/frame.hpp"
#include "common/types.hpp"
#include "common/protocol.hpp"

#include <stdint.h>

namespace vmc {

// Outbound frame builders. Arguments are checked here, before anything
// reaches the transport.
class CommandBuilder
{
public:
    static Result<Frame> get_device_id();
    static Result<Frame> deliver(int slot, int quantity = 1);
    static Result<Frame> remove_fault();
    static Result<Frame> query_status(int slot, int quantity = 1);
    static Result<Frame> query_balance();
    static Result<Frame> payment_instruction(int64_t amount_cents, PaymentMethod method, int slot);
    static Result<Frame> coin_change();
    static Result<Frame> cashless_cancel();
    static Result<Frame> debit_instruction(int64_t amount_cents);
    static Result<Frame> age_recognition(int required_age);
    static Result<Frame> query_coin_change_status();
    static Result<Frame> query_age_verification();

private:
    static Result<Frame> host_frame(uint8_t command, std::vector<uint8_t> payload);
};

} // namespace vmc
