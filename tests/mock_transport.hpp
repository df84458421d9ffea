#pragma once

#include "transport/transport.hpp"
#include "transport/frame.hpp"

#include <deque>
#include <functional>
#include <optional>
#include <stdexcept>
#include <vector>

namespace vmc::test {

// Canned replies in, sent frames out. An empty reply slot reads as a timeout.
class MockTransport : public Transport
{
public:
    bool connect(const SerialConfig&) override
    {
        connected_ = connect_result_;
        return connect_result_;
    }

    void disconnect() override { connected_ = false; }
    bool is_connected() const override { return connected_; }

    bool send(const std::vector<uint8_t>& data) override
    {
        if (throw_on_send_) {
            throw std::runtime_error("port gone");
        }
        if (!connected_ || fail_send_) {
            return false;
        }
        sent_.push_back(data);
        if (on_send_) {
            on_send_(data);
        }
        return true;
    }

    std::optional<std::vector<uint8_t>> receive(int timeout_ms) override
    {
        last_timeout_ms_ = timeout_ms;
        if (replies_.empty()) {
            return std::nullopt;
        }
        auto reply = replies_.front();
        replies_.pop_front();
        if (reply && data_callback_) {
            data_callback_(*reply);
        }
        return reply;
    }

    void set_data_callback(DataCallback callback) override { data_callback_ = std::move(callback); }
    void clear_buffers() override { clear_count_++; }

    // Test helpers
    void queue_bytes(std::vector<uint8_t> bytes) { replies_.push_back(std::move(bytes)); }
    void queue_timeout() { replies_.push_back(std::nullopt); }

    void queue_reply(uint8_t command, const std::vector<uint8_t>& payload)
    {
        queue_bytes(FrameCodec::encode(Header::DEVICE, command, payload).value());
    }

    void set_connected(bool connected) { connected_ = connected; }
    void set_connect_result(bool result) { connect_result_ = result; }
    void set_fail_send(bool fail) { fail_send_ = fail; }
    void set_throw_on_send(bool value) { throw_on_send_ = value; }
    void set_on_send(std::function<void(const std::vector<uint8_t>&)> hook) { on_send_ = std::move(hook); }

    const std::vector<std::vector<uint8_t>>& sent() const { return sent_; }
    size_t pending_replies() const { return replies_.size(); }
    int clear_count() const { return clear_count_; }
    int last_timeout_ms() const { return last_timeout_ms_; }

    size_t sent_with_command(uint8_t command) const
    {
        size_t count = 0;
        for (const auto& frame : sent_) {
            if (frame.size() > 3 && frame[3] == command) count++;
        }
        return count;
    }

private:
    bool connected_ = true;
    bool connect_result_ = true;
    bool fail_send_ = false;
    bool throw_on_send_ = false;
    int clear_count_ = 0;
    int last_timeout_ms_ = 0;
    std::deque<std::optional<std::vector<uint8_t>>> replies_;
    std::vector<std::vector<uint8_t>> sent_;
    DataCallback data_callback_;
    std::function<void(const std::vector<uint8_t>&)> on_send_;
};

} // namespace vmc::test
