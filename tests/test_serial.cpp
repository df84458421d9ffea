#include <gtest/gtest.h>

#include "transport/serial.hpp"
#include "transport/frame.hpp"

#include <atomic>
#include <chrono>
#include <thread>

#include <pty.h>
#include <poll.h>
#include <unistd.h>

using namespace vmc;

namespace {

long long ms_since(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

// SerialPort on the slave side of a pseudo terminal, the test plays the VMC
// on the master side.
class SerialPortTest : public ::testing::Test
{
protected:
    int master_ = -1;
    int slave_ = -1;
    std::string slave_name_;
    SerialPort port_;

    void SetUp() override
    {
        char name[256] = {};
        ASSERT_EQ(openpty(&master_, &slave_, name, nullptr, nullptr), 0);
        slave_name_ = name;

        SerialConfig config;
        config.device = slave_name_;
        ASSERT_TRUE(port_.connect(config)) << port_.get_last_error();
    }

    void TearDown() override
    {
        port_.disconnect();
        if (slave_ >= 0) ::close(slave_);
        if (master_ >= 0) ::close(master_);
    }

    void vmc_writes(const std::vector<uint8_t>& bytes)
    {
        ASSERT_EQ(::write(master_, bytes.data(), bytes.size()), static_cast<ssize_t>(bytes.size()));
    }

    std::vector<uint8_t> vmc_reads(size_t expected, int timeout_ms)
    {
        std::vector<uint8_t> out;
        uint8_t buf[256];
        auto start = std::chrono::steady_clock::now();
        while (out.size() < expected && ms_since(start) < timeout_ms) {
            struct pollfd pfd = {master_, POLLIN, 0};
            if (poll(&pfd, 1, 10) > 0) {
                ssize_t n = ::read(master_, buf, sizeof(buf));
                if (n > 0) out.insert(out.end(), buf, buf + n);
            }
        }
        return out;
    }
};

} // anonymous namespace

TEST(SerialBaud, SupportedRates)
{
    EXPECT_EQ(baud_to_speed(9600), B9600);
    EXPECT_EQ(baud_to_speed(115200), B115200);
    EXPECT_EQ(baud_to_speed(12345), B0);
}

TEST(SerialConnect, UnsupportedBaudFails)
{
    int master = -1;
    int slave = -1;
    char name[256] = {};
    ASSERT_EQ(openpty(&master, &slave, name, nullptr, nullptr), 0);

    SerialPort port;
    SerialConfig config;
    config.device = name;
    config.baud = 12345;
    EXPECT_FALSE(port.connect(config));
    EXPECT_FALSE(port.is_connected());
    EXPECT_NE(port.get_last_error().find("baud"), std::string::npos);

    ::close(slave);
    ::close(master);
}

TEST(SerialConnect, MissingDeviceFails)
{
    SerialPort port;
    SerialConfig config;
    config.device = "/dev/does-not-exist-vmc";
    EXPECT_FALSE(port.connect(config));
    EXPECT_FALSE(port.get_last_error().empty());
}

TEST_F(SerialPortTest, SendReachesTheLine)
{
    auto frame = FrameCodec::encode(Header::HOST, 0x41, {0x03, 0x01}).value();
    ASSERT_TRUE(port_.send(frame));
    EXPECT_EQ(vmc_reads(frame.size(), 500), frame);
}

TEST_F(SerialPortTest, ReceivesWholeFrame)
{
    auto frame = FrameCodec::encode(Header::DEVICE, 0xE1, {0x01}).value();
    vmc_writes(frame);

    std::vector<uint8_t> seen;
    port_.set_data_callback([&seen](const std::vector<uint8_t>& chunk) {
        seen.insert(seen.end(), chunk.begin(), chunk.end());
    });

    auto reply = port_.receive(500);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(*reply, frame);
    EXPECT_EQ(seen, frame);
}

TEST_F(SerialPortTest, FrameSplitAcrossWritesArrivesWhole)
{
    auto frame = FrameCodec::encode(Header::DEVICE, 0x41, {0x03, 0x01}).value();
    std::vector<uint8_t> head(frame.begin(), frame.begin() + 3);
    std::vector<uint8_t> tail(frame.begin() + 3, frame.end());

    std::thread vmc([&]() {
        vmc_writes(head);
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        vmc_writes(tail);
    });
    auto reply = port_.receive(1000);
    vmc.join();

    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(*reply, frame);
}

TEST_F(SerialPortTest, SilenceTimesOut)
{
    auto start = std::chrono::steady_clock::now();
    auto reply = port_.receive(100);
    EXPECT_FALSE(reply.has_value());
    EXPECT_GE(ms_since(start), 90);
}

TEST_F(SerialPortTest, TimeoutHoldsUnderContinuousTraffic)
{
    std::atomic<bool> chatter{true};
    std::thread vmc([&]() {
        const uint8_t byte = 0x00;
        while (chatter.load()) {
            if (::write(master_, &byte, 1) != 1) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    });

    auto start = std::chrono::steady_clock::now();
    auto reply = port_.receive(200);
    long long took = ms_since(start);
    chatter.store(false);
    vmc.join();

    EXPECT_LT(took, 1000);
    ASSERT_TRUE(reply.has_value());
    EXPECT_LE(reply->size(), Protocol::MIN_FRAME_SIZE + Protocol::MAX_PAYLOAD);
}

TEST_F(SerialPortTest, ReadStopsAtLargestFrame)
{
    vmc_writes(std::vector<uint8_t>(400, 0x5A));

    auto reply = port_.receive(1000);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->size(), Protocol::MIN_FRAME_SIZE + Protocol::MAX_PAYLOAD);
}

TEST_F(SerialPortTest, ClearBuffersDropsPendingInput)
{
    vmc_writes({0xAA, 0xBB, 0xCC});
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    port_.clear_buffers();
    EXPECT_FALSE(port_.receive(100).has_value());
}

TEST_F(SerialPortTest, DisconnectedPortRefusesIo)
{
    port_.disconnect();
    EXPECT_FALSE(port_.is_connected());
    EXPECT_FALSE(port_.send({0x01}));
    EXPECT_FALSE(port_.receive(10).has_value());
}
