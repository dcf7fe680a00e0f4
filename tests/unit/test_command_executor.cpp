/**
 * @file test_command_executor.cpp
 * @brief Unit tests for command sequences: send, verify, retry, supersede
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <lanlight/core/command_executor.hpp>

#include "support/fake_scheduler.hpp"
#include "support/recording_link.hpp"

#include <chrono>
#include <limits>
#include <string>
#include <tuple>
#include <vector>

using namespace lanlight::core;
using lanlight::protocol::Message;
using lanlight::test::FakeScheduler;
using lanlight::test::RecordingLink;
using std::chrono::milliseconds;

namespace {

const char* const kDevice = "AA:BB:CC:DD:EE:FF:00:11";
const char* const kDeviceIp = "192.168.1.23";

DeviceState brightnessState(int brightness) {
    DeviceState state;
    state.on = true;
    state.brightness = brightness;
    return state;
}

}  // namespace

class CommandExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry.upsertFromScan(kDevice, kDeviceIp, "H6159", CapabilityTable::builtin(),
                                nullptr, scheduler.now());
        executor.setFinishedCallback(
            [this](const std::string& fingerprint, CommandKind kind, SequenceState state) {
                finished.emplace_back(fingerprint, kind, state);
                sendsAtFinish.push_back(link.sent.size());
            });
    }

    size_t commandsSent(const std::string& command) const {
        return link.count(command, kDeviceIp);
    }

    FakeScheduler scheduler;
    RecordingLink link;
    DeviceRegistry registry;
    CommandExecutor executor{scheduler, link, registry, 4003};

    std::vector<std::tuple<std::string, CommandKind, SequenceState>> finished;
    std::vector<size_t> sendsAtFinish;
};

TEST(RetryPolicyTest, Defaults) {
    RetryPolicy policy;
    EXPECT_EQ(policy.status_delay, milliseconds(100));
    ASSERT_EQ(policy.backoff.size(), 11u);
    EXPECT_EQ(policy.backoff.front(), milliseconds(200));
    EXPECT_EQ(policy.backoff.back(), milliseconds(7000));
    EXPECT_EQ(policy.max_retries, 10u);
    EXPECT_EQ(policy.attempts(), 10u);

    policy.max_retries = 50;
    EXPECT_EQ(policy.attempts(), 11u);
}

TEST(PredicatesTest, MatchReportedState) {
    DeviceState state;
    state.on = true;
    state.brightness = 42;
    state.color = Rgb(100, 150, 200);
    state.colorTemperature = 4000;

    EXPECT_TRUE(predicates::powerIs(true)(state));
    EXPECT_FALSE(predicates::powerIs(false)(state));
    EXPECT_TRUE(predicates::brightnessIs(42)(state));
    EXPECT_FALSE(predicates::brightnessIs(43)(state));
    EXPECT_TRUE(predicates::colorNear(Rgb(104, 146, 205))(state));
    EXPECT_FALSE(predicates::colorNear(Rgb(106, 150, 200))(state));
    EXPECT_TRUE(predicates::temperatureNear(4100)(state));
    EXPECT_FALSE(predicates::temperatureNear(4101)(state));
}

TEST(PredicatesTest, ExtremeReportedValuesDoNotMatch) {
    DeviceState state;
    state.color = Rgb(std::numeric_limits<int>::min(), 0, 0);
    state.colorTemperature = std::numeric_limits<int>::min();

    EXPECT_FALSE(predicates::colorNear(Rgb(100, 0, 0))(state));
    EXPECT_FALSE(predicates::temperatureNear(4000)(state));

    state.color = Rgb(std::numeric_limits<int>::max(), 0, 0);
    state.colorTemperature = std::numeric_limits<int>::max();
    EXPECT_FALSE(predicates::colorNear(Rgb(0, 0, 0), std::numeric_limits<int>::max() - 1)(state));
    EXPECT_FALSE(predicates::temperatureNear(-1)(state));
}

TEST_F(CommandExecutorTest, SendsCommandThenStatusRequest) {
    executor.execute(kDevice, CommandKind::BRIGHTNESS, Message::brightness(42),
                     predicates::brightnessIs(42));

    ASSERT_EQ(link.sent.size(), 1u);
    EXPECT_EQ(link.sent[0].ip, kDeviceIp);
    EXPECT_EQ(link.sent[0].port, 4003);
    EXPECT_EQ(lanlight::test::commandOf(link.sent[0].payload), "brightness");
    EXPECT_EQ(executor.sequenceState(kDevice, CommandKind::BRIGHTNESS), SequenceState::SENT);
    EXPECT_TRUE(executor.hasVerification(kDevice));

    scheduler.advance(milliseconds(99));
    EXPECT_EQ(commandsSent("devStatus"), 0u);
    scheduler.advance(milliseconds(1));
    EXPECT_EQ(commandsSent("devStatus"), 1u);
    EXPECT_EQ(executor.sequenceState(kDevice, CommandKind::BRIGHTNESS),
              SequenceState::AWAITING);
}

TEST_F(CommandExecutorTest, ConfirmedBeforeFirstRetry) {
    executor.execute(kDevice, CommandKind::BRIGHTNESS, Message::brightness(42),
                     predicates::brightnessIs(42));

    scheduler.advance(milliseconds(50));
    executor.notifyStatus(kDevice, brightnessState(42));
    scheduler.advance(milliseconds(100));

    EXPECT_EQ(commandsSent("brightness"), 1u);
    EXPECT_EQ(executor.sequenceState(kDevice, CommandKind::BRIGHTNESS),
              SequenceState::VERIFIED);
    EXPECT_FALSE(executor.hasVerification(kDevice));
    EXPECT_EQ(executor.activeCount(), 0u);
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(std::get<2>(finished[0]), SequenceState::VERIFIED);

    // Nothing left to fire
    scheduler.advance(milliseconds(60000));
    EXPECT_EQ(commandsSent("brightness"), 1u);
}

TEST_F(CommandExecutorTest, WrongStateThenRightState) {
    executor.execute(kDevice, CommandKind::BRIGHTNESS, Message::brightness(42),
                     predicates::brightnessIs(42));

    scheduler.advance(milliseconds(150));
    executor.notifyStatus(kDevice, brightnessState(10));

    // First backoff (200 ms) expires at 300 ms: resend
    scheduler.advance(milliseconds(150));
    EXPECT_EQ(commandsSent("brightness"), 2u);
    EXPECT_EQ(commandsSent("devStatus"), 2u);

    scheduler.advance(milliseconds(50));
    executor.notifyStatus(kDevice, brightnessState(42));
    scheduler.runDue();

    EXPECT_EQ(executor.sequenceState(kDevice, CommandKind::BRIGHTNESS),
              SequenceState::VERIFIED);
    EXPECT_EQ(commandsSent("brightness"), 2u);
}

TEST_F(CommandExecutorTest, ExhaustsBackoffSchedule) {
    const auto start = scheduler.now();
    executor.execute(kDevice, CommandKind::BRIGHTNESS, Message::brightness(42),
                     predicates::brightnessIs(42));

    scheduler.advance(milliseconds(23599));
    EXPECT_TRUE(finished.empty());
    scheduler.advance(milliseconds(1));

    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(std::get<2>(finished[0]), SequenceState::EXHAUSTED);
    EXPECT_EQ(scheduler.now() - start, milliseconds(23600));
    EXPECT_EQ(commandsSent("brightness"), 11u);
    EXPECT_EQ(commandsSent("devStatus"), 11u);
    EXPECT_FALSE(executor.hasVerification(kDevice));

    scheduler.advance(milliseconds(60000));
    EXPECT_EQ(commandsSent("brightness"), 11u);
}

TEST_F(CommandExecutorTest, ReducedRetryBudget) {
    executor.setMaxRetries(2);
    executor.execute(kDevice, CommandKind::POWER, Message::turn(true), predicates::powerIs(true));

    // 100 + 200 + 300
    scheduler.advance(milliseconds(600));
    EXPECT_EQ(commandsSent("turn"), 3u);
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(std::get<2>(finished[0]), SequenceState::EXHAUSTED);
}

TEST_F(CommandExecutorTest, BareRetryLoopWithoutPredicate) {
    executor.execute(kDevice, CommandKind::COLOR, Message::color(Rgb(255, 0, 0)));
    EXPECT_FALSE(executor.hasVerification(kDevice));

    // A matching status has no effect without a predicate
    executor.notifyStatus(kDevice, DeviceState());
    scheduler.advance(milliseconds(300));
    EXPECT_EQ(commandsSent("colorwc"), 2u);

    scheduler.advance(milliseconds(23300));
    EXPECT_EQ(commandsSent("colorwc"), 11u);
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(std::get<2>(finished[0]), SequenceState::EXHAUSTED);
}

TEST_F(CommandExecutorTest, NewCommandSupersedesOldBeforeSending) {
    executor.execute(kDevice, CommandKind::POWER, Message::turn(true), predicates::powerIs(true));
    scheduler.advance(milliseconds(400));
    const size_t sendsBefore = link.sent.size();

    executor.execute(kDevice, CommandKind::POWER, Message::turn(false),
                     predicates::powerIs(false));

    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(std::get<1>(finished[0]), CommandKind::POWER);
    EXPECT_EQ(std::get<2>(finished[0]), SequenceState::SUPERSEDED);
    EXPECT_EQ(sendsAtFinish[0], sendsBefore);
    EXPECT_EQ(link.sent.size(), sendsBefore + 1);

    // Only the new sequence is left running; it alone owns the verification
    EXPECT_EQ(executor.activeCount(), 1u);
    executor.notifyStatus(kDevice, DeviceState());
    scheduler.advance(milliseconds(100));
    ASSERT_EQ(finished.size(), 2u);
    EXPECT_EQ(std::get<2>(finished[1]), SequenceState::VERIFIED);
}

TEST_F(CommandExecutorTest, DifferentKindsRunSideBySide) {
    executor.execute(kDevice, CommandKind::POWER, Message::turn(true));
    executor.execute(kDevice, CommandKind::BRIGHTNESS, Message::brightness(42));

    EXPECT_TRUE(finished.empty());
    EXPECT_EQ(executor.activeCount(), 2u);

    scheduler.advance(milliseconds(300));
    EXPECT_EQ(commandsSent("turn"), 2u);
    EXPECT_EQ(commandsSent("brightness"), 2u);
}

TEST_F(CommandExecutorTest, LatestRegistrationOwnsDeviceVerification) {
    executor.execute(kDevice, CommandKind::POWER, Message::turn(true), predicates::powerIs(true));
    executor.execute(kDevice, CommandKind::BRIGHTNESS, Message::brightness(42),
                     predicates::brightnessIs(42));

    executor.notifyStatus(kDevice, brightnessState(42));
    scheduler.advance(milliseconds(100));

    EXPECT_EQ(executor.sequenceState(kDevice, CommandKind::BRIGHTNESS),
              SequenceState::VERIFIED);
    EXPECT_EQ(executor.sequenceState(kDevice, CommandKind::POWER), SequenceState::AWAITING);
}

TEST_F(CommandExecutorTest, UnknownDeviceExhaustsImmediately) {
    executor.execute("no-such-device", CommandKind::POWER, Message::turn(true),
                     predicates::powerIs(true));

    EXPECT_TRUE(link.sent.empty());
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(std::get<2>(finished[0]), SequenceState::EXHAUSTED);
    EXPECT_FALSE(executor.hasVerification("no-such-device"));
}

TEST_F(CommandExecutorTest, RemovedDeviceEndsSequence) {
    executor.execute(kDevice, CommandKind::POWER, Message::turn(true), predicates::powerIs(true));
    registry.remove(kDevice);

    scheduler.advance(milliseconds(100));
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(std::get<2>(finished[0]), SequenceState::EXHAUSTED);
    EXPECT_EQ(scheduler.pending(), 0u);
}

TEST_F(CommandExecutorTest, CancelDeviceStopsEverything) {
    executor.execute(kDevice, CommandKind::POWER, Message::turn(true), predicates::powerIs(true));
    executor.execute(kDevice, CommandKind::COLOR, Message::color(Rgb(1, 2, 3)));
    executor.cancelDevice(kDevice);

    EXPECT_EQ(finished.size(), 2u);
    EXPECT_EQ(executor.activeCount(), 0u);
    EXPECT_FALSE(executor.hasVerification(kDevice));

    const size_t sends = link.sent.size();
    scheduler.advance(milliseconds(60000));
    EXPECT_EQ(link.sent.size(), sends);
}

TEST_F(CommandExecutorTest, CancelAll) {
    registry.upsertFromScan("AA:02", "192.168.1.24", "H6159", CapabilityTable::builtin(),
                            nullptr, scheduler.now());
    executor.execute(kDevice, CommandKind::POWER, Message::turn(true), predicates::powerIs(true));
    executor.execute("AA:02", CommandKind::POWER, Message::turn(true), predicates::powerIs(true));

    executor.cancelAll();
    ASSERT_EQ(finished.size(), 2u);
    for (const auto& entry : finished) {
        EXPECT_EQ(std::get<2>(entry), SequenceState::SUPERSEDED);
    }
    EXPECT_EQ(scheduler.pending(), 0u);
}

TEST_F(CommandExecutorTest, StateNames) {
    EXPECT_STREQ(commandKindToString(CommandKind::BRIGHTNESS), "brightness");
    EXPECT_STREQ(sequenceStateToString(SequenceState::SUPERSEDED), "superseded");
}
