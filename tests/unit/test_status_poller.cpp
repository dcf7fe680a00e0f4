/**
 * @file test_status_poller.cpp
 * @brief Unit tests for periodic status polling
 */

#include <gtest/gtest.h>
#include <lanlight/core/status_poller.hpp>

#include "support/fake_scheduler.hpp"
#include "support/recording_link.hpp"

#include <chrono>

using namespace lanlight::core;
using lanlight::test::FakeScheduler;
using lanlight::test::RecordingLink;
using std::chrono::milliseconds;

class StatusPollerTest : public ::testing::Test {
protected:
    void SetUp() override {
        addDevice("AA:01", "192.168.1.10");
        addDevice("AA:02", "192.168.1.11");
    }

    void addDevice(const std::string& fingerprint, const std::string& ip) {
        registry.upsertFromScan(fingerprint, ip, "H6159", CapabilityTable::builtin(), nullptr,
                                scheduler.now());
    }

    FakeScheduler scheduler;
    RecordingLink link;
    DeviceRegistry registry;
};

TEST_F(StatusPollerTest, PollsEveryDeviceOnStartAndPeriodically) {
    StatusPoller poller(scheduler, link, registry, 4003, true, milliseconds(5000));
    poller.start();

    EXPECT_EQ(link.count("devStatus"), 2u);
    EXPECT_EQ(link.count("devStatus", "192.168.1.10"), 1u);
    EXPECT_EQ(link.sent[0].port, 4003);
    EXPECT_TRUE(poller.isPollScheduled());

    scheduler.advance(milliseconds(4999));
    EXPECT_EQ(link.count("devStatus"), 2u);
    scheduler.advance(milliseconds(1));
    EXPECT_EQ(link.count("devStatus"), 4u);
}

TEST_F(StatusPollerTest, NewDevicesIncludedInNextPoll) {
    StatusPoller poller(scheduler, link, registry, 4003, true, milliseconds(5000));
    poller.start();

    addDevice("AA:03", "192.168.1.12");
    scheduler.advance(milliseconds(5000));
    EXPECT_EQ(link.count("devStatus", "192.168.1.12"), 1u);
}

TEST_F(StatusPollerTest, DisabledPollerSendsNothing) {
    StatusPoller poller(scheduler, link, registry, 4003, false, milliseconds(5000));
    poller.start();

    scheduler.advance(milliseconds(60000));
    EXPECT_TRUE(link.sent.empty());
    EXPECT_FALSE(poller.isPollScheduled());
}

TEST_F(StatusPollerTest, ManualPollWhenDisabledDoesNotReschedule) {
    StatusPoller poller(scheduler, link, registry, 4003, false, milliseconds(5000));
    poller.start();

    EXPECT_EQ(poller.pollAll(), 2u);
    EXPECT_FALSE(poller.isPollScheduled());
}

TEST_F(StatusPollerTest, SetEnabledTogglesPolling) {
    StatusPoller poller(scheduler, link, registry, 4003, false, milliseconds(5000));
    poller.start();

    poller.setEnabled(true);
    EXPECT_EQ(link.count("devStatus"), 2u);

    poller.setEnabled(false);
    scheduler.advance(milliseconds(60000));
    EXPECT_EQ(link.count("devStatus"), 2u);
}

TEST_F(StatusPollerTest, StopCancelsPolling) {
    StatusPoller poller(scheduler, link, registry, 4003, true, milliseconds(5000));
    poller.start();
    poller.stop();

    EXPECT_EQ(poller.pollAll(), 0u);
    scheduler.advance(milliseconds(60000));
    EXPECT_EQ(link.count("devStatus"), 2u);
    EXPECT_EQ(scheduler.pending(), 0u);
}

TEST_F(StatusPollerTest, FailedSendsNotCounted) {
    StatusPoller poller(scheduler, link, registry, 4003, true, milliseconds(5000));
    link.failSends = true;
    poller.start();

    EXPECT_EQ(link.sent.size(), 2u);
    EXPECT_EQ(poller.pollAll(), 0u);
    EXPECT_TRUE(poller.isPollScheduled());
}
