// EN: Unit tests for the PollScheduler state machine
// FR: Tests unitaires de la machine à états du PollScheduler

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "orchestrator/poll_scheduler.hpp"
#include "infrastructure/logging/logger.hpp"

#include <stdexcept>

using namespace SHC::Orchestrator;
using SHC::Consolidation::CycleReport;
using ::testing::Eq;

namespace {

class MockSleeper : public SHC::Sleeper {
public:
    MOCK_METHOD(void, sleepFor, (std::chrono::milliseconds duration), (override));
};

} // namespace

class PollSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        SHC::Logger::getInstance().setLogLevel(SHC::LogLevel::ERROR);
        config_.idle_interval = std::chrono::seconds(14400);
        config_.empty_catalog_retry = std::chrono::seconds(600);
    }

    SHC::ConsolidatorConfig config_;
    ::testing::StrictMock<MockSleeper> sleeper_;
};

TEST_F(PollSchedulerTest, FullPassWaitsIdleInterval) {
    CycleReport report;
    report.sources_listed = 3;
    PollScheduler scheduler(config_, [&report]() { return report; }, sleeper_);

    EXPECT_EQ(scheduler.state(), SchedulerState::IDLE);
    EXPECT_EQ(scheduler.runOnce(), std::chrono::milliseconds(14400 * 1000));
    EXPECT_EQ(scheduler.state(), SchedulerState::IDLE);
    EXPECT_EQ(scheduler.cyclesCompleted(), 1u);
}

TEST_F(PollSchedulerTest, EmptyCatalogWaitsRetryInterval) {
    CycleReport report;
    report.catalog_empty = true;
    PollScheduler scheduler(config_, [&report]() { return report; }, sleeper_);

    EXPECT_EQ(scheduler.runOnce(), std::chrono::milliseconds(600 * 1000));
}

TEST_F(PollSchedulerTest, ThrowingCycleIsContained) {
    PollScheduler scheduler(config_, []() -> CycleReport { throw std::runtime_error("boom"); }, sleeper_);

    EXPECT_NO_THROW({
        EXPECT_EQ(scheduler.runOnce(), std::chrono::milliseconds(600 * 1000));
    });
    EXPECT_EQ(scheduler.state(), SchedulerState::IDLE);
    EXPECT_EQ(scheduler.cyclesCompleted(), 1u);
}

TEST_F(PollSchedulerTest, CycleRunsInRunningState) {
    PollScheduler* self = nullptr;
    SchedulerState observed = SchedulerState::IDLE;
    PollScheduler scheduler(config_, [&]() {
        observed = self->state();
        return CycleReport{};
    }, sleeper_);
    self = &scheduler;

    scheduler.runOnce();
    EXPECT_EQ(observed, SchedulerState::RUNNING);
}

TEST_F(PollSchedulerTest, WaitDelegatesToSleeper) {
    PollScheduler scheduler(config_, []() { return CycleReport{}; }, sleeper_);

    EXPECT_CALL(sleeper_, sleepFor(Eq(std::chrono::milliseconds(1234)))).Times(1);
    scheduler.wait(std::chrono::milliseconds(1234));
    EXPECT_EQ(scheduler.state(), SchedulerState::IDLE);
}

TEST_F(PollSchedulerTest, StateNames) {
    EXPECT_EQ(schedulerStateToString(SchedulerState::RUNNING), "RUNNING");
    EXPECT_EQ(schedulerStateToString(SchedulerState::IDLE), "IDLE");
}
