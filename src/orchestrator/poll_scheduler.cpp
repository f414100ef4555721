// EN: PollScheduler implementation.
// FR: Implémentation du PollScheduler.

#include "orchestrator/poll_scheduler.hpp"
#include "infrastructure/logging/logger.hpp"

#include <exception>
#include <utility>

namespace SHC {
namespace Orchestrator {

namespace {
constexpr const char* MODULE = "scheduler";
}

std::string schedulerStateToString(SchedulerState state) {
    switch (state) {
        case SchedulerState::RUNNING: return "RUNNING";
        case SchedulerState::IDLE: return "IDLE";
    }
    return "UNKNOWN";
}

PollScheduler::PollScheduler(const ConsolidatorConfig& config, CycleFunction cycle, Sleeper& sleeper)
    : config_(config), cycle_(std::move(cycle)), sleeper_(sleeper) {}

std::chrono::milliseconds PollScheduler::runOnce() {
    state_ = SchedulerState::RUNNING;

    std::chrono::milliseconds next_wait = config_.idle_interval;
    try {
        const auto report = cycle_();
        if (report.catalog_empty) {
            next_wait = config_.empty_catalog_retry;
        }
    } catch (const std::exception& e) {
        LOG_ERROR_META(MODULE, "Cycle aborted", (Logger::Metadata{{"error", e.what()}}));
        next_wait = config_.empty_catalog_retry;
    }

    ++cycles_completed_;
    state_ = SchedulerState::IDLE;
    return next_wait;
}

void PollScheduler::wait(std::chrono::milliseconds duration) {
    state_ = SchedulerState::IDLE;
    LOG_INFO_META(MODULE, "Sleeping until next cycle", (Logger::Metadata{
        {"seconds", std::to_string(std::chrono::duration_cast<std::chrono::seconds>(duration).count())}}));
    sleeper_.sleepFor(duration);
}

void PollScheduler::run() {
    for (;;) {
        wait(runOnce());
    }
}

} // namespace Orchestrator
} // namespace SHC
