// EN: Unbounded polling loop alternating consolidation cycles and idle waits.
// FR: Boucle d'interrogation sans fin alternant cycles de consolidation et attentes.

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <string>

#include "consolidation/consolidation_cycle.hpp"
#include "infrastructure/config/consolidator_config.hpp"
#include "infrastructure/system/sleeper.hpp"

namespace SHC {
namespace Orchestrator {

// EN: Scheduler states. There is no terminal state.
// FR: États de l'ordonnanceur. Il n'y a pas d'état terminal.
enum class SchedulerState {
    RUNNING,    // EN: A cycle is in progress / FR: Un cycle est en cours
    IDLE        // EN: Waiting for the next cycle / FR: En attente du prochain cycle
};

std::string schedulerStateToString(SchedulerState state);

class PollScheduler {
public:
    using CycleFunction = std::function<Consolidation::CycleReport()>;

    PollScheduler(const ConsolidatorConfig& config, CycleFunction cycle, Sleeper& sleeper);

    // EN: Run one cycle and return how long to stay idle: the idle interval after a full pass,
    //     the retry interval when the catalog was empty or the cycle threw.
    // FR: Exécute un cycle et retourne la durée d'inactivité : l'intervalle normal après un passage
    //     complet, l'intervalle de reprise si le catalogue était vide ou si le cycle a levé une exception.
    std::chrono::milliseconds runOnce();

    void wait(std::chrono::milliseconds duration);

    // EN: runOnce() then wait(), forever.
    // FR: runOnce() puis wait(), indéfiniment.
    [[noreturn]] void run();

    SchedulerState state() const { return state_.load(); }
    size_t cyclesCompleted() const { return cycles_completed_.load(); }

private:
    const ConsolidatorConfig& config_;
    CycleFunction cycle_;
    Sleeper& sleeper_;
    std::atomic<SchedulerState> state_{SchedulerState::IDLE};
    std::atomic<size_t> cycles_completed_{0};
};

} // namespace Orchestrator
} // namespace SHC
