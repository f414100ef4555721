// EN: Blocking wait abstraction so pauses and idle intervals can be replaced in tests.
// FR: Abstraction d'attente bloquante pour remplacer pauses et intervalles d'inactivité dans les tests.

#pragma once

#include <chrono>
#include <thread>

namespace SHC {

class Sleeper {
public:
    virtual ~Sleeper() = default;

    // EN: Block the calling thread for the given duration.
    // FR: Bloque le thread appelant pendant la durée donnée.
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

// EN: Production sleeper backed by std::this_thread::sleep_for.
// FR: Sleeper de production basé sur std::this_thread::sleep_for.
class ThreadSleeper : public Sleeper {
public:
    void sleepFor(std::chrono::milliseconds duration) override {
        if (duration.count() > 0) {
            std::this_thread::sleep_for(duration);
        }
    }
};

} // namespace SHC
