#include "common/Logger.h"
#include "common/JsonUtils.h"
#include "runtime/AutomatonEngine.h"
#include <iostream>
#include <stdexcept>

namespace {

// Prints every notification the engine emits
class ConsoleObserver : public ACE::IEngineObserver {
public:
    void onStateChange(const ACE::StateChangeInfo &info) override {
        std::cout << "> Changing state: " << info.from << " -> " << info.to << " (history " << info.history.size()
                  << ")\n";
    }

    void onReset(const ACE::ResetInfo &info) override {
        std::cout << "> Resetting machine from " << info.priorStateName << "\n";
    }

    void onValueProduced(const ACE::Value &value) override {
        std::cout << "> Hit an accepting state, got: " << ACE::JsonUtils::toCompactString(value) << "\n";
    }

    void onRuntimeError(const ACE::RuntimeErrorInfo &info) override {
        std::cout << "> Error: " << info.message << "\n";
    }
};

}  // namespace

int main() {
    using namespace ACE;

    Logger::initialize();

    std::cout << "=== Stoplight Example ===" << "\n\n";

    // Circular machine without terminal states; maxHistory keeps the log from growing forever
    AutomatonEngine stoplight(EngineConfig{"stoplight", 3, false, true});

    ConsoleObserver observer;
    stoplight.addObserver(&observer);

    auto cameFrom = [](const std::string &name) {
        return [name](const Value &, const StateNode *previous) { return previous && previous->getName() == name; };
    };

    StateConfig red("red", true);
    red.outgoingTransitions.push_back(TransitionConfig::always("yellow"));

    // Yellow inspects the previous state to pick the next one
    StateConfig yellow("yellow");
    yellow.outgoingTransitions.push_back(TransitionConfig::when("green", cameFrom("red")));
    yellow.outgoingTransitions.push_back(TransitionConfig::when("red", cameFrom("green")));

    StateConfig green("green");
    green.outgoingTransitions.push_back(TransitionConfig::always("yellow"));

    try {
        stoplight.addStates({red, yellow, green});
    } catch (const std::invalid_argument &e) {
        std::cerr << "Invalid graph: " << e.what() << "\n";
        return 1;
    }

    // The input does not matter, it only drives the light forward
    for (int tick = 0; tick <= 10; ++tick) {
        stoplight.next(tick, [](const StepOutcome &outcome) {
            std::cout << "  Light is now " << outcome.currentStateName << "\n";
        });
        stoplight.runPendingContinuations();
    }

    auto status = stoplight.currentStatus();
    std::cout << "\nFinal state: " << status.stateName << ", last " << status.history.size() << " records:\n";
    for (const auto &record : status.history) {
        std::cout << "  " << record.stateName << " <- " << ACE::JsonUtils::toCompactString(record.input) << "\n";
    }

    Logger::flush();
    return 0;
}
