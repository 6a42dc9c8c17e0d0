#include "common/JsonUtils.h"
#include "common/Logger.h"
#include "parsing/GraphLoader.h"
#include <iostream>

// Classic vending machine selling $0.10 candy bars for nickels and dimes.
// Reaching $0.10 dispenses the candy and resets; overpaying returns change.

namespace {

class ConsoleObserver : public ACE::IEngineObserver {
public:
    void onStateChange(const ACE::StateChangeInfo &info) override {
        std::cout << "> Changing state: " << info.from << " -> " << info.to << "\n";
    }

    void onReset(const ACE::ResetInfo &info) override {
        std::cout << "> Resetting machine from " << info.priorStateName << " after " << info.history.size()
                  << " records\n";
    }

    void onValueProduced(const ACE::Value &value) override {
        std::cout << "> Hit an accepting state, got: " << ACE::JsonUtils::toCompactString(value) << "\n";
    }

    void onRuntimeError(const ACE::RuntimeErrorInfo &info) override {
        std::cout << "> Rejected coin: " << info.message << "\n";
    }
};

}  // namespace

int main(int argc, char *argv[]) {
    using namespace ACE;

    Logger::initialize();

    std::string graphPath = argc > 1 ? argv[1] : "vending_machine.json";

    auto registry = std::make_shared<FunctionRegistry>();
    registry->registerAccept("dispenseCandy", [](const Value &, const History &) -> std::optional<Value> {
        return Value{{"candyBars", 1}};
    });
    registry->registerAccept("returnNickel", [](const Value &, const History &) -> std::optional<Value> {
        return Value{{"change", 0.05}};
    });

    std::shared_ptr<AutomatonEngine> machine;
    try {
        GraphLoader loader(registry);
        machine = GraphLoader::createEngine(loader.loadFromFile(graphPath));
    } catch (const std::exception &e) {
        std::cerr << "Failed to load " << graphPath << ": " << e.what() << "\n";
        return 1;
    }

    ConsoleObserver observer;
    machine->addObserver(&observer);

    std::cout << "=== Vending Machine Example ===" << "\n\n";
    std::cout << "> Starting state: " << machine->currentStatus().stateName << "\n\n";

    for (double coin : {0.05, 0.10, 0.05, 0.25}) {
        std::cout << "Inserting " << coin << "\n";
        machine->next(coin, [](const StepOutcome &outcome) {
            std::cout << "  Now at " << outcome.currentStateName << "\n\n";
        });
        machine->runPendingContinuations();
    }

    Logger::flush();
    return 0;
}
