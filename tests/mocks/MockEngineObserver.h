#pragma once

#include "runtime/IEngineObserver.h"
#include <gmock/gmock.h>

namespace ACE {
namespace Test {

/**
 * @brief gmock observer for asserting notification content and order
 */
class MockEngineObserver : public IEngineObserver {
public:
    MOCK_METHOD(void, onStateChange, (const StateChangeInfo &info), (override));
    MOCK_METHOD(void, onReset, (const ResetInfo &info), (override));
    MOCK_METHOD(void, onValueProduced, (const Value &value), (override));
    MOCK_METHOD(void, onRuntimeError, (const RuntimeErrorInfo &info), (override));
};

/**
 * @brief Observer that records every notification as a line of text
 *
 * Used where the interleaving of notifications and continuations matters more
 * than the payloads.
 */
class RecordingEngineObserver : public IEngineObserver {
public:
    void onStateChange(const StateChangeInfo &info) override {
        events.push_back("change:" + info.from + "->" + info.to);
    }

    void onReset(const ResetInfo &info) override {
        events.push_back("reset:" + info.priorStateName);
    }

    void onValueProduced(const Value &value) override {
        events.push_back("value:" + value.dump());
    }

    void onRuntimeError(const RuntimeErrorInfo &info) override {
        events.push_back("error:" + info.currentStateName);
    }

    std::vector<std::string> events;
};

}  // namespace Test
}  // namespace ACE
