#include "common/Logger.h"
#include "common/CapturingLoggerBackend.h"
#include "runtime/AutomatonEngine.h"
#include <gtest/gtest.h>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

using namespace ACE;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<Test::CapturingLoggerBackend::Store>();
        previous_ = Logger::setBackend(std::make_unique<Test::CapturingLoggerBackend>(store_));
    }

    void TearDown() override {
        Logger::setBackend(std::move(previous_));
    }

    static void emitFromNamedFunction() {
        LOG_WARN("value {} of {}", 3, "five");
    }

    std::shared_ptr<Test::CapturingLoggerBackend::Store> store_;
    std::unique_ptr<ILoggerBackend> previous_;
};

TEST_F(LoggerTest, FormatsMessageWithFunctionName) {
    emitFromNamedFunction();

    ASSERT_EQ(1u, store_->logs.size());
    EXPECT_EQ(LogLevel::Warn, store_->logs[0].level);
    EXPECT_NE(std::string::npos, store_->logs[0].message.find("emitFromNamedFunction() - value 3 of five"));
}

TEST_F(LoggerTest, SetBackendReturnsPreviousBackend) {
    auto other = std::make_shared<Test::CapturingLoggerBackend::Store>();
    auto mine = Logger::setBackend(std::make_unique<Test::CapturingLoggerBackend>(other));
    ASSERT_NE(nullptr, mine);

    LOG_INFO("routed");
    Logger::setBackend(std::move(mine));
    LOG_INFO("restored");

    EXPECT_TRUE(other->contains(LogLevel::Info, "routed"));
    EXPECT_FALSE(other->contains(LogLevel::Info, "restored"));
    EXPECT_TRUE(store_->contains(LogLevel::Info, "restored"));
}

TEST_F(LoggerTest, BackendSwapDuringConcurrentLogging) {
    constexpr int writers = 4;
    constexpr int perWriter = 200;
    std::vector<std::shared_ptr<Test::CapturingLoggerBackend::Store>> stores{store_};

    std::vector<std::thread> threads;
    for (int w = 0; w < writers; ++w) {
        threads.emplace_back([w] {
            for (int i = 0; i < perWriter; ++i) {
                LOG_INFO("writer {} line {}", w, i);
            }
        });
    }
    // Replaced backends are destroyed here while the writers keep logging
    for (int swap = 0; swap < 50; ++swap) {
        stores.push_back(std::make_shared<Test::CapturingLoggerBackend::Store>());
        Logger::setBackend(std::make_unique<Test::CapturingLoggerBackend>(stores.back()));
    }
    for (auto &thread : threads) {
        thread.join();
    }

    size_t total = 0;
    for (const auto &store : stores) {
        total += store->logs.size();
    }
    EXPECT_EQ(static_cast<size_t>(writers * perWriter), total);
}

TEST_F(LoggerTest, LevelFilterApplied) {
    Logger::setLevel(LogLevel::Error);

    LOG_INFO("dropped");
    LOG_ERROR("kept");

    ASSERT_EQ(1u, store_->logs.size());
    EXPECT_TRUE(store_->contains(LogLevel::Error, "kept"));
}

TEST_F(LoggerTest, EngineStepsTracedAtDebugLevel) {
    AutomatonEngine engine(EngineConfig{"quiet"});
    StateConfig start("start", true);
    start.outgoingTransitions.push_back(TransitionConfig::always("start"));
    engine.addState(start);

    engine.next(1);

    EXPECT_TRUE(store_->contains(LogLevel::Debug, "[ACE:quiet] start -> start on 1"));
    EXPECT_FALSE(store_->contains(LogLevel::Info, "start -> start"));
}

TEST_F(LoggerTest, DebugOptionRaisesTracingToInfo) {
    AutomatonEngine engine(EngineConfig{"verbose", 0, false, true});
    StateConfig start("start", true);
    start.outgoingTransitions.push_back(TransitionConfig::always("start"));
    engine.addState(start);

    engine.next("tick");

    EXPECT_TRUE(store_->contains(LogLevel::Info, "[ACE:verbose] start -> start on \"tick\""));
}

TEST_F(LoggerTest, RuntimeErrorsLoggedAtErrorLevel) {
    AutomatonEngine engine(EngineConfig{"strict"});
    engine.addState(StateConfig("start", true));

    engine.next(5);

    EXPECT_TRUE(store_->contains(LogLevel::Error, "[ACE:strict] Cannot find valid transition from: \"start\""));
}
