#include "model/StateNode.h"
#include "model/StateConfig.h"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace ACE;

class StateNodeTest : public ::testing::Test {
protected:
    static StateConfig stateWithLiteral(const Value &literal) {
        StateConfig config("start", true);
        config.outgoingTransitions.push_back(TransitionConfig::onValue("next", literal));
        return config;
    }
};

TEST_F(StateNodeTest, BasicProperties) {
    StateConfig config("idle", true);
    config.outgoingTransitions.push_back(TransitionConfig::always("busy"));

    StateNode node(config);

    EXPECT_EQ("idle", node.getName());
    EXPECT_TRUE(node.isInitial());
    EXPECT_FALSE(node.isTerminal());
    EXPECT_FALSE(node.hasAccept());
    ASSERT_EQ(1u, node.getTransitions().size());
    EXPECT_EQ("busy", node.getTransitions()[0]->getTargetStateName());
    EXPECT_FALSE(node.accept(Value(1), {}).has_value());
}

TEST_F(StateNodeTest, EmptyNameRejected) {
    EXPECT_THROW({ StateNode node(StateConfig("")); }, std::invalid_argument);
}

TEST_F(StateNodeTest, InitialAndTerminalRejected) {
    EXPECT_THROW({ StateNode node(StateConfig("both", true, true)); }, std::invalid_argument);
}

TEST_F(StateNodeTest, TerminalWithTransitionsRejected) {
    StateConfig config("end", false, true);
    config.outgoingTransitions.push_back(TransitionConfig::always("start"));

    EXPECT_THROW({ StateNode node(config); }, std::invalid_argument);
}

TEST_F(StateNodeTest, TransitionWithoutTargetRejected) {
    StateConfig config("start");
    config.outgoingTransitions.push_back(TransitionConfig::onValue("", 1));

    EXPECT_THROW({ StateNode node(config); }, std::invalid_argument);
}

TEST_F(StateNodeTest, TransitionWithoutCriteriaRejected) {
    StateConfig config("start");
    config.outgoingTransitions.emplace_back("next", std::nullopt);

    try {
        StateNode node(config);
        FAIL() << "Expected std::invalid_argument";
    } catch (const std::invalid_argument &e) {
        EXPECT_NE(std::string(e.what()).find("next"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("[ACE:start]"), std::string::npos);
    }
}

TEST_F(StateNodeTest, NullLiteralCriteriaRejected) {
    StateConfig config("start");
    config.outgoingTransitions.push_back(TransitionConfig::onValue("next", nullptr));

    try {
        StateNode node(config);
        FAIL() << "Expected std::invalid_argument";
    } catch (const std::invalid_argument &e) {
        EXPECT_NE(std::string(e.what()).find("must have some criteria"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("next"), std::string::npos);
    }
}

TEST_F(StateNodeTest, EmptyPredicateRejected) {
    StateConfig config("start");
    config.outgoingTransitions.push_back(TransitionConfig::when("next", CriteriaPredicate()));

    EXPECT_THROW({ StateNode node(config); }, std::invalid_argument);
}

TEST_F(StateNodeTest, LiteralCriteriaUsesStrictEquality) {
    StateNode number(stateWithLiteral(5));
    const auto &transition = *number.getTransitions()[0];

    EXPECT_TRUE(transition.isLiteral());
    EXPECT_TRUE(transition.matches(Value(5), nullptr));
    EXPECT_FALSE(transition.matches(Value(6), nullptr));
    EXPECT_FALSE(transition.matches(Value("5"), nullptr));
    EXPECT_FALSE(transition.matches(Value(true), nullptr));
    EXPECT_FALSE(transition.matches(Value(), nullptr));
}

TEST_F(StateNodeTest, FalsyLiteralsAreValidCriteria) {
    StateNode zero(stateWithLiteral(0));
    EXPECT_TRUE(zero.getTransitions()[0]->matches(Value(0), nullptr));
    EXPECT_FALSE(zero.getTransitions()[0]->matches(Value(false), nullptr));

    StateNode no(stateWithLiteral(false));
    EXPECT_TRUE(no.getTransitions()[0]->matches(Value(false), nullptr));
    EXPECT_FALSE(no.getTransitions()[0]->matches(Value(0), nullptr));

    StateNode empty(stateWithLiteral(""));
    EXPECT_TRUE(empty.getTransitions()[0]->matches(Value(""), nullptr));
    EXPECT_FALSE(empty.getTransitions()[0]->matches(Value(), nullptr));
}

TEST_F(StateNodeTest, StringLiteralDoesNotMatchNumber) {
    StateNode node(stateWithLiteral("0.05"));
    const auto &transition = *node.getTransitions()[0];

    EXPECT_TRUE(transition.matches(Value("0.05"), nullptr));
    EXPECT_FALSE(transition.matches(Value(0.05), nullptr));
}

TEST_F(StateNodeTest, PredicateReceivesPreviousState) {
    StateNode previous(StateConfig("red", true));

    StateConfig config("yellow");
    config.outgoingTransitions.push_back(TransitionConfig::when(
        "green", [](const Value &, const StateNode *prev) { return prev && prev->getName() == "red"; }));
    StateNode node(config);

    const auto &transition = *node.getTransitions()[0];
    EXPECT_FALSE(transition.isLiteral());
    EXPECT_TRUE(transition.matches(Value(), &previous));
    EXPECT_FALSE(transition.matches(Value(), nullptr));
}

TEST_F(StateNodeTest, AcceptReceivesInputAndHistory) {
    StateConfig config("total", false, true);
    config.accept = [](const Value &input, const History &history) -> std::optional<Value> {
        return Value{{"input", input}, {"records", history.size()}};
    };

    StateNode node(config);
    ASSERT_TRUE(node.hasAccept());

    History history{{"start", Value()}, {"middle", Value(1)}};
    auto result = node.accept(Value(2), history);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(2, (*result)["input"]);
    EXPECT_EQ(2, (*result)["records"]);
}

TEST_F(StateNodeTest, TransitionOrderPreserved) {
    StateConfig config("start");
    config.outgoingTransitions.push_back(TransitionConfig::onValue("a", 1));
    config.outgoingTransitions.push_back(TransitionConfig::onValue("b", 2));
    config.outgoingTransitions.push_back(TransitionConfig::always("c"));

    StateNode node(config);
    const auto &transitions = node.getTransitions();

    ASSERT_EQ(3u, transitions.size());
    EXPECT_EQ("a", transitions[0]->getTargetStateName());
    EXPECT_EQ("b", transitions[1]->getTargetStateName());
    EXPECT_EQ("c", transitions[2]->getTargetStateName());
    EXPECT_EQ("input == 2", transitions[1]->describeCriteria());
}
