// Built with VIGIL_ASSERT_LEVEL="Warning": every assertion site is active.
#include "CaptureSink.hh"

#include <vigil/support/Assert.hh>
#include <vigil/support/Log.hh>

#include <gtest/gtest.h>

#include <cstddef>
#include <string>

using vigil::AssertLevel;

namespace {

static_assert(vigil::k_assert_threshold == AssertLevel::Warning);
static_assert(!vigil::k_assert_quit);

class AssertWarningTest : public ::testing::Test {
protected:
    CaptureSink m_sink;

    void SetUp() override { vigil::set_assert_sink(&m_sink); }
    void TearDown() override { vigil::set_assert_sink(nullptr); }
};

template <typename T>
T checked_divide(T lhs, T rhs) {
    VIGIL_ASSERT(Error, rhs != 0, "division of {} by zero", lhs);
    return lhs / rhs;
}

TEST_F(AssertWarningTest, FailingWarningLogsAndContinues) {
    int x = 0;
    bool continued = false;
    VIGIL_ASSERT(Warning, x > 0);
    continued = true;
    EXPECT_TRUE(continued);
    ASSERT_EQ(m_sink.texts().size(), 1U);
    EXPECT_EQ(m_sink.texts()[0], "Failed assertion:\n\tExpression: (x > 0)");
}

TEST_F(AssertWarningTest, WarningReportsLine) {
    const unsigned int line = __LINE__ + 1;
    VIGIL_ASSERT(Warning, 1 + 1 == 3);
    ASSERT_EQ(m_sink.lines().size(), 1U);
    EXPECT_EQ(m_sink.lines()[0], line);
}

TEST_F(AssertWarningTest, WarningWithFormattedMessage) {
    const int frame = 12;
    const float budget = 16.5F;
    VIGIL_ASSERT(Warning, frame < 10, "frame {} over budget {}ms", frame, budget);
    ASSERT_EQ(m_sink.texts().size(), 1U);
    EXPECT_EQ(m_sink.texts()[0],
              "Failed assertion:\n\tMessage: frame 12 over budget 16.5ms\n\tExpression: (frame < 10)");
}

TEST_F(AssertWarningTest, EmptyMessageOmitted) {
    VIGIL_ASSERT(Warning, false, "");
    ASSERT_EQ(m_sink.texts().size(), 1U);
    EXPECT_EQ(m_sink.texts()[0], "Failed assertion:\n\tExpression: (false)");
}

TEST_F(AssertWarningTest, NotReached) {
    VIGIL_ASSERT_NOT_REACHED(Warning, "unhandled shape type");
    ASSERT_EQ(m_sink.texts().size(), 1U);
    EXPECT_EQ(m_sink.texts()[0], "Failed assertion:\n\tMessage: unhandled shape type\n\tExpression: (false)");
}

TEST_F(AssertWarningTest, ErrorThrowsExactText) {
    std::size_t len = 8;
    std::size_t cap = 4;
    try {
        VIGIL_ASSERT(Error, len < cap, "bound check");
        FAIL() << "expected AssertionFailure";
    } catch (const vigil::AssertionFailure &failure) {
        EXPECT_STREQ(failure.what(), "Failed assertion:\n\tMessage: bound check\n\tExpression: (len < cap)");
        EXPECT_STREQ(failure.expression(), "len < cap");
    }
    EXPECT_TRUE(m_sink.texts().empty());
}

TEST_F(AssertWarningTest, ErrorInterruptsControlFlow) {
    bool continued = false;
    auto body = [&] {
        VIGIL_ASSERT(Error, continued);
        continued = true;
    };
    EXPECT_THROW(body(), vigil::AssertionFailure);
    EXPECT_FALSE(continued);
}

TEST_F(AssertWarningTest, ErrorInTemplate) {
    EXPECT_EQ(checked_divide(9, 3), 3);
    try {
        checked_divide(7, 0);
        FAIL() << "expected AssertionFailure";
    } catch (const vigil::AssertionFailure &failure) {
        EXPECT_STREQ(failure.what(), "Failed assertion:\n\tMessage: division of 7 by zero\n\tExpression: (rhs != 0)");
    }
}

TEST_F(AssertWarningTest, ErrorWithoutQuitLeavesHookAlone) {
    CountingStopHook hook;
    vigil::set_assert_stop_hook(&hook);
    EXPECT_THROW(VIGIL_ASSERT(Error, false), vigil::AssertionFailure);
    vigil::set_assert_stop_hook(nullptr);
    EXPECT_EQ(hook.stop_count(), 0U);
}

TEST_F(AssertWarningTest, ConditionEvaluatedOnce) {
    int calls = 0;
    auto check = [&] {
        calls++;
        return false;
    };
    VIGIL_ASSERT(Warning, check());
    EXPECT_EQ(calls, 1);
    EXPECT_THROW(VIGIL_ASSERT(Error, check()), vigil::AssertionFailure);
    EXPECT_EQ(calls, 2);
}

TEST_F(AssertWarningTest, PassingAssertionHasNoSideEffects) {
    int message_evaluations = 0;
    auto describe = [&] {
        message_evaluations++;
        return 42;
    };
    for (int i = 0; i < 1000; i++) {
        VIGIL_ASSERT(Warning, i >= 0, "value {}", describe());
        VIGIL_ASSERT(Error, i < 1000, "value {}", describe());
    }
    EXPECT_EQ(message_evaluations, 0);
    EXPECT_TRUE(m_sink.texts().empty());
}

TEST_F(AssertWarningTest, MessageEvaluatedOnlyOnFailure) {
    int message_evaluations = 0;
    auto describe = [&] {
        message_evaluations++;
        return 42;
    };
    VIGIL_ASSERT(Warning, false, "value {}", describe());
    EXPECT_EQ(message_evaluations, 1);
    ASSERT_EQ(m_sink.texts().size(), 1U);
    EXPECT_EQ(m_sink.texts()[0], "Failed assertion:\n\tMessage: value 42\n\tExpression: (false)");
}

TEST(AssertDefaultSinkTest, WritesThroughLog) {
    vigil::Log::set_colours_enabled(false);
    ::testing::internal::CaptureStdout();
    const unsigned int line = __LINE__ + 1;
    VIGIL_ASSERT(Warning, 2 < 1);
    const std::string output = ::testing::internal::GetCapturedStdout();
    vigil::Log::set_colours_enabled(true);

    const std::string expected = "WARN  [assert] " + vigil::format_assertion_location(__FILE__, line) +
                                 ": Failed assertion:\n\tExpression: (2 < 1)\n";
    EXPECT_EQ(output, expected);
}

} // namespace
