// EN: Unit tests for the retry executor and retry policies
// FR: Tests unitaires de l'exécuteur de retry et des politiques de retry

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "infrastructure/system/error_recovery.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>

using namespace CKW;
using namespace std::chrono_literals;

namespace {

Workflow::WorkflowError makeError(const std::string& error_type, Workflow::ErrorSeverity severity,
                                  bool retryable = true) {
    Workflow::WorkflowError error;
    error.id = "err-1";
    error.message = "stage failed: " + error_type;
    error.error_type = error_type;
    error.severity = severity;
    error.retryable = retryable;
    error.stage_name = "build";
    return error;
}

} // namespace

// EN: Test fixture recording every requested wait instead of sleeping
// FR: Fixture de test enregistrant chaque attente demandée au lieu de dormir
class RetryExecutorTest : public ::testing::Test {
protected:
    RetryExecutorTest()
        : executor_([this](std::chrono::milliseconds delay, const CancellationToken& token) {
              delays_.push_back(delay);
              if (cancel_on_sleep_) {
                  source_.cancel();
              }
              return !token.isCancelled();
          }) {
        policy_.max_attempts = 3;
        policy_.backoff = BackoffMode::EXPONENTIAL;
        policy_.initial_delay = 100ms;
        policy_.max_delay = 1000ms;
        policy_.backoff_multiplier = 2.0;
    }

    Testing::LogCapture capture_{LogLevel::WARN};
    std::vector<std::chrono::milliseconds> delays_;
    bool cancel_on_sleep_ = false;
    CancellationSource source_;
    RetryPolicy policy_;
    RetryExecutor executor_;
};

TEST(RetryPolicyTest, ExponentialDelaysAreCapped) {
    RetryPolicy policy;
    policy.backoff = BackoffMode::EXPONENTIAL;
    policy.initial_delay = 1000ms;
    policy.max_delay = 5000ms;
    policy.backoff_multiplier = 2.0;

    EXPECT_EQ(policy.delayForAttempt(0), 0ms);
    EXPECT_EQ(policy.delayForAttempt(1), 1000ms);
    EXPECT_EQ(policy.delayForAttempt(2), 2000ms);
    EXPECT_EQ(policy.delayForAttempt(3), 4000ms);
    EXPECT_EQ(policy.delayForAttempt(4), 5000ms);
    EXPECT_EQ(policy.delayForAttempt(10), 5000ms);
}

TEST(RetryPolicyTest, FixedDelayIsConstant) {
    RetryPolicy policy;
    policy.backoff = BackoffMode::FIXED;
    policy.initial_delay = 2000ms;
    policy.max_delay = 60000ms;

    EXPECT_EQ(policy.delayForAttempt(1), 2000ms);
    EXPECT_EQ(policy.delayForAttempt(5), 2000ms);
}

TEST(RetryPolicyTest, BackoffModeParsing) {
    EXPECT_EQ(parseBackoffMode("FIXED"), BackoffMode::FIXED);
    EXPECT_EQ(parseBackoffMode("exponential"), BackoffMode::EXPONENTIAL);
    EXPECT_FALSE(parseBackoffMode("linear").has_value());
    EXPECT_EQ(backoffModeToString(BackoffMode::FIXED), "fixed");
}

TEST_F(RetryExecutorTest, SuccessOnFirstAttempt) {
    int calls = 0;
    int result = executor_.execute("op", policy_, [&calls]() { ++calls; return 42; });

    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(delays_.empty());

    auto stats = executor_.getStatistics();
    EXPECT_EQ(stats.total_operations, 1u);
    EXPECT_EQ(stats.successful_operations, 1u);
    EXPECT_EQ(stats.total_retries, 0u);
}

TEST_F(RetryExecutorTest, RecoverableErrorIsRetriedWithBackoff) {
    int calls = 0;
    executor_.execute("build_image", policy_, [&calls]() {
        if (++calls < 3) {
            throw Workflow::WorkflowException(makeError("network_timeout", Workflow::ErrorSeverity::MEDIUM));
        }
    });

    EXPECT_EQ(calls, 3);
    EXPECT_THAT(delays_, ::testing::ElementsAre(100ms, 200ms));

    auto stats = executor_.getStatistics();
    EXPECT_EQ(stats.successful_operations, 1u);
    EXPECT_EQ(stats.total_retries, 2u);
    EXPECT_EQ(stats.error_counts.at("network_timeout"), 2u);
    EXPECT_EQ(capture_.count(LogLevel::WARN, "error_recovery"), 2u);
}

TEST_F(RetryExecutorTest, ExhaustionCarriesAttemptHistory) {
    int calls = 0;
    try {
        executor_.execute("deploy", policy_, [&calls]() {
            ++calls;
            throw Workflow::WorkflowException(makeError("deploy_timeout", Workflow::ErrorSeverity::HIGH));
        });
        FAIL() << "Expected RetryExhaustedException";
    } catch (const RetryExhaustedException& e) {
        EXPECT_EQ(e.operation(), "deploy");
        ASSERT_EQ(e.attempts().size(), 3u);
        EXPECT_EQ(e.attempts()[0].attempt_number, 1u);
        EXPECT_EQ(e.attempts()[2].error_type, "deploy_timeout");
    }

    EXPECT_EQ(calls, 3);
    EXPECT_EQ(delays_.size(), 2u);
    auto stats = executor_.getStatistics();
    EXPECT_EQ(stats.failed_operations, 1u);
    EXPECT_EQ(stats.total_retries, 2u);
}

TEST_F(RetryExecutorTest, FatalErrorIsNeverRetried) {
    int calls = 0;
    try {
        executor_.execute("auth", policy_, [&calls]() {
            ++calls;
            throw Workflow::WorkflowException(makeError("oauth_authentication_failure_retry",
                                                        Workflow::ErrorSeverity::MEDIUM));
        });
        FAIL() << "Expected NonRecoverableError";
    } catch (const NonRecoverableError& e) {
        ASSERT_TRUE(e.error().has_value());
        EXPECT_EQ(e.error()->error_type, "oauth_authentication_failure_retry");
    }
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(delays_.empty());
}

TEST_F(RetryExecutorTest, CriticalSeverityIsFatal) {
    EXPECT_THROW(executor_.execute("op", policy_, []() {
        throw Workflow::WorkflowException(makeError("anything", Workflow::ErrorSeverity::CRITICAL));
    }), NonRecoverableError);
}

TEST_F(RetryExecutorTest, NonRetryableErrorPropagatesUnchanged) {
    int calls = 0;
    EXPECT_THROW(executor_.execute("op", policy_, [&calls]() {
        ++calls;
        throw Workflow::WorkflowException(makeError("validation_error", Workflow::ErrorSeverity::LOW, false));
    }), Workflow::WorkflowException);
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryExecutorTest, InfrastructureErrorPropagatesImmediately) {
    int calls = 0;
    EXPECT_THROW(executor_.execute("op", policy_, [&calls]() {
        ++calls;
        throw std::runtime_error("storage transaction failed");
    }), std::runtime_error);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(executor_.getStatistics().failed_operations, 1u);
}

TEST_F(RetryExecutorTest, CancellationDuringWaitStopsRetrying) {
    cancel_on_sleep_ = true;
    int calls = 0;
    try {
        executor_.execute("op", policy_, [&calls]() {
            ++calls;
            throw Workflow::WorkflowException(makeError("network_timeout", Workflow::ErrorSeverity::LOW));
        }, source_.token());
        FAIL() << "Expected RetryCancelledException";
    } catch (const RetryCancelledException& e) {
        EXPECT_EQ(e.attempts(), 1u);
    }
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(executor_.getStatistics().cancelled_operations, 1u);
}

TEST_F(RetryExecutorTest, AlreadyCancelledTokenSkipsTheCall) {
    source_.cancel();
    bool called = false;
    EXPECT_THROW(executor_.execute("op", policy_, [&called]() { called = true; }, source_.token()),
                 RetryCancelledException);
    EXPECT_FALSE(called);
}

TEST_F(RetryExecutorTest, ResetStatistics) {
    executor_.execute("op", policy_, []() {});
    executor_.resetStatistics();
    EXPECT_EQ(executor_.getStatistics().total_operations, 0u);
}

TEST(InterruptibleSleepTest, CancellationWakesTheSleeper) {
    CancellationSource source;
    auto start = std::chrono::steady_clock::now();
    std::thread canceller([&source]() {
        std::this_thread::sleep_for(20ms);
        source.cancel();
    });

    bool completed = RetryExecutor::interruptibleSleep(10s, source.token());
    canceller.join();

    EXPECT_FALSE(completed);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(InterruptibleSleepTest, FullWaitReturnsTrue) {
    EXPECT_TRUE(RetryExecutor::interruptibleSleep(5ms, CancellationToken()));
}
