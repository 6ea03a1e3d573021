// EN: Error Recovery implementation for CK-Workflow
// FR: Implémentation de la récupération d'erreurs pour CK-Workflow

#include "infrastructure/system/error_recovery.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <condition_variable>
#include <memory>
#include <sstream>

namespace CKW {

std::string backoffModeToString(BackoffMode mode) {
    switch (mode) {
        case BackoffMode::FIXED:       return "fixed";
        case BackoffMode::EXPONENTIAL: return "exponential";
    }
    return "exponential";
}

std::optional<BackoffMode> parseBackoffMode(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "fixed") {
        return BackoffMode::FIXED;
    }
    if (lower == "exponential") {
        return BackoffMode::EXPONENTIAL;
    }
    return std::nullopt;
}

std::chrono::milliseconds RetryPolicy::delayForAttempt(size_t attempt) const {
    if (attempt == 0) {
        return std::chrono::milliseconds{0};
    }
    if (backoff == BackoffMode::FIXED) {
        return std::min(initial_delay, max_delay);
    }

    // EN: Exponential backoff, capped to max_delay.
    // FR: Backoff exponentiel, plafonné à max_delay.
    double delay_ms = static_cast<double>(initial_delay.count()) *
                      std::pow(backoff_multiplier, static_cast<double>(attempt - 1));
    delay_ms = std::min(delay_ms, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds(static_cast<long long>(delay_ms));
}

RetryContext::RetryContext(const std::string& operation_name, const RetryPolicy& policy)
    : operation_name_(operation_name), policy_(policy) {
    if (policy_.max_attempts == 0) {
        policy_.max_attempts = 1;
    }
}

void RetryContext::recordAttempt(const std::string& error_type, const std::string& error_message) {
    RetryAttempt attempt;
    attempt.attempt_number = ++current_attempt_;
    attempt.timestamp = std::chrono::system_clock::now();
    attempt.error_message = error_message;
    attempt.error_type = error_type;
    attempt.delay = getNextDelay();

    attempts_.push_back(attempt);
}

RetryExecutor::RetryExecutor(Sleeper sleeper)
    : sleeper_(sleeper ? std::move(sleeper) : Sleeper(&RetryExecutor::interruptibleSleep)) {}

RetryStatistics RetryExecutor::getStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return statistics_;
}

void RetryExecutor::resetStatistics() {
    std::lock_guard<std::mutex> lock(mutex_);
    statistics_ = RetryStatistics{};
}

void RetryExecutor::recordOutcome(const RetryContext& context, Outcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);

    statistics_.total_operations++;
    switch (outcome) {
        case Outcome::SUCCEEDED: statistics_.successful_operations++; break;
        case Outcome::FAILED:    statistics_.failed_operations++; break;
        case Outcome::CANCELLED: statistics_.cancelled_operations++; break;
    }

    // EN: The last recorded attempt of an exhausted operation is not followed by a retry.
    // FR: La dernière tentative d'une opération épuisée n'est pas suivie d'un retry.
    const auto& attempts = context.getAttempts();
    size_t retries = attempts.size();
    if (outcome == Outcome::FAILED && retries > 0 && !context.canRetry()) {
        retries--;
    }
    statistics_.total_retries += retries;

    for (const auto& attempt : attempts) {
        statistics_.error_counts[attempt.error_type]++;
    }
}

void RetryExecutor::logRetryAttempt(const RetryContext& context, const RetryAttempt& attempt) const {
    std::ostringstream oss;
    oss << "Attempt " << attempt.attempt_number << "/" << context.getPolicy().max_attempts
        << " of '" << context.getOperationName() << "' failed, retrying in "
        << attempt.delay.count() << "ms: " << attempt.error_message;

    LOG_WARN_META("error_recovery", oss.str(), (std::unordered_map<std::string, std::string>{
        {"operation", context.getOperationName()},
        {"error_type", attempt.error_type},
        {"attempt", std::to_string(attempt.attempt_number)}
    }));
}

bool RetryExecutor::interruptibleSleep(std::chrono::milliseconds duration, const CancellationToken& cancellation) {
    if (duration <= std::chrono::milliseconds(0)) {
        return !cancellation.isCancelled();
    }

    // EN: Shared so a late cancellation callback never touches a finished wait.
    // FR: Partagé pour qu'un callback d'annulation tardif ne touche jamais une attente terminée.
    struct WaitState {
        std::mutex mutex;
        std::condition_variable condition;
        bool cancelled = false;
    };
    auto state = std::make_shared<WaitState>();

    CancellationRegistration registration(cancellation, [state]() {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->cancelled = true;
        }
        state->condition.notify_all();
    });

    std::unique_lock<std::mutex> lock(state->mutex);
    state->condition.wait_for(lock, duration, [&state]() { return state->cancelled; });
    return !state->cancelled;
}

} // namespace CKW
