// EN: Error Recovery for CK-Workflow - bounded retries with fixed or exponential backoff for recoverable stage failures
// FR: Récupération d'erreurs pour CK-Workflow - retries bornés avec backoff fixe ou exponentiel pour les échecs récupérables

#pragma once

#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/cancellation.hpp"
#include "workflow/error_classifier.hpp"
#include "workflow/workflow_types.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace CKW {

// EN: Delay growth between two attempts.
// FR: Croissance du délai entre deux tentatives.
enum class BackoffMode {
    FIXED,        // EN: Always initial_delay / FR: Toujours initial_delay
    EXPONENTIAL   // EN: initial_delay * multiplier^(n-1), capped / FR: initial_delay * multiplicateur^(n-1), plafonné
};

std::string backoffModeToString(BackoffMode mode);
std::optional<BackoffMode> parseBackoffMode(const std::string& text);

// EN: Retry policy bound to a tool name or to an escalation class such as "escalated_build".
// FR: Politique de retry associée à un nom d'outil ou à une classe d'escalade comme "escalated_build".
struct RetryPolicy {
    size_t max_attempts{3};                          // EN: Total attempts, first one included / FR: Tentatives totales, première incluse
    BackoffMode backoff{BackoffMode::EXPONENTIAL};
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double backoff_multiplier{2.0};

    // EN: Wait after the given failed attempt (1-based).
    // FR: Attente après la tentative échouée donnée (base 1).
    std::chrono::milliseconds delayForAttempt(size_t attempt) const;

    bool operator==(const RetryPolicy& other) const {
        return max_attempts == other.max_attempts && backoff == other.backoff &&
               initial_delay == other.initial_delay && max_delay == other.max_delay &&
               backoff_multiplier == other.backoff_multiplier;
    }
};

// EN: One failed attempt, kept for diagnostics.
// FR: Une tentative échouée, conservée pour le diagnostic.
struct RetryAttempt {
    size_t attempt_number{0};                        // EN: 1-based / FR: Base 1
    std::chrono::milliseconds delay{0};              // EN: Wait scheduled after this attempt / FR: Attente prévue après cette tentative
    std::chrono::system_clock::time_point timestamp;
    std::string error_message;
    std::string error_type;
};

// EN: Per-executor counters.
// FR: Compteurs par exécuteur.
struct RetryStatistics {
    size_t total_operations{0};
    size_t successful_operations{0};
    size_t failed_operations{0};
    size_t cancelled_operations{0};
    size_t total_retries{0};
    std::map<std::string, size_t> error_counts;      // EN: Failed attempts by error type / FR: Tentatives échouées par type d'erreur
};

// EN: Tracks the attempts of one operation.
// FR: Suit les tentatives d'une opération.
class RetryContext {
public:
    RetryContext(const std::string& operation_name, const RetryPolicy& policy);

    void recordAttempt(const std::string& error_type, const std::string& error_message);

    size_t getCurrentAttempt() const { return current_attempt_; }
    bool canRetry() const { return current_attempt_ < policy_.max_attempts; }
    std::chrono::milliseconds getNextDelay() const { return policy_.delayForAttempt(current_attempt_); }

    const std::string& getOperationName() const { return operation_name_; }
    const RetryPolicy& getPolicy() const { return policy_; }
    const std::vector<RetryAttempt>& getAttempts() const { return attempts_; }

private:
    std::string operation_name_;
    RetryPolicy policy_;
    size_t current_attempt_{0};
    std::vector<RetryAttempt> attempts_;
};

// EN: Failure that must not be retried (fatal domain error).
// FR: Échec qui ne doit pas être retenté (erreur métier fatale).
class NonRecoverableError : public std::runtime_error {
public:
    explicit NonRecoverableError(const std::string& message,
                                 std::optional<Workflow::WorkflowError> error = std::nullopt)
        : std::runtime_error(message), error_(std::move(error)) {}

    const std::optional<Workflow::WorkflowError>& error() const { return error_; }

private:
    std::optional<Workflow::WorkflowError> error_;
};

// EN: Every attempt failed with a recoverable error.
// FR: Toutes les tentatives ont échoué sur une erreur récupérable.
class RetryExhaustedException : public std::runtime_error {
public:
    RetryExhaustedException(const std::string& operation, std::vector<RetryAttempt> attempts)
        : std::runtime_error("Retry exhausted for operation '" + operation + "' after " +
                             std::to_string(attempts.size()) + " attempts"),
          operation_(operation), attempts_(std::move(attempts)) {}

    const std::string& operation() const { return operation_; }
    const std::vector<RetryAttempt>& attempts() const { return attempts_; }

private:
    std::string operation_;
    std::vector<RetryAttempt> attempts_;
};

// EN: The caller cancelled the operation between two attempts.
// FR: L'appelant a annulé l'opération entre deux tentatives.
class RetryCancelledException : public std::runtime_error {
public:
    RetryCancelledException(const std::string& operation, size_t attempts)
        : std::runtime_error("Retry cancelled for operation '" + operation + "' after " +
                             std::to_string(attempts) + " attempts"),
          attempts_(attempts) {}

    size_t attempts() const { return attempts_; }

private:
    size_t attempts_;
};

// EN: Runs an operation under a RetryPolicy. Only WorkflowException failures that are neither fatal
//     nor flagged non-retryable are retried; everything else propagates on the first occurrence.
// FR: Exécute une opération sous une RetryPolicy. Seuls les échecs WorkflowException ni fatals ni
//     marqués non retentables sont retentés ; le reste se propage dès la première occurrence.
class RetryExecutor {
public:
    // EN: Waits for the given duration; returns false when the token was cancelled meanwhile.
    // FR: Attend la durée donnée ; retourne false si le jeton a été annulé entre-temps.
    using Sleeper = std::function<bool(std::chrono::milliseconds, const CancellationToken&)>;

    explicit RetryExecutor(Sleeper sleeper = nullptr);

    template<typename Func>
    auto execute(const std::string& operation_name, const RetryPolicy& policy, Func&& func,
                 const CancellationToken& cancellation = CancellationToken()) -> decltype(func());

    RetryStatistics getStatistics() const;
    void resetStatistics();

    // EN: Default sleeper: condition-variable wait woken by cancellation.
    // FR: Sleeper par défaut : attente sur variable de condition réveillée par l'annulation.
    static bool interruptibleSleep(std::chrono::milliseconds duration, const CancellationToken& cancellation);

private:
    enum class Outcome { SUCCEEDED, FAILED, CANCELLED };

    void recordOutcome(const RetryContext& context, Outcome outcome);
    void logRetryAttempt(const RetryContext& context, const RetryAttempt& attempt) const;

    Sleeper sleeper_;
    mutable std::mutex mutex_;
    RetryStatistics statistics_;
};

} // namespace CKW

// EN: Template implementation
// FR: Implémentation du template

template<typename Func>
auto CKW::RetryExecutor::execute(const std::string& operation_name, const RetryPolicy& policy, Func&& func,
                                 const CancellationToken& cancellation) -> decltype(func()) {
    RetryContext context(operation_name, policy);

    while (true) {
        if (cancellation.isCancelled()) {
            recordOutcome(context, Outcome::CANCELLED);
            throw RetryCancelledException(operation_name, context.getCurrentAttempt());
        }

        try {
            if constexpr (std::is_void_v<decltype(func())>) {
                func();
                recordOutcome(context, Outcome::SUCCEEDED);
                return;
            } else {
                auto result = func();
                recordOutcome(context, Outcome::SUCCEEDED);
                return result;
            }
        } catch (const NonRecoverableError&) {
            recordOutcome(context, Outcome::FAILED);
            throw;
        } catch (const Workflow::WorkflowException& e) {
            const Workflow::WorkflowError& error = e.error();
            if (Workflow::ErrorClassifier::isFatal(error)) {
                recordOutcome(context, Outcome::FAILED);
                throw NonRecoverableError("Fatal error in operation '" + operation_name + "': " + error.message, error);
            }
            if (!error.retryable) {
                recordOutcome(context, Outcome::FAILED);
                throw;
            }

            context.recordAttempt(error.error_type, error.message);
            if (!context.canRetry()) {
                recordOutcome(context, Outcome::FAILED);
                throw RetryExhaustedException(operation_name, context.getAttempts());
            }
            logRetryAttempt(context, context.getAttempts().back());
        } catch (const std::exception&) {
            // EN: Infrastructure failures are the caller's to handle.
            // FR: Les échecs d'infrastructure reviennent à l'appelant.
            recordOutcome(context, Outcome::FAILED);
            throw;
        }

        if (!sleeper_(context.getAttempts().back().delay, cancellation)) {
            recordOutcome(context, Outcome::CANCELLED);
            throw RetryCancelledException(operation_name, context.getCurrentAttempt());
        }
    }
}
