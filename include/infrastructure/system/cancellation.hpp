#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace CKW {

namespace detail {
struct CancellationState {
    std::mutex mutex;
    bool cancelled = false;
    std::size_t next_id = 1;
    std::map<std::size_t, std::function<void()>> callbacks;
};
} // namespace detail

// EN: Read side of a cooperative cancellation signal. A default token is never cancelled.
// FR: Côté lecture d'un signal d'annulation coopératif. Un jeton par défaut n'est jamais annulé.
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancelled() const;
    bool canBeCancelled() const { return state_ != nullptr; }

    // EN: Register a callback run once on cancellation (immediately if already cancelled).
    //     Returns a registration id, 0 when the token cannot be cancelled.
    // FR: Enregistre un callback exécuté une fois à l'annulation (immédiatement si déjà annulé).
    //     Retourne un identifiant, 0 si le jeton ne peut pas être annulé.
    std::size_t onCancel(std::function<void()> callback) const;
    void removeCallback(std::size_t registration_id) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

// EN: Write side: owns the state and triggers cancellation.
// FR: Côté écriture : possède l'état et déclenche l'annulation.
class CancellationSource {
public:
    CancellationSource();

    CancellationToken token() const { return CancellationToken(state_); }
    void cancel();
    bool isCancelled() const;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

// EN: RAII registration of a cancellation callback.
// FR: Enregistrement RAII d'un callback d'annulation.
class CancellationRegistration {
public:
    CancellationRegistration(const CancellationToken& token, std::function<void()> callback)
        : token_(token), id_(token.onCancel(std::move(callback))) {}
    ~CancellationRegistration() {
        if (id_ != 0) {
            token_.removeCallback(id_);
        }
    }

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

private:
    CancellationToken token_;
    std::size_t id_;
};

} // namespace CKW
