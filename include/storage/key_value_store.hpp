#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace CKW::Storage {

// EN: Raised for any failure of the underlying store (open, transaction, statement).
// FR: Levée pour tout échec du stockage sous-jacent (ouverture, transaction, requête).
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message) : std::runtime_error(message) {}
};

// EN: Visitor for ordered scans; return false to stop early.
// FR: Visiteur pour les parcours ordonnés ; retourner false pour arrêter.
using ScanVisitor = std::function<bool(const std::string& key, const std::string& value)>;

// EN: Read-only view inside a transaction. Keys and values are arbitrary byte strings.
// FR: Vue en lecture seule dans une transaction. Clés et valeurs sont des chaînes d'octets.
class ReadTransaction {
public:
    virtual ~ReadTransaction() = default;

    virtual std::optional<std::string> get(const std::string& bucket, const std::string& key) const = 0;

    // EN: Visit keys starting with `prefix` in ascending byte order. Visitors must not mutate the store.
    // FR: Parcourt les clés commençant par `prefix` en ordre d'octets croissant. Sans mutation.
    virtual void scanPrefix(const std::string& bucket, const std::string& prefix,
                            const ScanVisitor& visitor) const = 0;
};

class WriteTransaction : public ReadTransaction {
public:
    virtual void put(const std::string& bucket, const std::string& key, const std::string& value) = 0;

    // EN: Returns false when the key did not exist.
    // FR: Retourne false si la clé n'existait pas.
    virtual bool remove(const std::string& bucket, const std::string& key) = 0;
};

// EN: Embedded transactional key-value store. `update` commits when the function returns and
//     rolls back when it throws; the exception is propagated unchanged.
// FR: Stockage clé-valeur transactionnel embarqué. `update` valide au retour de la fonction et
//     annule si elle lève ; l'exception est propagée telle quelle.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual void view(const std::function<void(const ReadTransaction&)>& fn) = 0;
    virtual void update(const std::function<void(WriteTransaction&)>& fn) = 0;
};

} // namespace CKW::Storage
