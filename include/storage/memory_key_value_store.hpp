#pragma once

#include "storage/key_value_store.hpp"

#include <map>
#include <shared_mutex>
#include <string>

namespace CKW::Storage {

// EN: In-process store. Updates run against a private copy that replaces the committed data only
//     when the transaction function returns, so a throwing update leaves nothing behind.
// FR: Stockage en mémoire. Les mises à jour travaillent sur une copie privée qui remplace les
//     données validées uniquement au retour de la fonction ; une mise à jour qui lève ne laisse rien.
class MemoryKeyValueStore : public KeyValueStore {
public:
    using BucketMap = std::map<std::string, std::map<std::string, std::string>>;

    MemoryKeyValueStore() = default;

    void view(const std::function<void(const ReadTransaction&)>& fn) override;
    void update(const std::function<void(WriteTransaction&)>& fn) override;

    size_t size(const std::string& bucket) const;

private:
    BucketMap buckets_;
    mutable std::shared_mutex mutex_;
};

} // namespace CKW::Storage
