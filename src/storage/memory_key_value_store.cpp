#include "storage/memory_key_value_store.hpp"

#include <mutex>

namespace CKW::Storage {

namespace {

void scanBucket(const MemoryKeyValueStore::BucketMap& buckets, const std::string& bucket,
                const std::string& prefix, const ScanVisitor& visitor) {
    auto bucket_it = buckets.find(bucket);
    if (bucket_it == buckets.end()) {
        return;
    }
    const auto& entries = bucket_it->second;
    for (auto it = entries.lower_bound(prefix); it != entries.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        if (!visitor(it->first, it->second)) {
            break;
        }
    }
}

std::optional<std::string> lookup(const MemoryKeyValueStore::BucketMap& buckets,
                                  const std::string& bucket, const std::string& key) {
    auto bucket_it = buckets.find(bucket);
    if (bucket_it == buckets.end()) {
        return std::nullopt;
    }
    auto it = bucket_it->second.find(key);
    if (it == bucket_it->second.end()) {
        return std::nullopt;
    }
    return it->second;
}

class MemoryReadTransaction : public ReadTransaction {
public:
    explicit MemoryReadTransaction(const MemoryKeyValueStore::BucketMap& buckets) : buckets_(buckets) {}

    std::optional<std::string> get(const std::string& bucket, const std::string& key) const override {
        return lookup(buckets_, bucket, key);
    }

    void scanPrefix(const std::string& bucket, const std::string& prefix,
                    const ScanVisitor& visitor) const override {
        scanBucket(buckets_, bucket, prefix, visitor);
    }

private:
    const MemoryKeyValueStore::BucketMap& buckets_;
};

class MemoryWriteTransaction : public WriteTransaction {
public:
    explicit MemoryWriteTransaction(MemoryKeyValueStore::BucketMap& working) : working_(working) {}

    std::optional<std::string> get(const std::string& bucket, const std::string& key) const override {
        return lookup(working_, bucket, key);
    }

    void scanPrefix(const std::string& bucket, const std::string& prefix,
                    const ScanVisitor& visitor) const override {
        scanBucket(working_, bucket, prefix, visitor);
    }

    void put(const std::string& bucket, const std::string& key, const std::string& value) override {
        working_[bucket][key] = value;
    }

    bool remove(const std::string& bucket, const std::string& key) override {
        auto bucket_it = working_.find(bucket);
        if (bucket_it == working_.end()) {
            return false;
        }
        return bucket_it->second.erase(key) > 0;
    }

private:
    MemoryKeyValueStore::BucketMap& working_;
};

} // namespace

void MemoryKeyValueStore::view(const std::function<void(const ReadTransaction&)>& fn) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    MemoryReadTransaction txn(buckets_);
    fn(txn);
}

void MemoryKeyValueStore::update(const std::function<void(WriteTransaction&)>& fn) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    BucketMap working = buckets_;
    MemoryWriteTransaction txn(working);
    fn(txn);
    buckets_.swap(working);
}

size_t MemoryKeyValueStore::size(const std::string& bucket) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = buckets_.find(bucket);
    return it == buckets_.end() ? 0 : it->second.size();
}

} // namespace CKW::Storage
