// ATTESTOR - In-Memory Database
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#ifndef ATTESTOR_DB_MEMORY_H
#define ATTESTOR_DB_MEMORY_H

#include "attestor/db/database.h"

#include <map>
#include <mutex>

namespace attestor {
namespace db {

/**
 * Ordered map behind the Database interface. Iterators walk a snapshot
 * taken when they are created.
 */
class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    Status Get(const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator() override;

    using Database::Put;
    using Database::Delete;
    using Database::Write;

    size_t Size() const;

    /// Number of successful Write() calls (one per applied batch)
    size_t BatchCount() const;

private:
    std::map<std::string, std::string> data_;
    size_t batches_{0};
    mutable std::mutex mutex_;
};

} // namespace db
} // namespace attestor

#endif // ATTESTOR_DB_MEMORY_H
