// ATTESTOR - Database Implementation
// Copyright (c) 2024 ATTESTOR Developers
// MIT License

#include "attestor/db/database.h"
#include "attestor/db/leveldb.h"
#include "attestor/db/memory.h"
#include "attestor/util/logging.h"

#include <iterator>
#include <vector>

namespace attestor {
namespace db {

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string result;
    switch (code_) {
        case NOT_FOUND: result = "NotFound: "; break;
        case CORRUPTION: result = "Corruption: "; break;
        case NOT_SUPPORTED: result = "NotSupported: "; break;
        case INVALID_ARGUMENT: result = "InvalidArgument: "; break;
        case IO_ERROR: result = "IOError: "; break;
        default: result = "Unknown: "; break;
    }
    return result + message_;
}

// ============================================================================
// LevelDB
// ============================================================================

Status LevelDBDatabase::ConvertStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

Status LevelDBIterator::status() const {
    return LevelDBDatabase::ConvertStatus(iter_->status());
}

LevelDBDatabase::LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                                 const leveldb::FilterPolicy* filter,
                                 const std::filesystem::path& path)
    : db_(db), cache_(cache), filterPolicy_(filter), path_(path) {}

LevelDBDatabase::~LevelDBDatabase() {
    // The DB references the cache and filter; close it first
    db_.reset();
    cache_.reset();
    filterPolicy_.reset();
}

Status LevelDBDatabase::Get(const Slice& key, std::string* value) {
    return ConvertStatus(db_->Get(leveldb::ReadOptions(),
                                  leveldb::Slice(key.data(), key.size()), value));
}

Status LevelDBDatabase::Put(const WriteOptions& options, const Slice& key, const Slice& value) {
    leveldb::WriteOptions lo;
    lo.sync = options.sync;
    return ConvertStatus(db_->Put(lo, leveldb::Slice(key.data(), key.size()),
                                  leveldb::Slice(value.data(), value.size())));
}

Status LevelDBDatabase::Delete(const WriteOptions& options, const Slice& key) {
    leveldb::WriteOptions lo;
    lo.sync = options.sync;
    return ConvertStatus(db_->Delete(lo, leveldb::Slice(key.data(), key.size())));
}

Status LevelDBDatabase::Write(const WriteOptions& options, WriteBatch* batch) {
    leveldb::WriteBatch lb;
    batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            lb.Put(key, *value);
        } else {
            lb.Delete(key);
        }
    });
    leveldb::WriteOptions lo;
    lo.sync = options.sync;
    return ConvertStatus(db_->Write(lo, &lb));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator() {
    return std::make_unique<LevelDBIterator>(db_->NewIterator(leveldb::ReadOptions()));
}

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.paranoid_checks = options.paranoid_checks;
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;

    std::unique_ptr<leveldb::Cache> cache;
    if (options.block_cache_size > 0) {
        cache.reset(leveldb::NewLRUCache(options.block_cache_size));
        lo.block_cache = cache.get();
    }

    std::unique_ptr<const leveldb::FilterPolicy> filter;
    if (options.bloom_filter_bits > 0) {
        filter.reset(leveldb::NewBloomFilterPolicy(options.bloom_filter_bits));
        lo.filter_policy = filter.get();
    }

    leveldb::DB* db = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &db);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "open " << path.string() << " failed: " << s.ToString();
        return {LevelDBDatabase::ConvertStatus(s), nullptr};
    }

    LOG_INFO(util::LogCategory::DB) << "opened " << path.string();
    return {Status::Ok(),
            std::make_unique<LevelDBDatabase>(db, cache.release(), filter.release(), path)};
}

Status DestroyDatabase(const std::filesystem::path& path) {
    return LevelDBDatabase::ConvertStatus(leveldb::DestroyDB(path.string(), leveldb::Options()));
}

// ============================================================================
// Memory
// ============================================================================

namespace {

class MemoryIterator : public Iterator {
public:
    explicit MemoryIterator(std::vector<std::pair<std::string, std::string>> rows)
        : rows_(std::move(rows)), pos_(rows_.size()) {}

    bool Valid() const override { return pos_ < rows_.size(); }
    void SeekToFirst() override { pos_ = 0; }

    void Seek(const Slice& target) override {
        std::string t = target.ToString();
        pos_ = 0;
        while (pos_ < rows_.size() && rows_[pos_].first < t) {
            ++pos_;
        }
    }

    void Next() override {
        if (pos_ < rows_.size()) {
            ++pos_;
        }
    }

    Slice key() const override { return Slice(rows_[pos_].first); }
    Slice value() const override { return Slice(rows_[pos_].second); }
    Status status() const override { return Status::Ok(); }

private:
    std::vector<std::pair<std::string, std::string>> rows_;
    size_t pos_;
};

} // namespace

Status MemoryDatabase::Get(const Slice& key, std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key.ToString());
    if (it == data_.end()) {
        return Status::NotFound();
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const WriteOptions&, const Slice& key, const Slice& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key.ToString()] = value.ToString();
    return Status::Ok();
}

Status MemoryDatabase::Delete(const WriteOptions&, const Slice& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.erase(key.ToString());
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteOptions&, WriteBatch* batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    batch->Iterate([this](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            data_[key] = *value;
        } else {
            data_.erase(key);
        }
    });
    ++batches_;
    return Status::Ok();
}

std::unique_ptr<Iterator> MemoryDatabase::NewIterator() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<std::string, std::string>> rows(data_.begin(), data_.end());
    return std::make_unique<MemoryIterator>(std::move(rows));
}

size_t MemoryDatabase::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

size_t MemoryDatabase::BatchCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return batches_;
}

} // namespace db
} // namespace attestor
