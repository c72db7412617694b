// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Implementation of the RocksDB-based evaluation cache.
 */

#include "acefit/EvaluationCache.hpp"

#include <cstring>
#include <rocksdb/options.h>

#include "acefit/Log.hpp"
#include "acefit/errors.hpp"

namespace acefit::cache {

/**
 * @details
 * If the open fails the failure is logged and the cache stays detached, so
 * every lookup misses and every write is dropped; assembly then proceeds
 * without caching.
 */
EvaluationCache::EvaluationCache(const std::string &db_path,
                                 bool create_if_missing) {
  rocksdb::Options options;
  options.create_if_missing = create_if_missing;
  rocksdb::Status status = rocksdb::DB::Open(options, db_path, &db_);
  if (!status.ok()) {
    log::error("Unable to open RocksDB at {}: {}", db_path, status.ToString());
    db_ = nullptr;
  } else {
    own_db_ = true;
  }
}

EvaluationCache::~EvaluationCache() {
  if (own_db_ && db_) {
    delete db_;
  }
}

/**
 * @details
 * An owned database is closed first.  The new pointer is borrowed.
 */
void EvaluationCache::set_db(rocksdb::DB *db) {
  if (own_db_ && db_)
    delete db_;
  db_ = db;
  own_db_ = false;
}

/**
 * @details
 * The layout is a plain array of doubles, @c values.size() entries long.
 */
void EvaluationCache::deserialize_hit(const std::string &hit,
                                      std::vector<double> &values) {
  details::require_shape(hit.size() == values.size() * sizeof(double),
                         "cached evaluation has {} values, expected {}",
                         hit.size() / sizeof(double), values.size());
  std::memcpy(values.data(), hit.data(), hit.size());
}

void EvaluationCache::add_serialized(const KeyHash &kv,
                                     const std::vector<double> &values) {
  if (!db_)
    return;
  rocksdb::Slice value(reinterpret_cast<const char *>(values.data()),
                       values.size() * sizeof(double));
  rocksdb::Status s = db_->Put(rocksdb::WriteOptions(), kv.key, value);
  if (!s.ok()) {
    log::warn("Failed to cache evaluation {}: {}", kv.key, s.ToString());
  }
}

std::optional<std::string> EvaluationCache::find(const KeyHash &kv) {
  if (!db_)
    return std::nullopt;
  std::string value;
  rocksdb::Status s = db_->Get(rocksdb::ReadOptions(), kv.key, &value);
  if (s.ok()) {
    return value;
  }
  return std::nullopt;
}

} // namespace acefit::cache
