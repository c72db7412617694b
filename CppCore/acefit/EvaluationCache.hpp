#pragma once
// MIT License
// Copyright 2023--present acefit developers

/**
 * @brief Header file for the EvaluationCache class.
 *
 * Basis evaluations dominate the cost of assembling a design matrix, and the
 * same training set is typically assembled many times while a basis is being
 * tuned.  This cache stores flat evaluation results in RocksDB, keyed by a
 * hash of the configuration, the basis and the request.
 */

#include <optional>
#include <rocksdb/db.h>
#include <string>
#include <vector>

namespace acefit::cache {

/**
 * @class KeyHash
 * @brief Struct to hold the hash and string key for caching.
 * @ingroup acefit_cache
 */
struct KeyHash {
  size_t hash;     //!< The numeric hash value.
  std::string key; //!< The string representation of the hash.

  /**
   * @brief Constructor for KeyHash.
   * @param _hash The numeric hash to wrap.
   */
  KeyHash(size_t _hash) : hash{_hash}, key(std::to_string(_hash)) {}
};

/**
 * @class EvaluationCache
 * @brief Caches flat basis evaluation results using RocksDB.
 * @ingroup acefit_cache
 */
class EvaluationCache {
private:
  rocksdb::DB *db_ = nullptr; //!< Pointer to the RocksDB instance.
  bool own_db_ = false;       //!< Ownership flag for the DB pointer.

public:
  /**
   * @brief Constructor opens the DB at the given path.
   * @param db_path Path to the RocksDB database.
   * @param create_if_missing Toggle creation of DB if absent.
   */
  explicit EvaluationCache(const std::string &db_path,
                           bool create_if_missing = true);

  EvaluationCache() = default;

  ~EvaluationCache();

  EvaluationCache(const EvaluationCache &) = delete;
  EvaluationCache &operator=(const EvaluationCache &) = delete;

  /**
   * @brief Helper for manual pointer setting; the caller keeps ownership.
   * @param db Pointer to an existing RocksDB instance.
   * @return Void.
   */
  void set_db(rocksdb::DB *db);

  /**
   * @brief Whether a database is attached.
   * @return True if reads and writes reach RocksDB.
   */
  bool is_open() const { return db_ != nullptr; }

  /**
   * @brief Deserializes a cache hit into a flat buffer.
   * @param value Serialized string from the cache.
   * @param values Destination, already sized to the expected length.
   * @return Void.
   * @throws acefit::ShapeError if the stored length differs.
   */
  void deserialize_hit(const std::string &value, std::vector<double> &values);

  /**
   * @brief Adds a serialized evaluation to the cache.
   * @param key Unique hash key for the request.
   * @param values Flat evaluation results.
   * @return Void.
   */
  void add_serialized(const KeyHash &key, const std::vector<double> &values);

  /**
   * @brief Searches the cache for a specific key.
   * @param key Unique hash key.
   * @return Optional string containing the serialized data.
   */
  std::optional<std::string> find(const KeyHash &key);
};

} // namespace acefit::cache
