#ifndef DB_MANAGER_HPP
#define DB_MANAGER_HPP

#include <rocksdb/db.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>

// Thin RocksDB wrapper used as the backing store behind a BloomFilter.
class DBManager {
 public:
  void openDB(const std::string &dbname);
  // Writes records key<index> -> value<index> for index 1..numRecords.
  void insertRecords(size_t numRecords);
  std::optional<std::string> getValue(const std::string &key);
  // Calls `visit` with every key in the database, in key order.
  void forEachKey(const std::function<void(const std::string &)> &visit);
  rocksdb::Status closeDB();

  size_t readCount() const { return readCount_; }
  void resetReadCount() { readCount_ = 0; }

 private:
  struct RocksDBDeleter {
    void operator()(rocksdb::DB *dbPtr) const {
      delete dbPtr;  // Safe to call delete on a nullptr
    }
  };

  std::unique_ptr<rocksdb::DB, RocksDBDeleter> db_{nullptr};
  size_t readCount_ = 0;
};

#endif  // DB_MANAGER_HPP
