#include "db_manager.hpp"

#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/status.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

#include "exp_utils.hpp"
#include "stopwatch.hpp"

void DBManager::openDB(const std::string& dbname) {
  StopWatch sw;
  sw.start();

  if (db_) {
    spdlog::warn("DB already open, closing before reopening.");
    auto s = closeDB();
    if (!s.ok()) {
      spdlog::warn("Closing previous DB failed: {}", s.ToString());
    }
  }

  rocksdb::Options options;
  options.create_if_missing = true;

  rocksdb::DB* rawDbPtr = nullptr;
  auto status = rocksdb::DB::Open(options, dbname, &rawDbPtr);
  if (!status.ok()) {
    throw std::runtime_error("Failed to open DB: " + status.ToString());
  }
  db_.reset(rawDbPtr);

  sw.stop();
  spdlog::info("RocksDB opened at path: {}, took {} µs", dbname,
               sw.elapsedMicros());
}

void DBManager::insertRecords(size_t numRecords) {
  if (!db_) throw std::runtime_error("DB not open.");

  StopWatch sw;
  sw.start();
  spdlog::info("Inserting {} records...", numRecords);

  rocksdb::WriteBatch batch;
  for (size_t i = 1; i <= numRecords; ++i) {
    const std::string key = makeKey("key", i);
    const std::string value = "value" + std::to_string(i);
    batch.Put(key, value);

    if (i % 1000000 == 0) {
      auto s = db_->Write(rocksdb::WriteOptions(), &batch);
      if (!s.ok())
        throw std::runtime_error("Batch write failed: " + s.ToString());
      batch.Clear();
      spdlog::debug("Inserted {} records...", i);
    }
  }

  if (batch.Count() > 0) {
    auto s = db_->Write(rocksdb::WriteOptions(), &batch);
    if (!s.ok())
      throw std::runtime_error("Final batch write failed: " + s.ToString());
  }

  auto s = db_->Flush(rocksdb::FlushOptions());
  if (!s.ok()) throw std::runtime_error("Flush failed: " + s.ToString());

  sw.stop();
  spdlog::info("Inserted {} records in {} µs.", numRecords, sw.elapsedMicros());
}

std::optional<std::string> DBManager::getValue(const std::string& key) {
  if (!db_) throw std::runtime_error("DB not open.");

  ++readCount_;
  rocksdb::PinnableSlice value;
  rocksdb::Status status = db_->Get(rocksdb::ReadOptions(),
                                    db_->DefaultColumnFamily(),
                                    rocksdb::Slice(key), &value);
  if (status.ok()) {
    return value.ToString();
  }
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  throw std::runtime_error("Get failed for '" + key + "': " + status.ToString());
}

void DBManager::forEachKey(
    const std::function<void(const std::string&)>& visit) {
  if (!db_) throw std::runtime_error("DB not open.");

  rocksdb::ReadOptions readOptions;
  readOptions.fill_cache = false;

  std::unique_ptr<rocksdb::Iterator> iter(db_->NewIterator(readOptions));
  for (iter->SeekToFirst(); iter->Valid(); iter->Next()) {
    visit(iter->key().ToString());
  }
  if (!iter->status().ok()) {
    throw std::runtime_error("Key scan failed: " + iter->status().ToString());
  }
}

rocksdb::Status DBManager::closeDB() {
  if (db_) {
    auto s = db_->Close();
    db_.reset();
    spdlog::debug("DB closed.");
    return s;
  }
  return rocksdb::Status::OK();
}
