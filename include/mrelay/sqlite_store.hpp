/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * SQLite implementation of the client/message store.
 */

#ifndef MRELAY_SQLITE_STORE_HPP_
#define MRELAY_SQLITE_STORE_HPP_

#include "store.hpp"

#include <mutex>
#include <sqlite3.h>
#include <string>

namespace mrelay {

class SqliteStore final : public Store {
 public:
  // Opens (or creates) the database and its tables.
  // Throws std::runtime_error on failure. Use ":memory:" for a private
  // in-process database.
  explicit SqliteStore(const std::string& path);
  ~SqliteStore() override;

  SqliteStore(const SqliteStore&) = delete;
  SqliteStore& operator=(const SqliteStore&) = delete;

  expected<void, ErrorCode> add_client(const ClientRecord& client) override;
  expected<void, ErrorCode> register_client(const ClientId& id, std::string_view username,
                                            const PublicKey& public_key) override;
  expected<ClientRecord, ErrorCode> get_client_by_username(std::string_view username) override;
  expected<ClientRecord, ErrorCode> get_client_by_id(const ClientId& id) override;
  expected<std::vector<ClientRecord>, ErrorCode> list_clients() override;
  expected<void, ErrorCode> update_last_seen(const ClientId& id) override;
  expected<uint32_t, ErrorCode> add_message(const ClientId& to, const ClientId& from, proto::MessageType type,
                                            const std::vector<uint8_t>& content) override;
  expected<std::vector<MessageRecord>, ErrorCode> fetch_and_remove_pending(const ClientId& to) override;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
  sqlite3* db_ = nullptr;
  std::mutex mutex_;

  // Callers hold mutex_
  expected<void, ErrorCode> insert_client_locked(const ClientRecord& client);
  expected<ClientRecord, ErrorCode> find_client_locked(const char* sql, const void* key, int key_len, bool blob);
  bool exec_sql(const char* sql);
};

}  // namespace mrelay

#endif  // MRELAY_SQLITE_STORE_HPP_
