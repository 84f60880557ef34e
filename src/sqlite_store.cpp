/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#include "mrelay/sqlite_store.hpp"

#include "mrelay/log.hpp"

#include <cstring>

#include <limits>
#include <stdexcept>

namespace mrelay {

namespace {

constexpr const char* kCreateClientsSql =
    "CREATE TABLE IF NOT EXISTS clients ("
    "ID BLOB NOT NULL PRIMARY KEY,"
    "UserName TEXT NOT NULL UNIQUE,"
    "PublicKey BLOB NOT NULL,"
    "LastSeen TEXT"
    ");";

constexpr const char* kCreateMessagesSql =
    "CREATE TABLE IF NOT EXISTS messages ("
    "ID INTEGER PRIMARY KEY AUTOINCREMENT,"
    "ToClient BLOB NOT NULL,"
    "FromClient BLOB NOT NULL,"
    "Type INTEGER NOT NULL,"
    "Content BLOB"
    ");";

constexpr const char* kCreateMessagesIndexSql =
    "CREATE INDEX IF NOT EXISTS messages_to_client ON messages (ToClient);";

// Prepared statement, finalized on scope exit
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      MRELAY_LOG_ERROR(std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
      stmt_ = nullptr;
    }
  }

  ~Statement() {
    if (stmt_ != nullptr) sqlite3_finalize(stmt_);
  }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  bool ok() const { return stmt_ != nullptr; }
  sqlite3_stmt* get() const { return stmt_; }

  // Bind failures are latched and reported by the next step()
  void bind_blob(int index, const void* data, size_t size) {
    int rc = size == 0 ? sqlite3_bind_zeroblob(stmt_, index, 0)
                       : sqlite3_bind_blob(stmt_, index, data, static_cast<int>(size), SQLITE_TRANSIENT);
    bind_ok_ = bind_ok_ && rc == SQLITE_OK;
  }

  void bind_text(int index, std::string_view text) {
    int rc = sqlite3_bind_text(stmt_, index, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
    bind_ok_ = bind_ok_ && rc == SQLITE_OK;
  }

  void bind_int(int index, int64_t value) {
    bind_ok_ = bind_ok_ && sqlite3_bind_int64(stmt_, index, value) == SQLITE_OK;
  }

  int step() { return bind_ok_ ? sqlite3_step(stmt_) : SQLITE_MISUSE; }

  void reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
    bind_ok_ = true;
  }

  std::vector<uint8_t> column_blob(int col) const {
    const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, col));
    int size = sqlite3_column_bytes(stmt_, col);
    if (data == nullptr || size <= 0) return {};
    return std::vector<uint8_t>(data, data + size);
  }

  std::string column_text(int col) const {
    const auto* text = sqlite3_column_text(stmt_, col);
    int size = sqlite3_column_bytes(stmt_, col);
    if (text == nullptr || size <= 0) return {};
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
  }

  bool column_client_id(int col, ClientId& out) const {
    const void* data = sqlite3_column_blob(stmt_, col);
    if (data == nullptr || sqlite3_column_bytes(stmt_, col) != static_cast<int>(kClientIdSize)) {
      return false;
    }
    std::memcpy(out.data(), data, kClientIdSize);
    return true;
  }

 private:
  sqlite3_stmt* stmt_ = nullptr;
  bool bind_ok_ = true;
};

// BEGIN IMMEDIATE on construction, ROLLBACK on scope exit unless committed
class Transaction {
 public:
  explicit Transaction(sqlite3* db) : db_(db) {
    active_ = sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) == SQLITE_OK;
  }

  ~Transaction() {
    if (active_ && sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
      MRELAY_LOG_ERROR(std::string("SQLite rollback failed: ") + sqlite3_errmsg(db_));
    }
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  bool active() const { return active_; }

  bool commit() {
    if (!active_) return false;
    if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK) {
      return false;
    }
    active_ = false;
    return true;
  }

 private:
  sqlite3* db_;
  bool active_ = false;
};

bool valid_client(const ClientRecord& client) {
  if (client.username.empty() || client.username.size() >= kUsernameSize) return false;
  if (client.public_key.size() != kPublicKeySize) return false;
  if (client.last_seen.empty()) return false;
  return true;
}

bool read_client_row(const Statement& stmt, ClientRecord& out) {
  if (!stmt.column_client_id(0, out.id)) return false;
  out.username = stmt.column_text(1);
  out.public_key = stmt.column_blob(2);
  out.last_seen = stmt.column_text(3);
  return true;
}

}  // namespace

SqliteStore::SqliteStore(const std::string& path) : path_(path) {
  if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
    std::string reason = db_ != nullptr ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot open database " + path_ + ": " + reason);
  }

  if (!exec_sql(kCreateClientsSql) || !exec_sql(kCreateMessagesSql) || !exec_sql(kCreateMessagesIndexSql)) {
    std::string reason = sqlite3_errmsg(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot create schema in " + path_ + ": " + reason);
  }

  MRELAY_LOG_INFO("Store opened at " + path_);
}

SqliteStore::~SqliteStore() {
  if (db_ != nullptr) sqlite3_close(db_);
}

bool SqliteStore::exec_sql(const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    MRELAY_LOG_ERROR(std::string("SQLite exec failed: ") + (err != nullptr ? err : "unknown"));
    sqlite3_free(err);
    return false;
  }
  return true;
}

expected<void, ErrorCode> SqliteStore::insert_client_locked(const ClientRecord& client) {
  Statement stmt(db_, "INSERT INTO clients (ID, UserName, PublicKey, LastSeen) VALUES (?, ?, ?, ?);");
  if (!stmt.ok()) {
    return expected<void, ErrorCode>::error(ErrorCode::kStoreError);
  }
  stmt.bind_blob(1, client.id.data(), client.id.size());
  stmt.bind_text(2, client.username);
  stmt.bind_blob(3, client.public_key.data(), client.public_key.size());
  stmt.bind_text(4, client.last_seen);

  int rc = stmt.step();
  if (rc == SQLITE_DONE) {
    return expected<void, ErrorCode>::success();
  }
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
    MRELAY_LOG_ERROR("Integrity error adding client " + to_hex(client.id) + ": " + sqlite3_errmsg(db_));
    return expected<void, ErrorCode>::error(ErrorCode::kDuplicate);
  }
  MRELAY_LOG_ERROR(std::string("SQLite insert client failed: ") + sqlite3_errmsg(db_));
  return expected<void, ErrorCode>::error(ErrorCode::kStoreError);
}

expected<ClientRecord, ErrorCode> SqliteStore::find_client_locked(const char* sql, const void* key, int key_len,
                                                                  bool blob) {
  Statement stmt(db_, sql);
  if (!stmt.ok()) {
    return expected<ClientRecord, ErrorCode>::error(ErrorCode::kStoreError);
  }
  if (blob) {
    stmt.bind_blob(1, key, static_cast<size_t>(key_len));
  } else {
    stmt.bind_text(1, std::string_view(static_cast<const char*>(key), static_cast<size_t>(key_len)));
  }

  int rc = stmt.step();
  if (rc == SQLITE_DONE) {
    return expected<ClientRecord, ErrorCode>::error(ErrorCode::kNotFound);
  }
  ClientRecord client;
  if (rc != SQLITE_ROW || !read_client_row(stmt, client)) {
    MRELAY_LOG_ERROR(std::string("SQLite client lookup failed: ") + sqlite3_errmsg(db_));
    return expected<ClientRecord, ErrorCode>::error(ErrorCode::kStoreError);
  }
  return expected<ClientRecord, ErrorCode>::success(std::move(client));
}

expected<void, ErrorCode> SqliteStore::add_client(const ClientRecord& client) {
  if (!valid_client(client)) {
    MRELAY_LOG_ERROR("Client validation failed.");
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidArgument);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return insert_client_locked(client);
}

expected<void, ErrorCode> SqliteStore::register_client(const ClientId& id, std::string_view username,
                                                       const PublicKey& public_key) {
  ClientRecord client;
  client.id = id;
  client.username = std::string(username);
  client.public_key.assign(public_key.begin(), public_key.end());
  client.last_seen = kLastSeenUnavailable;
  if (!valid_client(client)) {
    MRELAY_LOG_ERROR("Client validation failed.");
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidArgument);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto existing = find_client_locked("SELECT ID, UserName, PublicKey, LastSeen FROM clients WHERE UserName = ?;",
                                     username.data(), static_cast<int>(username.size()), false);
  if (existing.has_value()) {
    return expected<void, ErrorCode>::error(ErrorCode::kDuplicate);
  }
  if (existing.get_error() != ErrorCode::kNotFound) {
    return expected<void, ErrorCode>::error(existing.get_error());
  }
  return insert_client_locked(client);
}

expected<ClientRecord, ErrorCode> SqliteStore::get_client_by_username(std::string_view username) {
  std::lock_guard<std::mutex> lock(mutex_);
  return find_client_locked("SELECT ID, UserName, PublicKey, LastSeen FROM clients WHERE UserName = ?;",
                            username.data(), static_cast<int>(username.size()), false);
}

expected<ClientRecord, ErrorCode> SqliteStore::get_client_by_id(const ClientId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return find_client_locked("SELECT ID, UserName, PublicKey, LastSeen FROM clients WHERE ID = ?;", id.data(),
                            static_cast<int>(id.size()), true);
}

expected<std::vector<ClientRecord>, ErrorCode> SqliteStore::list_clients() {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "SELECT ID, UserName, PublicKey, LastSeen FROM clients ORDER BY rowid;");
  if (!stmt.ok()) {
    return expected<std::vector<ClientRecord>, ErrorCode>::error(ErrorCode::kStoreError);
  }

  std::vector<ClientRecord> clients;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    ClientRecord client;
    if (!read_client_row(stmt, client)) {
      MRELAY_LOG_WARN("Skipping client row with malformed id");
      continue;
    }
    clients.push_back(std::move(client));
  }
  if (rc != SQLITE_DONE) {
    MRELAY_LOG_ERROR(std::string("SQLite list clients failed: ") + sqlite3_errmsg(db_));
    return expected<std::vector<ClientRecord>, ErrorCode>::error(ErrorCode::kStoreError);
  }
  return expected<std::vector<ClientRecord>, ErrorCode>::success(std::move(clients));
}

expected<void, ErrorCode> SqliteStore::update_last_seen(const ClientId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "UPDATE clients SET LastSeen = datetime('now', 'localtime') WHERE ID = ?;");
  if (!stmt.ok()) {
    return expected<void, ErrorCode>::error(ErrorCode::kStoreError);
  }
  stmt.bind_blob(1, id.data(), id.size());
  if (stmt.step() != SQLITE_DONE) {
    MRELAY_LOG_ERROR(std::string("SQLite update last seen failed: ") + sqlite3_errmsg(db_));
    return expected<void, ErrorCode>::error(ErrorCode::kStoreError);
  }
  return expected<void, ErrorCode>::success();
}

expected<uint32_t, ErrorCode> SqliteStore::add_message(const ClientId& to, const ClientId& from,
                                                       proto::MessageType type,
                                                       const std::vector<uint8_t>& content) {
  if (!proto::decode_message_type(static_cast<uint8_t>(type)).has_value()) {
    MRELAY_LOG_ERROR("Message validation failed.");
    return expected<uint32_t, ErrorCode>::error(ErrorCode::kInvalidArgument);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "INSERT INTO messages (ToClient, FromClient, Type, Content) VALUES (?, ?, ?, ?);");
  if (!stmt.ok()) {
    return expected<uint32_t, ErrorCode>::error(ErrorCode::kStoreError);
  }
  stmt.bind_blob(1, to.data(), to.size());
  stmt.bind_blob(2, from.data(), from.size());
  stmt.bind_int(3, static_cast<int64_t>(type));
  stmt.bind_blob(4, content.data(), content.size());

  if (stmt.step() != SQLITE_DONE) {
    MRELAY_LOG_ERROR(std::string("SQLite insert message failed: ") + sqlite3_errmsg(db_));
    return expected<uint32_t, ErrorCode>::error(ErrorCode::kStoreError);
  }

  sqlite3_int64 rowid = sqlite3_last_insert_rowid(db_);
  if (rowid <= 0 || rowid > static_cast<sqlite3_int64>(std::numeric_limits<uint32_t>::max())) {
    MRELAY_LOG_ERROR("Message id " + std::to_string(rowid) + " does not fit the wire field");
    return expected<uint32_t, ErrorCode>::error(ErrorCode::kStoreError);
  }
  return expected<uint32_t, ErrorCode>::success(static_cast<uint32_t>(rowid));
}

expected<std::vector<MessageRecord>, ErrorCode> SqliteStore::fetch_and_remove_pending(const ClientId& to) {
  using Result = expected<std::vector<MessageRecord>, ErrorCode>;

  std::lock_guard<std::mutex> lock(mutex_);
  Transaction txn(db_);
  if (!txn.active()) {
    MRELAY_LOG_ERROR(std::string("SQLite begin failed: ") + sqlite3_errmsg(db_));
    return Result::error(ErrorCode::kStoreError);
  }

  Statement select(db_, "SELECT ID, FromClient, Type, Content FROM messages WHERE ToClient = ? ORDER BY ID;");
  Statement remove(db_, "DELETE FROM messages WHERE ID = ?;");
  if (!select.ok() || !remove.ok()) {
    return Result::error(ErrorCode::kStoreError);
  }
  select.bind_blob(1, to.data(), to.size());

  std::vector<MessageRecord> messages;
  int rc;
  while ((rc = select.step()) == SQLITE_ROW) {
    MessageRecord msg;
    msg.id = static_cast<uint32_t>(sqlite3_column_int64(select.get(), 0));
    msg.to = to;
    auto type = proto::decode_message_type(static_cast<uint8_t>(sqlite3_column_int(select.get(), 2)));
    if (!select.column_client_id(1, msg.from) || !type.has_value()) {
      MRELAY_LOG_ERROR("Malformed message row " + std::to_string(msg.id));
      return Result::error(ErrorCode::kStoreError);
    }
    msg.type = type.value();
    msg.content = select.column_blob(3);
    messages.push_back(std::move(msg));
  }
  if (rc != SQLITE_DONE) {
    MRELAY_LOG_ERROR(std::string("SQLite pending select failed: ") + sqlite3_errmsg(db_));
    return Result::error(ErrorCode::kStoreError);
  }

  for (const auto& msg : messages) {
    remove.reset();
    remove.bind_int(1, msg.id);
    if (remove.step() != SQLITE_DONE) {
      MRELAY_LOG_ERROR(std::string("SQLite pending delete failed: ") + sqlite3_errmsg(db_));
      return Result::error(ErrorCode::kStoreError);
    }
  }

  if (!txn.commit()) {
    MRELAY_LOG_ERROR(std::string("SQLite commit failed: ") + sqlite3_errmsg(db_));
    return Result::error(ErrorCode::kStoreError);
  }
  return Result::success(std::move(messages));
}

}  // namespace mrelay
