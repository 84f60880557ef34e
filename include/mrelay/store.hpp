/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Client/message store contract.
 */

#ifndef MRELAY_STORE_HPP_
#define MRELAY_STORE_HPP_

#include "protocol.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <string>
#include <string_view>
#include <vector>

namespace mrelay {

static constexpr const char* kLastSeenUnavailable = "Not Available";

struct ClientRecord {
  ClientId id{};
  std::string username;
  std::vector<uint8_t> public_key;
  std::string last_seen;
};

struct MessageRecord {
  uint32_t id = 0;
  ClientId to{};
  ClientId from{};
  proto::MessageType type = proto::MessageType::kTextMessageSend;
  std::vector<uint8_t> content;
};

// ============================================================================
// Store - persistence contract consumed by the handlers
// ============================================================================
//
// Implementations serialize every operation through one lock guarding the
// whole store. Failures are returned, never thrown:
//   kInvalidArgument  field validation failed
//   kDuplicate        primary key or username already present
//   kNotFound         no such client
//   kStoreError       engine failure
//

class Store {
 public:
  virtual ~Store() = default;

  // Insert as-is. Fails on id collision or invalid field sizes.
  virtual expected<void, ErrorCode> add_client(const ClientRecord& client) = 0;

  // Username uniqueness check and insert as one critical section.
  // last_seen is set to kLastSeenUnavailable.
  virtual expected<void, ErrorCode> register_client(const ClientId& id, std::string_view username,
                                                    const PublicKey& public_key) = 0;

  virtual expected<ClientRecord, ErrorCode> get_client_by_username(std::string_view username) = 0;
  virtual expected<ClientRecord, ErrorCode> get_client_by_id(const ClientId& id) = 0;

  // All clients in registration order
  virtual expected<std::vector<ClientRecord>, ErrorCode> list_clients() = 0;

  // Unknown ids are ignored
  virtual expected<void, ErrorCode> update_last_seen(const ClientId& id) = 0;

  // Returns the new message id
  virtual expected<uint32_t, ErrorCode> add_message(const ClientId& to, const ClientId& from,
                                                    proto::MessageType type,
                                                    const std::vector<uint8_t>& content) = 0;

  // Reads and deletes every message addressed to the client in one atomic
  // step, in insertion order. Nothing is removed on failure.
  virtual expected<std::vector<MessageRecord>, ErrorCode> fetch_and_remove_pending(const ClientId& to) = 0;
};

}  // namespace mrelay

#endif  // MRELAY_STORE_HPP_
