/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Binary wire codec for the relay protocol.
 */

#ifndef MRELAY_PROTOCOL_HPP_
#define MRELAY_PROTOCOL_HPP_

#include "utils.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>

#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace mrelay {

// ============================================================================
// Field sizes
// ============================================================================

static constexpr size_t kClientIdSize = 16;
static constexpr size_t kUsernameSize = 255;
static constexpr size_t kPublicKeySize = 160;
static constexpr size_t kMessageIdSize = 4;
static constexpr size_t kMessageTypeSize = 1;
static constexpr size_t kContentLengthSize = 4;
static constexpr size_t kMessageHeaderSize = kClientIdSize + kMessageTypeSize + kContentLengthSize;  // 21

using ClientId = std::array<uint8_t, kClientIdSize>;
using PublicKey = std::array<uint8_t, kPublicKeySize>;

inline std::string to_hex(const ClientId& id) { return to_hex(id.data(), id.size()); }

namespace proto {

static constexpr size_t kRequestHeaderSize = 23;   // id(16) + version(1) + opcode(2) + size(4)
static constexpr size_t kResponseHeaderSize = 7;   // version(1) + code(2) + size(4)
static constexpr uint8_t kServerVersion = 2;

// Request opcodes
enum class Opcode : uint16_t {
  kRegister = 600,
  kListClients = 601,
  kFetchPublicKey = 602,
  kSendMessage = 603,
  kFetchPending = 604
};

enum class ResponseCode : uint16_t {
  kRegistrationSuccess = 2100,
  kUserList = 2101,
  kPublicKey = 2102,
  kMessageSent = 2103,
  kPendingMessagesReceived = 2104,
  kError = 9000
};

enum class MessageType : uint8_t {
  kSymmetricKeyRequest = 1,
  kSymmetricKeySend = 2,
  kTextMessageSend = 3
};

struct RequestHeader {
  ClientId client_id{};
  uint8_t version = 0;
  uint16_t opcode = 0;
  uint32_t payload_size = 0;
};

struct ResponseHeader {
  uint8_t version = 0;
  uint16_t code = 0;
  uint32_t payload_size = 0;
};

struct Request {
  RequestHeader header;
  std::vector<uint8_t> payload;
};

struct Response {
  ResponseCode code = ResponseCode::kError;
  std::vector<uint8_t> payload;

  static Response error() { return Response{ResponseCode::kError, {}}; }
  bool is_error() const { return code == ResponseCode::kError; }
};

// Typed payloads
struct RegisterRequest {
  std::string_view username;  // null padding stripped, views into the payload
  PublicKey public_key{};
};

struct SendMessageRequest {
  ClientId target{};
  uint8_t raw_type = 0;
  const uint8_t* content = nullptr;
  uint32_t content_size = 0;
};

// One record of a FetchPending response
struct PendingRecord {
  ClientId from{};
  uint32_t message_id = 0;
  uint8_t type = 0;
  std::vector<uint8_t> content;
};

// One entry of a ListClients response
struct ClientEntry {
  ClientId id{};
  std::string username;
};

// ============================================================================
// Headers
// ============================================================================

// Returns error(kFrameParseError) if fewer than kRequestHeaderSize bytes
inline expected<RequestHeader, ErrorCode> parse_request_header(const uint8_t* data, size_t len) {
  if (len < kRequestHeaderSize) {
    return expected<RequestHeader, ErrorCode>::error(ErrorCode::kFrameParseError);
  }
  RequestHeader header;
  std::memcpy(header.client_id.data(), data, kClientIdSize);
  header.version = data[16];
  header.opcode = load_le16(data + 17);
  header.payload_size = load_le32(data + 19);
  return expected<RequestHeader, ErrorCode>::success(header);
}

inline void append_request_header(std::vector<uint8_t>& out, const RequestHeader& header) {
  out.insert(out.end(), header.client_id.begin(), header.client_id.end());
  out.push_back(header.version);
  append_le16(out, header.opcode);
  append_le32(out, header.payload_size);
}

// Full request frame, used by clients and tests
inline std::vector<uint8_t> encode_request(const ClientId& client_id, Opcode opcode,
                                           const std::vector<uint8_t>& payload,
                                           uint8_t version = kServerVersion) {
  std::vector<uint8_t> frame;
  frame.reserve(kRequestHeaderSize + payload.size());
  RequestHeader header;
  header.client_id = client_id;
  header.version = version;
  header.opcode = static_cast<uint16_t>(opcode);
  header.payload_size = static_cast<uint32_t>(payload.size());
  append_request_header(frame, header);
  frame.insert(frame.end(), payload.begin(), payload.end());
  return frame;
}

inline expected<ResponseHeader, ErrorCode> parse_response_header(const uint8_t* data, size_t len) {
  if (len < kResponseHeaderSize) {
    return expected<ResponseHeader, ErrorCode>::error(ErrorCode::kFrameParseError);
  }
  ResponseHeader header;
  header.version = data[0];
  header.code = load_le16(data + 1);
  header.payload_size = load_le32(data + 3);
  return expected<ResponseHeader, ErrorCode>::success(header);
}

// Error responses never carry a payload
inline std::vector<uint8_t> encode_response(const Response& response) {
  const bool with_payload = !response.is_error();
  const size_t payload_size = with_payload ? response.payload.size() : 0;

  std::vector<uint8_t> frame;
  frame.reserve(kResponseHeaderSize + payload_size);
  frame.push_back(kServerVersion);
  append_le16(frame, static_cast<uint16_t>(response.code));
  append_le32(frame, static_cast<uint32_t>(payload_size));
  if (with_payload) {
    frame.insert(frame.end(), response.payload.begin(), response.payload.end());
  }
  return frame;
}

inline bool is_known_opcode(uint16_t opcode) {
  return opcode >= static_cast<uint16_t>(Opcode::kRegister) &&
         opcode <= static_cast<uint16_t>(Opcode::kFetchPending);
}

// ============================================================================
// Payloads
// ============================================================================

inline expected<MessageType, ErrorCode> decode_message_type(uint8_t raw) {
  switch (raw) {
    case 1:
      return expected<MessageType, ErrorCode>::success(MessageType::kSymmetricKeyRequest);
    case 2:
      return expected<MessageType, ErrorCode>::success(MessageType::kSymmetricKeySend);
    case 3:
      return expected<MessageType, ErrorCode>::success(MessageType::kTextMessageSend);
    default:
      return expected<MessageType, ErrorCode>::error(ErrorCode::kInvalidArgument);
  }
}

// A key request carries no content; key and text sends carry at least one byte
inline bool content_size_valid(MessageType type, uint32_t content_size) {
  if (type == MessageType::kSymmetricKeyRequest) {
    return content_size == 0;
  }
  return content_size >= 1;
}

// Layout only: exact size. Username content checks are left to the handler.
inline expected<RegisterRequest, ErrorCode> decode_register(const std::vector<uint8_t>& payload) {
  if (payload.size() != kUsernameSize + kPublicKeySize) {
    return expected<RegisterRequest, ErrorCode>::error(ErrorCode::kInvalidArgument);
  }
  RegisterRequest req;
  req.username = trim_trailing_nulls(
      std::string_view(reinterpret_cast<const char*>(payload.data()), kUsernameSize));
  std::memcpy(req.public_key.data(), payload.data() + kUsernameSize, kPublicKeySize);
  return expected<RegisterRequest, ErrorCode>::success(req);
}

inline expected<ClientId, ErrorCode> decode_client_id(const std::vector<uint8_t>& payload) {
  if (payload.size() != kClientIdSize) {
    return expected<ClientId, ErrorCode>::error(ErrorCode::kInvalidArgument);
  }
  ClientId id;
  std::memcpy(id.data(), payload.data(), kClientIdSize);
  return expected<ClientId, ErrorCode>::success(id);
}

// Layout only: minimum size and declared content length. The returned content
// pointer views into payload.
inline expected<SendMessageRequest, ErrorCode> decode_send_message(const std::vector<uint8_t>& payload) {
  if (payload.size() < kMessageHeaderSize) {
    return expected<SendMessageRequest, ErrorCode>::error(ErrorCode::kInvalidArgument);
  }
  SendMessageRequest req;
  std::memcpy(req.target.data(), payload.data(), kClientIdSize);
  req.raw_type = payload[kClientIdSize];
  req.content_size = load_le32(payload.data() + kClientIdSize + kMessageTypeSize);
  if (payload.size() - kMessageHeaderSize != req.content_size) {
    return expected<SendMessageRequest, ErrorCode>::error(ErrorCode::kInvalidArgument);
  }
  req.content = payload.data() + kMessageHeaderSize;
  return expected<SendMessageRequest, ErrorCode>::success(req);
}

inline std::vector<uint8_t> encode_register(std::string_view username, const PublicKey& key) {
  std::vector<uint8_t> payload(kUsernameSize, 0);
  std::memcpy(payload.data(), username.data(), std::min(username.size(), kUsernameSize));
  payload.insert(payload.end(), key.begin(), key.end());
  return payload;
}

inline std::vector<uint8_t> encode_send_message(const ClientId& target, uint8_t raw_type,
                                                std::string_view content) {
  std::vector<uint8_t> payload(target.begin(), target.end());
  payload.push_back(raw_type);
  append_le32(payload, static_cast<uint32_t>(content.size()));
  payload.insert(payload.end(), content.begin(), content.end());
  return payload;
}

// Exactly kUsernameSize bytes: null padded, or truncated with a trailing null
inline void append_padded_username(std::vector<uint8_t>& out, std::string_view username) {
  if (username.size() < kUsernameSize) {
    out.insert(out.end(), username.begin(), username.end());
    out.insert(out.end(), kUsernameSize - username.size(), 0);
  } else {
    out.insert(out.end(), username.begin(), username.begin() + (kUsernameSize - 1));
    out.push_back(0);
  }
}

inline void append_client_entry(std::vector<uint8_t>& out, const ClientId& id, std::string_view username) {
  out.insert(out.end(), id.begin(), id.end());
  append_padded_username(out, username);
}

inline void append_pending_record(std::vector<uint8_t>& out, const ClientId& from, uint32_t message_id,
                                  MessageType type, const std::vector<uint8_t>& content) {
  out.insert(out.end(), from.begin(), from.end());
  append_le32(out, message_id);
  out.push_back(static_cast<uint8_t>(type));
  append_le32(out, static_cast<uint32_t>(content.size()));
  out.insert(out.end(), content.begin(), content.end());
}

// Split a UserList payload; error if it is not a whole number of entries
inline expected<std::vector<ClientEntry>, ErrorCode> parse_client_list(const std::vector<uint8_t>& payload) {
  constexpr size_t kEntrySize = kClientIdSize + kUsernameSize;
  if (payload.size() % kEntrySize != 0) {
    return expected<std::vector<ClientEntry>, ErrorCode>::error(ErrorCode::kFrameParseError);
  }
  std::vector<ClientEntry> entries;
  for (size_t pos = 0; pos < payload.size(); pos += kEntrySize) {
    ClientEntry entry;
    std::memcpy(entry.id.data(), payload.data() + pos, kClientIdSize);
    entry.username = std::string(trim_trailing_nulls(std::string_view(
        reinterpret_cast<const char*>(payload.data() + pos + kClientIdSize), kUsernameSize)));
    entries.push_back(std::move(entry));
  }
  return expected<std::vector<ClientEntry>, ErrorCode>::success(std::move(entries));
}

// Split a PendingMessagesReceived payload; error on a truncated record
inline expected<std::vector<PendingRecord>, ErrorCode> parse_pending_records(const std::vector<uint8_t>& payload) {
  constexpr size_t kRecordHeaderSize = kClientIdSize + kMessageIdSize + kMessageTypeSize + kContentLengthSize;
  std::vector<PendingRecord> records;
  size_t pos = 0;
  while (pos < payload.size()) {
    if (payload.size() - pos < kRecordHeaderSize) {
      return expected<std::vector<PendingRecord>, ErrorCode>::error(ErrorCode::kFrameParseError);
    }
    PendingRecord rec;
    std::memcpy(rec.from.data(), payload.data() + pos, kClientIdSize);
    rec.message_id = load_le32(payload.data() + pos + 16);
    rec.type = payload[pos + 20];
    uint32_t content_size = load_le32(payload.data() + pos + 21);
    pos += kRecordHeaderSize;
    if (payload.size() - pos < content_size) {
      return expected<std::vector<PendingRecord>, ErrorCode>::error(ErrorCode::kFrameParseError);
    }
    rec.content.assign(payload.begin() + static_cast<std::ptrdiff_t>(pos),
                       payload.begin() + static_cast<std::ptrdiff_t>(pos + content_size));
    pos += content_size;
    records.push_back(std::move(rec));
  }
  return expected<std::vector<PendingRecord>, ErrorCode>::success(std::move(records));
}

}  // namespace proto

}  // namespace mrelay

#endif  // MRELAY_PROTOCOL_HPP_
