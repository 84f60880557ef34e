/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#include "mrelay/handlers.hpp"

#include "mrelay/log.hpp"

#include <string>

namespace mrelay {

using proto::MessageType;
using proto::Opcode;
using proto::Request;
using proto::Response;
using proto::ResponseCode;

namespace {

Response reject(const char* handler, const std::string& reason) {
  MRELAY_LOG_ERROR(std::string(handler) + ": " + reason);
  return Response::error();
}

// --- 600 ---
Response handle_register(const Request& request, HandlerContext& ctx) {
  auto decoded = proto::decode_register(request.payload);
  if (!decoded.has_value()) {
    return reject("Register", "Invalid payload size for registration.");
  }
  const auto& req = decoded.value();

  if (!is_ascii(req.username)) {
    return reject("Register", "Username decode error.");
  }
  if (req.username.empty()) {
    return reject("Register", "Empty username.");
  }

  auto id = ctx.ids.next();
  if (!id.has_value()) {
    return reject("Register", "Could not generate a client id.");
  }

  auto added = ctx.store.register_client(id.value(), req.username, req.public_key);
  if (!added.has_value()) {
    if (added.get_error() == ErrorCode::kDuplicate) {
      return reject("Register", "Username already exists.");
    }
    return reject("Register", std::string("Failed to store client: ") + to_string(added.get_error()));
  }

  MRELAY_LOG_INFO("Registering new client: " + std::string(req.username) + " with id: " + to_hex(id.value()));
  return Response{ResponseCode::kRegistrationSuccess,
                  std::vector<uint8_t>(id.value().begin(), id.value().end())};
}

// --- 601 ---
Response handle_list_clients(const Request& request, HandlerContext& ctx) {
  if (!request.payload.empty()) {
    return reject("ListClients", "Invalid payload size for client list.");
  }

  auto clients = ctx.store.list_clients();
  if (!clients.has_value()) {
    return reject("ListClients", std::string("Store failure: ") + to_string(clients.get_error()));
  }

  Response response{ResponseCode::kUserList, {}};
  for (const auto& client : clients.value()) {
    if (client.id == request.header.client_id) {
      continue;
    }
    if (!is_ascii(client.username)) {
      MRELAY_LOG_ERROR("Error encoding username of client " + to_hex(client.id));
      continue;
    }
    proto::append_client_entry(response.payload, client.id, client.username);
  }
  return response;
}

// --- 602 ---
Response handle_fetch_public_key(const Request& request, HandlerContext& ctx) {
  auto target = proto::decode_client_id(request.payload);
  if (!target.has_value()) {
    return reject("FetchPublicKey", "Invalid payload size for public key retrieval.");
  }

  auto client = ctx.store.get_client_by_id(target.value());
  if (!client.has_value()) {
    if (client.get_error() == ErrorCode::kNotFound) {
      return reject("FetchPublicKey", "Client not found: " + to_hex(target.value()));
    }
    return reject("FetchPublicKey", std::string("Store failure: ") + to_string(client.get_error()));
  }

  const auto& record = client.value();
  if (record.public_key.size() != kPublicKeySize) {
    return reject("FetchPublicKey", "Invalid public key size.");
  }

  Response response{ResponseCode::kPublicKey, {}};
  response.payload.reserve(kClientIdSize + kPublicKeySize);
  response.payload.insert(response.payload.end(), record.id.begin(), record.id.end());
  response.payload.insert(response.payload.end(), record.public_key.begin(), record.public_key.end());
  return response;
}

// --- 603 ---
Response handle_send_message(const Request& request, HandlerContext& ctx) {
  auto decoded = proto::decode_send_message(request.payload);
  if (!decoded.has_value()) {
    return reject("SendMessage", "Payload size does not match content size.");
  }
  const auto& req = decoded.value();

  auto type = proto::decode_message_type(req.raw_type);
  if (!type.has_value()) {
    return reject("SendMessage", "Unknown message type " + std::to_string(req.raw_type) + ".");
  }
  if (!proto::content_size_valid(type.value(), req.content_size)) {
    return reject("SendMessage", "Content length " + std::to_string(req.content_size) +
                                     " not allowed for message type " + std::to_string(req.raw_type) + ".");
  }

  std::vector<uint8_t> content(req.content, req.content + req.content_size);
  auto message_id = ctx.store.add_message(req.target, request.header.client_id, type.value(), content);
  if (!message_id.has_value()) {
    return reject("SendMessage", std::string("Failed to store message: ") + to_string(message_id.get_error()));
  }

  MRELAY_LOG_INFO("Stored message " + std::to_string(message_id.value()) + " from " +
                  to_hex(request.header.client_id) + " to " + to_hex(req.target));
  Response response{ResponseCode::kMessageSent, {}};
  response.payload.reserve(kClientIdSize + kMessageIdSize);
  response.payload.insert(response.payload.end(), req.target.begin(), req.target.end());
  append_le32(response.payload, message_id.value());
  return response;
}

// --- 604 ---
Response handle_fetch_pending(const Request& request, HandlerContext& ctx) {
  if (!request.payload.empty()) {
    return reject("FetchPending", "Invalid payload size for retrieving pending messages.");
  }

  auto messages = ctx.store.fetch_and_remove_pending(request.header.client_id);
  if (!messages.has_value()) {
    return reject("FetchPending", std::string("Store failure: ") + to_string(messages.get_error()));
  }

  Response response{ResponseCode::kPendingMessagesReceived, {}};
  for (const auto& msg : messages.value()) {
    proto::append_pending_record(response.payload, msg.from, msg.id, msg.type, msg.content);
  }
  MRELAY_LOG_INFO("Delivered " + std::to_string(messages.value().size()) + " pending message(s) to " +
                  to_hex(request.header.client_id));
  return response;
}

// Indexed by opcode - 600
const HandlerOps kHandlerTable[] = {
    {Opcode::kRegister, "Register", handle_register},
    {Opcode::kListClients, "ListClients", handle_list_clients},
    {Opcode::kFetchPublicKey, "FetchPublicKey", handle_fetch_public_key},
    {Opcode::kSendMessage, "SendMessage", handle_send_message},
    {Opcode::kFetchPending, "FetchPending", handle_fetch_pending},
};

}  // namespace

const HandlerOps* find_handler(uint16_t opcode) {
  if (!proto::is_known_opcode(opcode)) {
    return nullptr;
  }
  return &kHandlerTable[opcode - static_cast<uint16_t>(Opcode::kRegister)];
}

expected<Response, ErrorCode> dispatch(const Request& request, HandlerContext& ctx) {
  const HandlerOps* ops = find_handler(request.header.opcode);
  if (ops == nullptr) {
    return expected<Response, ErrorCode>::error(ErrorCode::kUnknownOpcode);
  }
  MRELAY_LOG_DEBUG(std::string("Dispatching ") + ops->name + " for " + to_hex(request.header.client_id));
  return expected<Response, ErrorCode>::success(ops->handle(request, ctx));
}

}  // namespace mrelay
