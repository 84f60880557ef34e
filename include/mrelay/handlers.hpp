/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Opcode handlers: one stateless function per request type, looked up in a
 * constant table keyed by opcode.
 */

#ifndef MRELAY_HANDLERS_HPP_
#define MRELAY_HANDLERS_HPP_

#include "id_generator.hpp"
#include "protocol.hpp"
#include "store.hpp"
#include "vocabulary.hpp"

#include <cstdint>

namespace mrelay {

// Collaborators injected into every handler call
struct HandlerContext {
  Store& store;
  ClientIdGenerator& ids;
};

// Handler signature. Validation failures yield Response::error(); the reason
// is logged, never sent.
using RequestHandler = proto::Response (*)(const proto::Request& request, HandlerContext& ctx);

// Function pointer table entry (no virtual dispatch)
struct HandlerOps {
  proto::Opcode opcode;
  const char* name;
  RequestHandler handle;
};

// Returns nullptr for opcodes outside the protocol
const HandlerOps* find_handler(uint16_t opcode);

// Looks up and runs the handler. error(kUnknownOpcode) is a framing error for
// the caller; every other outcome is a wire response.
expected<proto::Response, ErrorCode> dispatch(const proto::Request& request, HandlerContext& ctx);

}  // namespace mrelay

#endif  // MRELAY_HANDLERS_HPP_
