/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Random client identifiers from mbedTLS CTR-DRBG.
 */

#ifndef MRELAY_ID_GENERATOR_HPP_
#define MRELAY_ID_GENERATOR_HPP_

#include "protocol.hpp"
#include "vocabulary.hpp"

#include <mbedtls/ctr_drbg.h>
#include <mbedtls/entropy.h>
#include <mutex>

namespace mrelay {

// Produces random 16-byte ids laid out as RFC 4122 version 4 UUIDs.
// Uniqueness is only probabilistic; the store's primary key is the real check.
class ClientIdGenerator {
 public:
  // Throws std::runtime_error if the DRBG cannot be seeded
  ClientIdGenerator();
  ~ClientIdGenerator();

  ClientIdGenerator(const ClientIdGenerator&) = delete;
  ClientIdGenerator& operator=(const ClientIdGenerator&) = delete;

  expected<ClientId, ErrorCode> next();

 private:
  mbedtls_entropy_context entropy_;
  mbedtls_ctr_drbg_context ctr_drbg_;
  std::mutex mutex_;
};

}  // namespace mrelay

#endif  // MRELAY_ID_GENERATOR_HPP_
