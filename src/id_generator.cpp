/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#include "mrelay/id_generator.hpp"

#include "mrelay/log.hpp"

#include <cstring>

#include <stdexcept>
#include <string>

namespace mrelay {

ClientIdGenerator::ClientIdGenerator() {
  mbedtls_entropy_init(&entropy_);
  mbedtls_ctr_drbg_init(&ctr_drbg_);

  const char* pers = "mrelay_client_id";
  int ret = mbedtls_ctr_drbg_seed(&ctr_drbg_, mbedtls_entropy_func, &entropy_,
                                  reinterpret_cast<const unsigned char*>(pers), strlen(pers));
  if (ret != 0) {
    mbedtls_ctr_drbg_free(&ctr_drbg_);
    mbedtls_entropy_free(&entropy_);
    throw std::runtime_error("Failed to seed client id generator: mbedtls error " + std::to_string(ret));
  }
}

ClientIdGenerator::~ClientIdGenerator() {
  mbedtls_ctr_drbg_free(&ctr_drbg_);
  mbedtls_entropy_free(&entropy_);
}

expected<ClientId, ErrorCode> ClientIdGenerator::next() {
  ClientId id{};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    int ret = mbedtls_ctr_drbg_random(&ctr_drbg_, id.data(), id.size());
    if (ret != 0) {
      MRELAY_LOG_ERROR("Client id generation failed: mbedtls error " + std::to_string(ret));
      return expected<ClientId, ErrorCode>::error(ErrorCode::kInternalError);
    }
  }

  // Version 4, variant 10xx
  id[6] = static_cast<uint8_t>((id[6] & 0x0F) | 0x40);
  id[8] = static_cast<uint8_t>((id[8] & 0x3F) | 0x80);
  return expected<ClientId, ErrorCode>::success(id);
}

}  // namespace mrelay
