/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

/**
 * @file mrelay.hpp
 * @brief mrelay - store-and-forward message relay
 *
 * A poll() reactor serving a fixed-layout binary protocol. Clients register
 * a username and public key, list peers, fetch keys, and leave opaque
 * messages that recipients collect later. Messages live in SQLite until the
 * recipient fetches them; a fetch reads and deletes them in one transaction.
 *
 * Usage:
 *   mrelay::SqliteStore store("defensive.db");
 *   mrelay::ClientIdGenerator ids;
 *   mrelay::ServerConfig config;
 *   config.port = mrelay::load_port("myport.info");
 *   mrelay::Server server(config, mrelay::HandlerContext{store, ids});
 *   server.run();
 */

#ifndef MRELAY_HPP_
#define MRELAY_HPP_

#include "mrelay/config.hpp"
#include "mrelay/connection.hpp"
#include "mrelay/console.hpp"
#include "mrelay/handlers.hpp"
#include "mrelay/id_generator.hpp"
#include "mrelay/log.hpp"
#include "mrelay/protocol.hpp"
#include "mrelay/server.hpp"
#include "mrelay/sqlite_store.hpp"
#include "mrelay/stats.hpp"
#include "mrelay/store.hpp"
#include "mrelay/utils.hpp"
#include "mrelay/vocabulary.hpp"

#endif  // MRELAY_HPP_
