#include "mrelay.hpp"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <netinet/in.h>
#include <sstream>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace mrelay;
using namespace mrelay::proto;

// ============================================================================
// Minimal relay test client (raw POSIX socket)
// ============================================================================

struct Reply {
  uint8_t version = 0;
  uint16_t code = 0;
  std::vector<uint8_t> payload;
};

class RelayTestClient {
 public:
  RelayTestClient() = default;
  ~RelayTestClient() { disconnect(); }

  bool connect(uint16_t port, int timeout_ms = 2000) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0)
      return false;

    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = inet_addr("127.0.0.1");

    if (::connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
      ::close(fd_);
      fd_ = -1;
      return false;
    }
    return true;
  }

  void disconnect() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  void shutdown_write() { ::shutdown(fd_, SHUT_WR); }

  bool send_raw(const void* data, size_t len) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    size_t sent = 0;
    while (sent < len) {
      ssize_t n = ::send(fd_, p + sent, len - sent, MSG_NOSIGNAL);
      if (n <= 0)
        return false;
      sent += static_cast<size_t>(n);
    }
    return true;
  }

  bool recv_exact(uint8_t* buf, size_t len) {
    size_t got = 0;
    while (got < len) {
      ssize_t n = ::recv(fd_, buf + got, len - got, 0);
      if (n <= 0)
        return false;
      got += static_cast<size_t>(n);
    }
    return true;
  }

  bool read_reply(Reply& reply) {
    uint8_t header[kResponseHeaderSize];
    if (!recv_exact(header, sizeof(header)))
      return false;
    auto parsed = parse_response_header(header, sizeof(header));
    if (!parsed.has_value())
      return false;
    reply.version = parsed.value().version;
    reply.code = parsed.value().code;
    reply.payload.assign(parsed.value().payload_size, 0);
    return reply.payload.empty() || recv_exact(reply.payload.data(), reply.payload.size());
  }

  bool request(const ClientId& id, Opcode opcode, const std::vector<uint8_t>& payload, Reply& reply) {
    auto frame = encode_request(id, opcode, payload);
    return send_raw(frame.data(), frame.size()) && read_reply(reply);
  }

  // True once the server has closed its end (FIN or reset)
  bool closed_by_server() {
    uint8_t byte;
    ssize_t n = ::recv(fd_, &byte, 1, 0);
    if (n == 0)
      return true;
    return n < 0 && errno != EAGAIN && errno != EWOULDBLOCK;
  }

 private:
  int fd_ = -1;
};

// ============================================================================
// Test helper: run server in background thread
// ============================================================================

static constexpr uint16_t kTestPort = 18357;

static ServerConfig test_config() {
  ServerConfig config;
  config.port = kTestPort;
  config.bind_addr = "127.0.0.1";
  config.poll_timeout_ms = 50;
  return config;
}

struct ServerFixture {
  SqliteStore store{":memory:"};
  ClientIdGenerator ids;
  Server server;
  std::thread server_thread;

  explicit ServerFixture(const ServerConfig& config = test_config()) : server(config, HandlerContext{store, ids}) {}

  void start() {
    server_thread = std::thread([this]() { server.run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }

  void stop() {
    server.stop();
    if (server_thread.joinable()) {
      server_thread.join();
    }
  }

  ~ServerFixture() { stop(); }
};

static PublicKey test_key(uint8_t fill) {
  PublicKey key{};
  key.fill(fill);
  return key;
}

static ClientId register_user(RelayTestClient& client, const std::string& name) {
  Reply reply;
  REQUIRE(client.request(ClientId{}, Opcode::kRegister, encode_register(name, test_key(0x33)), reply));
  REQUIRE(reply.code == 2100);
  REQUIRE(reply.payload.size() == kClientIdSize);
  ClientId id{};
  std::memcpy(id.data(), reply.payload.data(), kClientIdSize);
  return id;
}

// ============================================================================
// Integration tests
// ============================================================================

TEST_CASE("Integration - Server start and stop", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  RelayTestClient client;
  REQUIRE(client.connect(kTestPort));
  client.disconnect();

  fixture.stop();
  REQUIRE_FALSE(fixture.server.is_running());
}

TEST_CASE("Integration - Stop before run returns at once", "[integration]") {
  ServerFixture fixture;
  fixture.server.stop();

  auto start = std::chrono::steady_clock::now();
  fixture.server.run();
  REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(500));
  REQUIRE_FALSE(fixture.server.is_running());
}

TEST_CASE("Integration - Console quit before run is not lost", "[integration]") {
  ServerFixture fixture;
  Server::StopFlag flag = fixture.server.stop_flag();
  std::istringstream console("q\n");
  REQUIRE(run_shutdown_listener(console, [flag]() { flag->store(true); }));

  fixture.start();
  fixture.stop();
  REQUIRE_FALSE(fixture.server.is_running());
}

TEST_CASE("Integration - Stop flag outlives the server", "[integration]") {
  Server::StopFlag flag;
  {
    ServerFixture fixture;
    flag = fixture.server.stop_flag();
  }
  REQUIRE(flag.use_count() == 1);
  flag->store(true);
  REQUIRE(flag->load());
}

TEST_CASE("Integration - Server restart on same port", "[integration]") {
  for (int round = 0; round < 2; ++round) {
    ServerFixture fixture;
    fixture.start();
    RelayTestClient client;
    REQUIRE(client.connect(kTestPort));
    register_user(client, "round" + std::to_string(round));
    fixture.stop();
  }
}

TEST_CASE("Integration - Register, list, send and fetch", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  RelayTestClient alice_conn;
  RelayTestClient bob_conn;
  REQUIRE(alice_conn.connect(kTestPort));
  REQUIRE(bob_conn.connect(kTestPort));

  ClientId alice = register_user(alice_conn, "alice");

  // Same name again is refused without a payload
  Reply dup;
  REQUIRE(bob_conn.request(ClientId{}, Opcode::kRegister, encode_register("alice", test_key(1)), dup));
  REQUIRE(dup.version == kServerVersion);
  REQUIRE(dup.code == 9000);
  REQUIRE(dup.payload.empty());

  ClientId bob = register_user(bob_conn, "bob");

  Reply list;
  REQUIRE(bob_conn.request(bob, Opcode::kListClients, {}, list));
  REQUIRE(list.code == 2101);
  std::vector<uint8_t> expected_list;
  append_client_entry(expected_list, alice, "alice");
  REQUIRE(list.payload == expected_list);

  Reply key;
  REQUIRE(bob_conn.request(bob, Opcode::kFetchPublicKey, std::vector<uint8_t>(alice.begin(), alice.end()), key));
  REQUIRE(key.code == 2102);
  REQUIRE(key.payload.size() == kClientIdSize + kPublicKeySize);

  Reply sent;
  REQUIRE(bob_conn.request(bob, Opcode::kSendMessage, encode_send_message(alice, 3, "hi"), sent));
  REQUIRE(sent.code == 2103);
  REQUIRE(sent.payload.size() == kClientIdSize + kMessageIdSize);
  REQUIRE(std::memcmp(sent.payload.data(), alice.data(), kClientIdSize) == 0);
  uint32_t message_id = load_le32(sent.payload.data() + kClientIdSize);

  Reply pending;
  REQUIRE(alice_conn.request(alice, Opcode::kFetchPending, {}, pending));
  REQUIRE(pending.code == 2104);
  std::vector<uint8_t> expected_pending;
  append_pending_record(expected_pending, bob, message_id, MessageType::kTextMessageSend, {'h', 'i'});
  REQUIRE(pending.payload == expected_pending);

  Reply empty;
  REQUIRE(alice_conn.request(alice, Opcode::kFetchPending, {}, empty));
  REQUIRE(empty.code == 2104);
  REQUIRE(empty.payload.empty());
}

TEST_CASE("Integration - Error response keeps the connection", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  RelayTestClient client;
  REQUIRE(client.connect(kTestPort));

  Reply bad;
  REQUIRE(client.request(ClientId{}, Opcode::kListClients, {0x01}, bad));
  REQUIRE(bad.code == 9000);

  Reply good;
  REQUIRE(client.request(ClientId{}, Opcode::kListClients, {}, good));
  REQUIRE(good.code == 2101);

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE(fixture.server.stats().error_responses.load() == 1);
  REQUIRE(fixture.server.stats().requests_handled.load() == 2);
}

TEST_CASE("Integration - Header split across writes", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  RelayTestClient client;
  REQUIRE(client.connect(kTestPort));

  auto frame = encode_request(ClientId{}, Opcode::kRegister, encode_register("carol", test_key(7)));
  REQUIRE(client.send_raw(frame.data(), 10));
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  REQUIRE(client.send_raw(frame.data() + 10, 30));
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  REQUIRE(client.send_raw(frame.data() + 40, frame.size() - 40));

  Reply reply;
  REQUIRE(client.read_reply(reply));
  REQUIRE(reply.code == 2100);
  REQUIRE(reply.payload.size() == kClientIdSize);
}

TEST_CASE("Integration - Back-to-back requests in one write", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  RelayTestClient client;
  REQUIRE(client.connect(kTestPort));

  auto first = encode_request(ClientId{}, Opcode::kRegister, encode_register("dave", test_key(1)));
  auto second = encode_request(ClientId{}, Opcode::kListClients, {});
  first.insert(first.end(), second.begin(), second.end());
  REQUIRE(client.send_raw(first.data(), first.size()));

  Reply reply1;
  Reply reply2;
  REQUIRE(client.read_reply(reply1));
  REQUIRE(client.read_reply(reply2));
  REQUIRE(reply1.code == 2100);
  REQUIRE(reply2.code == 2101);
  REQUIRE(reply2.payload.size() == kClientIdSize + kUsernameSize);
}

TEST_CASE("Integration - Short header then close", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  RelayTestClient client;
  REQUIRE(client.connect(kTestPort));
  uint8_t partial[10] = {};
  REQUIRE(client.send_raw(partial, sizeof(partial)));
  client.shutdown_write();

  REQUIRE(client.closed_by_server());
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  REQUIRE(fixture.server.stats().framing_errors.load() == 1);
  REQUIRE(fixture.server.stats().requests_handled.load() == 0);
  REQUIRE(fixture.server.stats().active_connections.load() == 0);
}

TEST_CASE("Integration - Payload cut short then close", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  RelayTestClient client;
  REQUIRE(client.connect(kTestPort));
  auto frame = encode_request(ClientId{}, Opcode::kRegister, encode_register("erin", test_key(1)));
  REQUIRE(client.send_raw(frame.data(), frame.size() - 100));
  client.shutdown_write();

  REQUIRE(client.closed_by_server());
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  REQUIRE(fixture.store.get_client_by_username("erin").get_error() == ErrorCode::kNotFound);
}

TEST_CASE("Integration - Unknown opcode closes without response", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  RelayTestClient client;
  REQUIRE(client.connect(kTestPort));

  std::vector<uint8_t> frame;
  RequestHeader header;
  header.version = kServerVersion;
  header.opcode = 777;
  header.payload_size = 0;
  append_request_header(frame, header);
  REQUIRE(client.send_raw(frame.data(), frame.size()));

  REQUIRE(client.closed_by_server());
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  REQUIRE(fixture.server.stats().framing_errors.load() == 1);
}

TEST_CASE("Integration - Oversized payload closes", "[integration]") {
  ServerConfig config = test_config();
  config.max_payload_size = 1024;
  ServerFixture fixture(config);
  fixture.start();

  RelayTestClient client;
  REQUIRE(client.connect(kTestPort));
  auto frame = encode_request(ClientId{}, Opcode::kSendMessage, std::vector<uint8_t>(2048, 0));
  REQUIRE(client.send_raw(frame.data(), kRequestHeaderSize));

  REQUIRE(client.closed_by_server());
}

TEST_CASE("Integration - Stalled frame times out", "[integration]") {
  ServerFixture fixture;
  fixture.server.set_frame_timeout_ms(200);
  fixture.start();

  RelayTestClient client;
  REQUIRE(client.connect(kTestPort));
  uint8_t partial[5] = {};
  REQUIRE(client.send_raw(partial, sizeof(partial)));

  auto start = std::chrono::steady_clock::now();
  REQUIRE(client.closed_by_server());
  auto waited = std::chrono::steady_clock::now() - start;
  REQUIRE(waited < std::chrono::milliseconds(1500));
}

TEST_CASE("Integration - Large declared payload with no bytes times out", "[integration]") {
  ServerFixture fixture;
  fixture.server.set_frame_timeout_ms(200);
  fixture.start();

  RelayTestClient client;
  REQUIRE(client.connect(kTestPort));
  std::vector<uint8_t> frame;
  RequestHeader header;
  header.version = kServerVersion;
  header.opcode = static_cast<uint16_t>(Opcode::kSendMessage);
  header.payload_size = 60U * 1024U * 1024U;
  append_request_header(frame, header);
  REQUIRE(client.send_raw(frame.data(), frame.size()));

  auto start = std::chrono::steady_clock::now();
  REQUIRE(client.closed_by_server());
  REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(1500));

  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  REQUIRE(fixture.server.stats().framing_errors.load() == 1);
}

TEST_CASE("Integration - Idle connection is not timed out", "[integration]") {
  ServerFixture fixture;
  fixture.server.set_frame_timeout_ms(100);
  fixture.start();

  RelayTestClient client;
  REQUIRE(client.connect(kTestPort));
  std::this_thread::sleep_for(std::chrono::milliseconds(300));

  Reply reply;
  REQUIRE(client.request(ClientId{}, Opcode::kListClients, {}, reply));
  REQUIRE(reply.code == 2101);
}

TEST_CASE("Integration - Connection limit rejects extra clients", "[integration]") {
  ServerFixture fixture;
  fixture.server.set_max_connections(1);
  fixture.start();

  RelayTestClient first;
  REQUIRE(first.connect(kTestPort));
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  RelayTestClient second;
  REQUIRE(second.connect(kTestPort));
  REQUIRE(second.closed_by_server());

  // The admitted client is unaffected
  register_user(first, "frank");

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE(fixture.server.stats().rejected_connections.load() == 1);
  REQUIRE(fixture.server.stats().total_connections.load() == 1);
}

TEST_CASE("Integration - Large message crosses read chunks", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  RelayTestClient client;
  REQUIRE(client.connect(kTestPort));
  ClientId grace = register_user(client, "grace");

  std::string content(100 * 1024, 'm');
  for (size_t i = 0; i < content.size(); ++i) {
    content[i] = static_cast<char>('a' + i % 26);
  }

  Reply sent;
  REQUIRE(client.request(grace, Opcode::kSendMessage, encode_send_message(grace, 3, content), sent));
  REQUIRE(sent.code == 2103);

  Reply pending;
  REQUIRE(client.request(grace, Opcode::kFetchPending, {}, pending));
  auto records = parse_pending_records(pending.payload);
  REQUIRE(records.has_value());
  REQUIRE(records.value().size() == 1);
  REQUIRE(std::string(records.value()[0].content.begin(), records.value()[0].content.end()) == content);
}

TEST_CASE("Integration - Requests refresh last seen", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  RelayTestClient client;
  REQUIRE(client.connect(kTestPort));
  ClientId henry = register_user(client, "henry");
  REQUIRE(fixture.store.get_client_by_id(henry).value().last_seen == kLastSeenUnavailable);

  Reply reply;
  REQUIRE(client.request(henry, Opcode::kListClients, {}, reply));
  REQUIRE(fixture.store.get_client_by_id(henry).value().last_seen != kLastSeenUnavailable);
}

TEST_CASE("Integration - Server stats tracking", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  REQUIRE(fixture.server.stats().total_connections.load() == 0);

  for (int i = 0; i < 3; ++i) {
    RelayTestClient client;
    REQUIRE(client.connect(kTestPort));
    register_user(client, "user" + std::to_string(i));
    client.disconnect();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  const auto& stats = fixture.server.stats();
  REQUIRE(stats.total_connections.load() == 3);
  REQUIRE(stats.active_connections.load() == 0);
  REQUIRE(stats.requests_handled.load() == 3);
  REQUIRE(stats.bytes_in.load() == 3 * (kRequestHeaderSize + kUsernameSize + kPublicKeySize));
  REQUIRE(stats.bytes_out.load() == 3 * (kResponseHeaderSize + kClientIdSize));

  // At least one poll waited out the 50 ms timeout
  fixture.stop();
  REQUIRE(stats.max_poll_latency_us.load() >= 10000);
  REQUIRE(stats.max_poll_latency_us.load() >= stats.last_poll_latency_us.load());
}
