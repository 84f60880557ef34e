#include "mrelay/config.hpp"
#include "mrelay/console.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

using namespace mrelay;

namespace {

// Writes a temporary port file, removed on scope exit
struct PortFile {
  std::string path = "mrelay_test_port.info";

  explicit PortFile(const std::string& content) {
    std::ofstream out(path);
    out << content;
  }

  ~PortFile() { std::remove(path.c_str()); }
};

}  // namespace

// ============================================================================
// Port file
// ============================================================================

TEST_CASE("Config - defaults", "[config]") {
  ServerConfig config;
  REQUIRE(config.port == 1357);
  REQUIRE(config.max_connections == 100);
  REQUIRE(config.backlog == 100);
  REQUIRE(config.poll_timeout_ms == 1000);
  REQUIRE(config.frame_timeout_ms == 5000);
  REQUIRE(config.db_path == "defensive.db");
  REQUIRE(config.port_file == "myport.info");
}

TEST_CASE("Config - port file value", "[config]") {
  PortFile file("8080\n");
  REQUIRE(load_port(file.path) == 8080);
}

TEST_CASE("Config - surrounding whitespace is ignored", "[config]") {
  PortFile file("  4242 \r\n");
  REQUIRE(load_port(file.path) == 4242);
}

TEST_CASE("Config - missing file falls back", "[config]") {
  REQUIRE(load_port("mrelay_no_such_port_file.info") == kDefaultPort);
}

TEST_CASE("Config - empty file falls back", "[config]") {
  PortFile file("");
  REQUIRE(load_port(file.path) == kDefaultPort);
}

TEST_CASE("Config - non-numeric content falls back", "[config]") {
  {
    PortFile file("port=80");
    REQUIRE(load_port(file.path) == kDefaultPort);
  }
  {
    PortFile file("-5");
    REQUIRE(load_port(file.path) == kDefaultPort);
  }
}

TEST_CASE("Config - out of range falls back", "[config]") {
  {
    PortFile file("0");
    REQUIRE(load_port(file.path) == kDefaultPort);
  }
  {
    PortFile file("65536");
    REQUIRE(load_port(file.path) == kDefaultPort);
  }
  {
    PortFile file("99999999999999999999");
    REQUIRE(load_port(file.path) == kDefaultPort);
  }
  {
    PortFile file("65535");
    REQUIRE(load_port(file.path) == 65535);
  }
}

// ============================================================================
// Command line
// ============================================================================

TEST_CASE("Config - command line positional arguments", "[config]") {
  ServerConfig config;
  const char* argv[] = {"mrelay_server", "ports.info", "relay.db"};
  REQUIRE(parse_command_line(3, argv, config));
  REQUIRE(config.port_file == "ports.info");
  REQUIRE(config.db_path == "relay.db");
  REQUIRE_FALSE(config.verbose);
}

TEST_CASE("Config - command line verbose flag", "[config]") {
  ServerConfig config;
  const char* argv[] = {"mrelay_server", "-v", "ports.info"};
  REQUIRE(parse_command_line(3, argv, config));
  REQUIRE(config.verbose);
  REQUIRE(config.port_file == "ports.info");
  REQUIRE(config.db_path == "defensive.db");
}

TEST_CASE("Config - command line rejects extras", "[config]") {
  {
    ServerConfig config;
    const char* argv[] = {"mrelay_server", "a", "b", "c"};
    REQUIRE_FALSE(parse_command_line(4, argv, config));
  }
  {
    ServerConfig config;
    const char* argv[] = {"mrelay_server", "-x"};
    REQUIRE_FALSE(parse_command_line(2, argv, config));
  }
  {
    ServerConfig config;
    const char* argv[] = {"mrelay_server"};
    REQUIRE(parse_command_line(1, argv, config));
    REQUIRE(config.port_file == "myport.info");
  }
}

// ============================================================================
// Console
// ============================================================================

TEST_CASE("Console - quit command matching", "[console]") {
  REQUIRE(is_quit_command("q"));
  REQUIRE(is_quit_command("Q"));
  REQUIRE(is_quit_command("  q\t"));
  REQUIRE(is_quit_command("q\r"));
  REQUIRE_FALSE(is_quit_command(""));
  REQUIRE_FALSE(is_quit_command("quit"));
  REQUIRE_FALSE(is_quit_command("qq"));
  REQUIRE_FALSE(is_quit_command("x"));
}

TEST_CASE("Console - stops on q after other lines", "[console]") {
  std::istringstream in("status\nhelp\n Q \nnever read\n");
  int calls = 0;
  REQUIRE(run_shutdown_listener(in, [&calls]() { ++calls; }));
  REQUIRE(calls == 1);

  std::string rest;
  std::getline(in, rest);
  REQUIRE(rest == "never read");
}

TEST_CASE("Console - end of input does not stop", "[console]") {
  std::istringstream in("hello\nworld\n");
  int calls = 0;
  REQUIRE_FALSE(run_shutdown_listener(in, [&calls]() { ++calls; }));
  REQUIRE(calls == 0);
}
