#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace simqueue {

struct DatabaseConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{3306};
  std::string username{"simqueue"};
  std::string password;
  std::string database{"simqueue"};
  std::uint16_t pool_size{4};
  std::uint16_t connect_timeout{5}; // seconds

  auto operator==(const DatabaseConfig &) const -> bool = default;
};

struct WorkerConfig {
  bool enabled{true};
  std::chrono::milliseconds poll_interval{5000};
  std::string delegate_url{"http://127.0.0.1:8082"};
  std::string delegate_path{"/api/v1/evaluate"};
  std::chrono::seconds delegate_timeout{300};

  auto operator==(const WorkerConfig &) const -> bool = default;
};

struct ApiConfig {
  bool enabled{true};
  std::uint16_t port{8080};
  std::string host{"127.0.0.1"};
  bool reuse_port{false};
  bool tls_enabled{false};
  std::string tls_cert_file;
  std::string tls_key_file;

  auto operator==(const ApiConfig &) const -> bool = default;
};

struct ServerConfig {
  unsigned shards{2};
  std::string log_level{"info"};
  std::string log_file;
  std::string pid_file{"simqueue.pid"};

  auto operator==(const ServerConfig &) const -> bool = default;
};

struct SystemConfig {
  DatabaseConfig database;
  WorkerConfig worker;
  ApiConfig api;
  ServerConfig server;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace simqueue
