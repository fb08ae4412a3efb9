#include "simqueue/config/config.hpp"
#include "simqueue/config/toml_util.hpp"

#include "simqueue/util/log.hpp"
#include "simqueue/util/url.hpp"

#include <boost/lexical_cast.hpp>

#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <type_traits>

namespace simqueue {
namespace detail {

struct DatabaseToml {
  std::string host{"127.0.0.1"};
  std::uint16_t port{3306};
  std::string username{"simqueue"};
  std::string password;
  std::string database{"simqueue"};
  std::uint16_t pool_size{4};
  std::uint16_t connect_timeout{5};
};

struct WorkerToml {
  bool enabled{true};
  std::int64_t poll_interval_ms{5000};
  std::string delegate_url{"http://127.0.0.1:8082"};
  std::string delegate_path{"/api/v1/evaluate"};
  std::int64_t delegate_timeout_sec{300};
};

struct ApiToml {
  bool enabled{true};
  std::uint16_t port{8080};
  std::string host{"127.0.0.1"};
  bool reuse_port{false};
  bool tls_enabled{false};
  std::string tls_cert_file;
  std::string tls_key_file;
};

struct ServerToml {
  int shards{2};
  std::string log_level{"info"};
  std::string log_file;
  std::string pid_file{"simqueue.pid"};
};

struct SystemToml {
  DatabaseToml database{};
  WorkerToml worker{};
  ApiToml api{};
  ServerToml server{};
};

} // namespace detail
} // namespace simqueue

namespace glz {
template <> struct meta<simqueue::detail::DatabaseToml> {
  using T = simqueue::detail::DatabaseToml;
  static constexpr auto value =
      object("host", &T::host, "port", &T::port, "username", &T::username,
             "password", &T::password, "database", &T::database, "pool_size",
             &T::pool_size, "connect_timeout", &T::connect_timeout);
};

template <> struct meta<simqueue::detail::WorkerToml> {
  using T = simqueue::detail::WorkerToml;
  static constexpr auto value =
      object("enabled", &T::enabled, "poll_interval_ms", &T::poll_interval_ms,
             "delegate_url", &T::delegate_url, "delegate_path",
             &T::delegate_path, "delegate_timeout_sec",
             &T::delegate_timeout_sec);
};

template <> struct meta<simqueue::detail::ApiToml> {
  using T = simqueue::detail::ApiToml;
  static constexpr auto value = object(
      "enabled", &T::enabled, "port", &T::port, "host", &T::host, "reuse_port",
      &T::reuse_port, "tls_enabled", &T::tls_enabled, "tls_cert_file",
      &T::tls_cert_file, "tls_key_file", &T::tls_key_file);
};

template <> struct meta<simqueue::detail::ServerToml> {
  using T = simqueue::detail::ServerToml;
  static constexpr auto value =
      object("shards", &T::shards, "log_level", &T::log_level, "log_file",
             &T::log_file, "pid_file", &T::pid_file);
};

template <> struct meta<simqueue::detail::SystemToml> {
  using T = simqueue::detail::SystemToml;
  static constexpr auto value =
      object("database", &T::database, "worker", &T::worker, "api", &T::api,
             "server", &T::server);
};
} // namespace glz

namespace simqueue {
namespace {

template <typename T>
auto env_override(const char *name, T &field) -> void {
  const char *v = std::getenv(name);
  if (v == nullptr) {
    return;
  }
  if constexpr (std::is_same_v<T, bool>) {
    const std::string_view s(v);
    field = s == "1" || s == "true" || s == "yes";
  } else if constexpr (std::is_same_v<T, std::string>) {
    field = v;
  } else {
    field = boost::lexical_cast<T>(v);
  }
}

[[nodiscard]] auto validate(const SystemConfig &cfg) -> Result<void> {
  auto reject = [](std::string_view why) {
    log::error("Invalid configuration: {}", why);
    return fail(Error::ParseError);
  };

  if (cfg.database.port == 0 || cfg.database.pool_size == 0 ||
      cfg.database.connect_timeout == 0) {
    return reject("database port, pool_size and connect_timeout must be > 0");
  }
  if (cfg.worker.poll_interval.count() <= 0 ||
      cfg.worker.delegate_timeout.count() <= 0) {
    return reject("worker intervals must be > 0");
  }
  if (!util::parse_http_url(cfg.worker.delegate_url)) {
    return reject("worker.delegate_url is not an http(s) URL");
  }
  if (cfg.api.port == 0) {
    return reject("api.port must be > 0");
  }
  if (cfg.api.tls_enabled &&
      (cfg.api.tls_cert_file.empty() || cfg.api.tls_key_file.empty())) {
    return reject("api.tls_enabled requires tls_cert_file and tls_key_file");
  }
  if (cfg.server.shards == 0) {
    return reject("server.shards must be > 0");
  }
  return ok();
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<SystemConfig> {
  auto raw_result = toml_util::parse_toml<detail::SystemToml>(toml_text);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  if (raw.server.shards <= 0 || raw.worker.poll_interval_ms <= 0 ||
      raw.worker.delegate_timeout_sec <= 0) {
    log::error("Invalid configuration: shards and worker intervals must be "
               "positive");
    return fail(Error::ParseError);
  }

  SystemConfig cfg{};
  cfg.database = DatabaseConfig{
      .host = std::move(raw.database.host),
      .port = raw.database.port,
      .username = std::move(raw.database.username),
      .password = std::move(raw.database.password),
      .database = std::move(raw.database.database),
      .pool_size = raw.database.pool_size,
      .connect_timeout = raw.database.connect_timeout,
  };
  cfg.worker = WorkerConfig{
      .enabled = raw.worker.enabled,
      .poll_interval = std::chrono::milliseconds(raw.worker.poll_interval_ms),
      .delegate_url = std::move(raw.worker.delegate_url),
      .delegate_path = std::move(raw.worker.delegate_path),
      .delegate_timeout = std::chrono::seconds(raw.worker.delegate_timeout_sec),
  };
  cfg.api = ApiConfig{
      .enabled = raw.api.enabled,
      .port = raw.api.port,
      .host = std::move(raw.api.host),
      .reuse_port = raw.api.reuse_port,
      .tls_enabled = raw.api.tls_enabled,
      .tls_cert_file = std::move(raw.api.tls_cert_file),
      .tls_key_file = std::move(raw.api.tls_key_file),
  };
  cfg.server = ServerConfig{
      .shards = static_cast<unsigned>(raw.server.shards),
      .log_level = std::move(raw.server.log_level),
      .log_file = std::move(raw.server.log_file),
      .pid_file = std::move(raw.server.pid_file),
  };

  env_override("SIMQUEUE_DB_HOST", cfg.database.host);
  env_override("SIMQUEUE_DB_PORT", cfg.database.port);
  env_override("SIMQUEUE_DB_USER", cfg.database.username);
  env_override("SIMQUEUE_DB_PASSWORD", cfg.database.password);
  env_override("SIMQUEUE_DB_NAME", cfg.database.database);
  env_override("SIMQUEUE_DB_POOL_SIZE", cfg.database.pool_size);
  env_override("SIMQUEUE_DELEGATE_URL", cfg.worker.delegate_url);
  env_override("SIMQUEUE_WORKER_ENABLED", cfg.worker.enabled);
  env_override("SIMQUEUE_API_HOST", cfg.api.host);
  env_override("SIMQUEUE_API_PORT", cfg.api.port);
  env_override("SIMQUEUE_API_ENABLED", cfg.api.enabled);
  env_override("SIMQUEUE_LOG_LEVEL", cfg.server.log_level);

  if (auto valid = validate(cfg); !valid) {
    return fail(valid.error());
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    log::error("Cannot read configuration file {}", path);
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid SIMQUEUE_* environment override: {}", e.what());
    return fail(Error::ParseError);
  }
}

} // namespace simqueue
