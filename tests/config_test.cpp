#include "simqueue/config/config.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <cstdio>
#include <fstream>
#include <string>

using namespace simqueue;
using namespace std::chrono_literals;

TEST(ConfigTest, DatabaseDefaults) {
  DatabaseConfig db;
  EXPECT_EQ(db.host, "127.0.0.1");
  EXPECT_EQ(db.port, 3306);
  EXPECT_EQ(db.username, "simqueue");
  EXPECT_EQ(db.database, "simqueue");
  EXPECT_EQ(db.pool_size, 4);
}

TEST(ConfigTest, WorkerDefaults) {
  WorkerConfig cfg;
  EXPECT_TRUE(cfg.enabled);
  EXPECT_EQ(cfg.poll_interval, 5000ms);
  EXPECT_EQ(cfg.delegate_url, "http://127.0.0.1:8082");
  EXPECT_EQ(cfg.delegate_path, "/api/v1/evaluate");
  EXPECT_EQ(cfg.delegate_timeout, 300s);
}

TEST(ConfigTest, EmptyDocumentYieldsDefaults) {
  auto result = ConfigLoader::load_from_string("");
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(*result, SystemConfig{});
}

TEST(ConfigTest, LoadFromTomlString) {
  std::string toml = R"(
[database]
host = "db.internal"
port = 3307
username = "queue"
password = "secret"
database = "simqueue_test"
pool_size = 8

[worker]
poll_interval_ms = 250
delegate_url = "https://eval.internal:9443/base"
delegate_path = "/v2/evaluate"
delegate_timeout_sec = 60

[api]
enabled = true
port = 9999
host = "0.0.0.0"

[server]
shards = 3
log_level = "debug"
pid_file = "/tmp/simqueue-test.pid"
)";

  auto result = ConfigLoader::load_from_string(toml);
  ASSERT_TRUE(result.has_value()) << result.error().message();

  EXPECT_EQ(result->database.host, "db.internal");
  EXPECT_EQ(result->database.port, 3307);
  EXPECT_EQ(result->database.password, "secret");
  EXPECT_EQ(result->database.pool_size, 8);
  EXPECT_EQ(result->worker.poll_interval, 250ms);
  EXPECT_EQ(result->worker.delegate_url, "https://eval.internal:9443/base");
  EXPECT_EQ(result->worker.delegate_path, "/v2/evaluate");
  EXPECT_EQ(result->worker.delegate_timeout, 60s);
  EXPECT_EQ(result->api.port, 9999);
  EXPECT_EQ(result->api.host, "0.0.0.0");
  EXPECT_EQ(result->server.shards, 3U);
  EXPECT_EQ(result->server.log_level, "debug");
  EXPECT_EQ(result->server.pid_file, "/tmp/simqueue-test.pid");
}

TEST(ConfigTest, UnknownKeysAreIgnored) {
  auto result = ConfigLoader::load_from_string(R"(
[worker]
poll_interval_ms = 1000
future_knob = "x"
)");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->worker.poll_interval, 1000ms);
}

TEST(ConfigTest, RejectsMalformedToml) {
  auto result = ConfigLoader::load_from_string("[worker\npoll_interval_ms = ");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, RejectsNonPositiveIntervals) {
  EXPECT_FALSE(ConfigLoader::load_from_string("[worker]\npoll_interval_ms = 0\n")
                   .has_value());
  EXPECT_FALSE(
      ConfigLoader::load_from_string("[worker]\ndelegate_timeout_sec = -5\n")
          .has_value());
  EXPECT_FALSE(
      ConfigLoader::load_from_string("[server]\nshards = 0\n").has_value());
}

TEST(ConfigTest, RejectsBadDelegateUrl) {
  auto result = ConfigLoader::load_from_string(
      "[worker]\ndelegate_url = \"ftp://eval.internal\"\n");
  EXPECT_FALSE(result.has_value());
}

TEST(ConfigTest, TlsNeedsCertificateAndKey) {
  auto result =
      ConfigLoader::load_from_string("[api]\ntls_enabled = true\n");
  EXPECT_FALSE(result.has_value());
}

TEST(ConfigTest, EnvironmentOverridesFile) {
  test::ScopedEnv host("SIMQUEUE_DB_HOST", "env-db");
  test::ScopedEnv port("SIMQUEUE_API_PORT", "18080");
  test::ScopedEnv worker("SIMQUEUE_WORKER_ENABLED", "false");
  test::ScopedEnv url("SIMQUEUE_DELEGATE_URL", "http://env-eval:7000");

  auto result = ConfigLoader::load_from_string(R"(
[database]
host = "file-db"

[api]
port = 9000
)");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->database.host, "env-db");
  EXPECT_EQ(result->api.port, 18080);
  EXPECT_FALSE(result->worker.enabled);
  EXPECT_EQ(result->worker.delegate_url, "http://env-eval:7000");
}

TEST(ConfigTest, MalformedEnvironmentOverride) {
  test::ScopedEnv port("SIMQUEUE_DB_PORT", "not-a-port");
  auto result = ConfigLoader::load_from_string("");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, LoadFromFile) {
  const auto path = test::make_temp_path("simqueue_cfg_") + ".toml";
  {
    std::ofstream out(path);
    out << "[api]\nport = 8181\n";
  }
  auto result = ConfigLoader::load_from_file(path);
  std::remove(path.c_str());
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->api.port, 8181);
}

TEST(ConfigTest, MissingFile) {
  auto result = ConfigLoader::load_from_file("/nonexistent/simqueue.toml");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::FileNotFound));
}
