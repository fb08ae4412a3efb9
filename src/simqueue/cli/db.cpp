#include "simqueue/cli/commands.hpp"
#include "simqueue/cli/management_client.hpp"
#include "simqueue/config/config.hpp"
#include "simqueue/storage/mysql_schema.hpp"
#include "simqueue/util/log.hpp"

#include <print>

namespace simqueue::cli {

auto cmd_db_init(const DbOptions &opts) -> int {
  log::set_output_stderr();
  auto config_res = ConfigLoader::load_from_file(opts.config_file);
  if (!config_res) {
    std::println(stderr, "Error: {}", config_res.error().message());
    return 1;
  }

  // Opening the store creates the database and schema when missing.
  ManagementClient client(config_res->database);
  if (auto r = client.open(); !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return 1;
  }

  std::println("Database schema initialized (version {}) on {}:{}/{}.",
               schema::CURRENT_SCHEMA_VERSION, config_res->database.host,
               config_res->database.port, config_res->database.database);
  return 0;
}

} // namespace simqueue::cli
