#include "cronhive/app/application.hpp"
#include "cronhive/cli/commands.hpp"
#include "cronhive/util/log.hpp"

#include <print>

namespace cronhive::cli {

auto cmd_db_init(const DbOptions &opts) -> int {
  log::set_output_stderr();
  Application app;
  if (auto r = app.load_config(opts.config_file); !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return 1;
  }
  if (auto r = app.init_db_only(); !r) {
    std::println(stderr, "Error: Database initialization failed: {}",
                 r.error().message());
    return 1;
  }
  const auto &db = app.config().database;
  std::println("Database '{}' ready (table prefix '{}').", db.database,
               db.table_prefix);
  return 0;
}

} // namespace cronhive::cli
