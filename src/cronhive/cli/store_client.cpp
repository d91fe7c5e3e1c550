#include "cronhive/cli/store_client.hpp"

#include "cronhive/util/log.hpp"

#include <print>

namespace cronhive::cli {

auto StoreClient::open(std::string_view config_file) -> Result<StoreClient> {
  log::set_output_stderr();
  auto config = ConfigLoader::load_from_file(config_file);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return fail(config.error());
  }

  auto store =
      std::make_unique<storage::JobStoreService>(config->database, 1);
  if (auto r = store->open(); !r) {
    std::println(stderr, "Error: Cannot reach job store {}:{}: {}",
                 config->database.host, config->database.port,
                 r.error().message());
    return fail(r.error());
  }
  return StoreClient(std::move(*config), std::move(store));
}

StoreClient::~StoreClient() {
  if (store_ && store_->is_open()) {
    store_->close();
  }
}

} // namespace cronhive::cli
