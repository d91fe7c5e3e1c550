#pragma once

#include "cronhive/config/config.hpp"
#include "cronhive/core/error.hpp"
#include "cronhive/storage/store_service.hpp"

#include <memory>
#include <string_view>

namespace cronhive::cli {

// One store connection for the lifetime of a CLI command. Errors are
// printed to stderr by open().
class StoreClient {
public:
  [[nodiscard]] static auto open(std::string_view config_file)
      -> Result<StoreClient>;

  StoreClient(StoreClient &&) noexcept = default;
  auto operator=(StoreClient &&) noexcept -> StoreClient & = default;
  ~StoreClient();

  [[nodiscard]] auto config() const noexcept -> const Config & {
    return config_;
  }
  [[nodiscard]] auto store() -> storage::JobStoreService & { return *store_; }

private:
  StoreClient(Config config, std::unique_ptr<storage::JobStoreService> store)
      : config_(std::move(config)), store_(std::move(store)) {}

  Config config_;
  std::unique_ptr<storage::JobStoreService> store_;
};

} // namespace cronhive::cli
