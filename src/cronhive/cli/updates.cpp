#include "cronhive/cli/commands.hpp"
#include "cronhive/cli/formatting.hpp"
#include "cronhive/cli/store_client.hpp"
#include "cronhive/util/json.hpp"
#include "cronhive/util/time.hpp"

#include <print>

namespace cronhive::cli {
namespace {

struct MarkerJson {
  std::int64_t id{0};
  bool updated{false};
  std::string insert_time;
  std::string update_time;
  std::optional<std::string> jobs_before_update;
  std::optional<std::string> jobs_after_update;
};

// Job count of a marker snapshot, "-" when absent or unreadable.
auto snapshot_size(const std::optional<std::string> &json) -> std::string {
  if (!json) {
    return "-";
  }
  auto rows = parse_json<std::vector<glz::generic_json<glz::num_mode::i64>>>(
      *json);
  return rows ? std::to_string(rows->size()) : "?";
}

} // namespace

auto cmd_updates_list(const UpdatesListOptions &opts) -> int {
  auto client = StoreClient::open(opts.config_file);
  if (!client) {
    return 1;
  }
  auto markers = client->store().list_updates(opts.limit);
  if (!markers) {
    std::println(stderr, "Error: {}", markers.error().message());
    return 1;
  }

  if (opts.json) {
    std::vector<MarkerJson> rows;
    rows.reserve(markers->size());
    for (const auto &m : *markers) {
      rows.push_back({.id = m.id,
                      .updated = m.updated,
                      .insert_time = util::format_iso8601(m.insert_time),
                      .update_time = util::format_iso8601(m.update_time),
                      .jobs_before_update = m.jobs_before_update,
                      .jobs_after_update = m.jobs_after_update});
    }
    std::println("{}", dump_json(rows));
    return 0;
  }

  if (markers->empty()) {
    std::println("No updates recorded.");
    return 0;
  }
  fmt::Table table({{"ID", 8, true},
                    {"STATE", 10},
                    {"INSERTED", 23},
                    {"PROCESSED", 23},
                    {"BEFORE", 6, true},
                    {"AFTER", 6, true}});
  table.print_header();
  for (const auto &m : *markers) {
    table.print_row({std::to_string(m.id), fmt::colorize_marker_state(m.updated),
                     fmt::format_timestamp(m.insert_time),
                     m.updated ? fmt::format_timestamp(m.update_time) : "-",
                     snapshot_size(m.jobs_before_update),
                     snapshot_size(m.jobs_after_update)});
  }
  return 0;
}

auto cmd_updates_mark(const UpdatesMarkOptions &opts) -> int {
  auto client = StoreClient::open(opts.config_file);
  if (!client) {
    return 1;
  }
  auto marked = client->store().mark_updates_processed();
  if (!marked) {
    std::println(stderr, "Error: {}", marked.error().message());
    return 1;
  }
  std::println("Marked {} update(s) processed.", *marked);
  return 0;
}

} // namespace cronhive::cli
