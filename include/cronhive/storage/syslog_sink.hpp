#pragma once

#include "cronhive/util/log.hpp"

#include <string>

namespace cronhive::storage {

class JobStoreService;

/// Forwards log records into the store's syslog table. Appends are posted
/// to the store's own pool, so the logger's writer thread never waits on
/// the database; failures are not forwarded again.
class SyslogSink final : public log::Sink {
public:
  SyslogSink(JobStoreService &store, std::string logger_name);

  auto write(const log::Record &record) -> void override;

private:
  JobStoreService &store_;
  std::string logger_name_;
};

} // namespace cronhive::storage
