#include "cronhive/storage/syslog_sink.hpp"

#include "cronhive/storage/store_service.hpp"

namespace cronhive::storage {

SyslogSink::SyslogSink(JobStoreService &store, std::string logger_name)
    : store_(store), logger_name_(std::move(logger_name)) {}

auto SyslogSink::write(const log::Record &record) -> void {
  if (!record.forward) {
    return;
  }
  store_.post_syslog(SyslogEntry{.created_at = record.time,
                                 .level = std::string(log::level_name(record.level)),
                                 .logger_name = logger_name_,
                                 .message = record.message});
}

} // namespace cronhive::storage
