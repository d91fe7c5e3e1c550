#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace cronhive::schema {

inline constexpr int CURRENT_SCHEMA_VERSION = 1;

// MySQL 8 tables, one statement each. `{p}` is replaced by the configured
// table prefix. Timestamps are DATETIME(3) so that rows written by other
// tools with CURRENT_TIMESTAMP stay readable.
inline constexpr std::array<std::string_view, 4> kTables = {
    R"SQL(CREATE TABLE IF NOT EXISTS {p}schema_version (
    version INT NOT NULL PRIMARY KEY,
    applied_at DATETIME DEFAULT CURRENT_TIMESTAMP
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci)SQL",

    R"SQL(CREATE TABLE IF NOT EXISTS {p}jobs (
    id VARCHAR(191) NOT NULL PRIMARY KEY,
    command TEXT NOT NULL,
    second VARCHAR(64) NOT NULL DEFAULT '*',
    minute VARCHAR(64) NOT NULL DEFAULT '*',
    hour VARCHAR(64) NOT NULL DEFAULT '*',
    day VARCHAR(64) NOT NULL DEFAULT '*',
    month VARCHAR(64) NOT NULL DEFAULT '*',
    day_of_week VARCHAR(64) NOT NULL DEFAULT '*',
    timeout INT NOT NULL DEFAULT 60,
    `coalesce` TINYINT NULL,
    max_instances INT NULL,
    misfire_grace_time INT NULL,
    created_at DATETIME(3) NOT NULL DEFAULT CURRENT_TIMESTAMP(3),
    updated_at DATETIME(3) NOT NULL DEFAULT CURRENT_TIMESTAMP(3) ON UPDATE CURRENT_TIMESTAMP(3)
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci)SQL",

    R"SQL(CREATE TABLE IF NOT EXISTS {p}update_info (
    id BIGINT UNSIGNED NOT NULL AUTO_INCREMENT PRIMARY KEY,
    updated TINYINT(1) NOT NULL DEFAULT 0,
    insert_time DATETIME(3) NOT NULL DEFAULT CURRENT_TIMESTAMP(3),
    update_time DATETIME(3) NOT NULL DEFAULT CURRENT_TIMESTAMP(3) ON UPDATE CURRENT_TIMESTAMP(3),
    jobs_before_update JSON NULL,
    jobs_after_update JSON NULL,
    KEY idx_updated_insert_time (updated, insert_time)
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci)SQL",

    R"SQL(CREATE TABLE IF NOT EXISTS {p}syslog (
    id BIGINT UNSIGNED NOT NULL AUTO_INCREMENT PRIMARY KEY,
    created_at DATETIME(3) NOT NULL DEFAULT CURRENT_TIMESTAMP(3),
    level VARCHAR(16) NOT NULL,
    logger_name VARCHAR(64) NOT NULL,
    message TEXT NOT NULL,
    KEY idx_created_at (created_at),
    KEY idx_level (level)
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci)SQL"};

/// kTables with `{p}` substituted, in creation order.
[[nodiscard]] auto render(std::string_view prefix) -> std::vector<std::string>;

} // namespace cronhive::schema
