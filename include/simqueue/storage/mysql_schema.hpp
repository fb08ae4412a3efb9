#pragma once

#include <string_view>

namespace simqueue::schema {

// MySQL 8.0.16+ (CHECK constraints, SKIP LOCKED). Timestamps are Unix
// milliseconds in BIGINT columns. JSON payloads are kept as LONGTEXT so the
// submitted bytes are returned unchanged; JSON_VALID guards their shape.

inline constexpr int CURRENT_SCHEMA_VERSION = 1;

inline constexpr std::string_view V1_SCHEMA = R"SQL(

CREATE TABLE IF NOT EXISTS schema_version (
    version INT NOT NULL PRIMARY KEY,
    applied_at DATETIME DEFAULT CURRENT_TIMESTAMP
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS simulation_jobs (
    id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY,
    user_id BIGINT NOT NULL,
    service_id VARCHAR(255) NOT NULL,
    llm_provider VARCHAR(100) NULL,
    prompt_version_id BIGINT NULL,
    current_config LONGTEXT NOT NULL,
    proposed_config LONGTEXT NOT NULL,
    context LONGTEXT NULL,
    options LONGTEXT NULL,
    status VARCHAR(16) NOT NULL DEFAULT 'pending',
    priority INT NOT NULL DEFAULT 50,
    result LONGTEXT NULL,
    error_message TEXT NULL,
    queued_at BIGINT NOT NULL,
    started_at BIGINT NULL,
    completed_at BIGINT NULL,
    created_at BIGINT NOT NULL,
    updated_at BIGINT NULL,
    CONSTRAINT chk_simulation_jobs_status CHECK (
        status IN ('pending', 'running', 'completed', 'failed', 'cancelled')),
    CONSTRAINT chk_simulation_jobs_priority CHECK (priority BETWEEN 0 AND 100),
    CONSTRAINT chk_simulation_jobs_current_config CHECK (JSON_VALID(current_config)),
    CONSTRAINT chk_simulation_jobs_proposed_config CHECK (JSON_VALID(proposed_config)),
    INDEX idx_simulation_jobs_user_id (user_id),
    INDEX idx_simulation_jobs_service_id (service_id),
    INDEX idx_simulation_jobs_claim (status, priority DESC, queued_at ASC, id ASC)
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

)SQL";

} // namespace simqueue::schema
