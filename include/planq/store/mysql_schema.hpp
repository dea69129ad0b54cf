#pragma once

#include <string_view>

namespace planq::schema {

// MySQL 8 schema, version 1.
// All timestamps stored as Unix milliseconds (BIGINT); enums as snake_case
// text so rows stay readable from the mysql client.

inline constexpr std::string_view V1_SCHEMA = R"SQL(

CREATE TABLE IF NOT EXISTS schema_version (
    version INT NOT NULL PRIMARY KEY,
    applied_at DATETIME DEFAULT CURRENT_TIMESTAMP
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS plans (
    plan_id VARCHAR(255) NOT NULL PRIMARY KEY,
    summary TEXT NOT NULL,
    project_path VARCHAR(1024) NOT NULL,
    status VARCHAR(32) NOT NULL DEFAULT 'draft',
    created_at BIGINT NOT NULL,
    updated_at BIGINT NOT NULL
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS tasks (
    plan_id VARCHAR(255) NOT NULL,
    task_id VARCHAR(255) NOT NULL,
    ordinal INT NOT NULL,
    title VARCHAR(512) NOT NULL DEFAULT '',
    description TEXT NOT NULL,
    acceptance_criteria JSON NOT NULL DEFAULT ('[]'),
    technical_notes JSON NOT NULL DEFAULT ('[]'),
    status VARCHAR(32) NOT NULL DEFAULT 'pending',
    completed_at BIGINT NULL,
    PRIMARY KEY (plan_id, task_id),
    INDEX idx_tasks_plan_ordinal (plan_id, ordinal),
    CONSTRAINT fk_task_plan FOREIGN KEY (plan_id) REFERENCES plans(plan_id) ON DELETE CASCADE
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS task_dependencies (
    plan_id VARCHAR(255) NOT NULL,
    task_id VARCHAR(255) NOT NULL,
    depends_on_task_id VARCHAR(255) NOT NULL,
    PRIMARY KEY (plan_id, task_id, depends_on_task_id),
    CONSTRAINT fk_dep_task FOREIGN KEY (plan_id, task_id) REFERENCES tasks(plan_id, task_id) ON DELETE CASCADE
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS runs (
    run_id VARCHAR(64) NOT NULL PRIMARY KEY,
    plan_id VARCHAR(255) NOT NULL,
    task_id VARCHAR(255) NOT NULL,
    status VARCHAR(32) NOT NULL,
    session_id VARCHAR(255) NULL,
    retry_count INT NOT NULL DEFAULT 0,
    started_at BIGINT NOT NULL,
    ended_at BIGINT NULL,
    duration_ms BIGINT NULL,
    total_cost_usd DOUBLE NULL,
    result_text MEDIUMTEXT NULL,
    stop_reason VARCHAR(255) NULL,
    error_text MEDIUMTEXT NULL,
    INDEX idx_runs_plan (plan_id, started_at),
    INDEX idx_runs_task (plan_id, task_id, status, started_at),
    INDEX idx_runs_status (status, started_at),
    CONSTRAINT fk_run_plan FOREIGN KEY (plan_id) REFERENCES plans(plan_id) ON DELETE CASCADE
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS run_events (
    event_id VARCHAR(64) NOT NULL PRIMARY KEY,
    run_id VARCHAR(64) NOT NULL,
    ts BIGINT NOT NULL,
    level VARCHAR(16) NOT NULL DEFAULT 'info',
    event_type VARCHAR(32) NOT NULL,
    payload_json JSON NOT NULL,
    INDEX idx_run_events_run_ts_id (run_id, ts, event_id),
    CONSTRAINT fk_event_run FOREIGN KEY (run_id) REFERENCES runs(run_id) ON DELETE CASCADE
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS todo_snapshots (
    snapshot_rowid BIGINT UNSIGNED AUTO_INCREMENT PRIMARY KEY,
    run_id VARCHAR(64) NOT NULL,
    ts BIGINT NOT NULL,
    total INT NOT NULL DEFAULT 0,
    pending INT NOT NULL DEFAULT 0,
    in_progress INT NOT NULL DEFAULT 0,
    completed INT NOT NULL DEFAULT 0,
    todos_json JSON NOT NULL,
    INDEX idx_todo_run_ts (run_id, ts),
    CONSTRAINT fk_todo_run FOREIGN KEY (run_id) REFERENCES runs(run_id) ON DELETE CASCADE
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

CREATE TABLE IF NOT EXISTS app_settings (
    `key` VARCHAR(128) NOT NULL PRIMARY KEY,
    value TEXT NOT NULL,
    updated_at BIGINT NOT NULL
) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_0900_ai_ci;

)SQL";

inline constexpr int CURRENT_SCHEMA_VERSION = 1;

} // namespace planq::schema
