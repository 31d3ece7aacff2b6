#pragma once

// ── File names ──────────────────────────────────────────────
constexpr const char* PROJECT_CONFIG_NAME        = "twin.yaml";
constexpr const char* PROJECT_CONFIG_HIDDEN_NAME = ".twin.yaml";
constexpr const char* GLOBAL_CONFIG_DIR_NAME     = "twin";
constexpr const char* GLOBAL_CONFIG_NAME         = "config.yaml";
constexpr const char* LOCK_FILE_NAME             = "twin.lock";   // inside the git common dir
constexpr const char* DEBUG_LOG_NAME             = "twin_debug.log";

// ── Timeouts ────────────────────────────────────────────────
constexpr int DEFAULT_HOOK_TIMEOUT_SECS  = 60;    // Per-hook limit when config says 0 or nothing
constexpr int DEFAULT_LOCK_TIMEOUT_SECS  = 30;    // Max wait for another invocation's lock
constexpr int LOCK_POLL_MS               = 100;   // Poll interval while waiting for the lock
constexpr int TERMINATE_GRACE_MS         = 2000;  // SIGTERM -> SIGKILL grace period
constexpr int PROCESS_POLL_MS            = 50;    // Pipe poll interval while a child runs

// ── Naming ──────────────────────────────────────────────────
constexpr const char* DEFAULT_BRANCH_PREFIX = "agent/";
constexpr int UNIQUE_BRANCH_MAX_ATTEMPTS    = 10;

// ── Output ──────────────────────────────────────────────────
constexpr size_t LOG_OUTPUT_TRUNCATE = 500;      // Chars of child output kept in log lines
constexpr size_t REPORT_MESSAGE_MAX  = 160;      // Chars of effect message kept in tables

constexpr const char* TWIN_VERSION = "0.4.0";
