#pragma once

// ── Version ─────────────────────────────────────────────────
constexpr const char* DROPWATCH_VERSION = "0.2.0";

// ── File names ──────────────────────────────────────────────
constexpr const char* DEFAULT_CONFIG_FILE = "dropwatch.yaml";
constexpr const char* DAEMON_LOG_FILE     = "dropwatch.log";
constexpr const char* JOB_LOG_SUBDIR      = "jobs";

// ── Filtering ───────────────────────────────────────────────
// Windows writes "<name>:Zone.Identifier" next to files copied from another
// machine; on WSL and Samba shares these show up as ordinary files.
constexpr const char* ZONE_IDENTIFIER_PATTERN = "*:Zone.Identifier";

// ── Event source ────────────────────────────────────────────
constexpr int INOTIFY_POLL_MS      = 100;   // reader wakes this often to check for stop
constexpr int INOTIFY_BUF_EVENTS   = 64;    // events per read() buffer (plus NAME_MAX each)

// ── Job runner ──────────────────────────────────────────────
constexpr int EXEC_FAILED_EXIT     = 127;   // child exit status when execvp() fails
