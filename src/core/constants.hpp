#pragma once

// ── Device / transfer client ────────────────────────────────
constexpr const char* DEFAULT_DEVICE_ADDRESS  = "192.168.1.185";
constexpr const char* DEFAULT_SEQUENCE        = "watcher";
constexpr const char* DEFAULT_TRANSFER_CLIENT = "/usr/local/bin/pytivo_transfer.py";
constexpr const char* FALLBACK_SHARE_NAME     = "Watcher";

// ── Watch directory ─────────────────────────────────────────
constexpr const char* DEFAULT_WATCH_DIR       = "/mnt/cloud/pytivo-watcher";
constexpr const char* DEFAULT_EXTENSIONS[]    = {
    ".mkv", ".mp4", ".avi", ".m4v", ".mov", ".mpg", ".mpeg", ".ts",
};
constexpr int DEFAULT_MIN_FILE_AGE_SECS       = 60;
constexpr int DEFAULT_CHECK_INTERVAL_SECS     = 300;
constexpr int MAX_CHECK_INTERVAL_SECS         = 7 * 24 * 3600;

// ── Mail relay ──────────────────────────────────────────────
constexpr const char* DEFAULT_SMTP_SERVER     = "localhost";
constexpr int DEFAULT_SMTP_PORT               = 25;
constexpr const char* DEFAULT_FROM_EMAIL      = "no-reply@localhost";
constexpr long SMTP_TIMEOUT_SECS              = 30;

// ── Paths ───────────────────────────────────────────────────
constexpr const char* DEFAULT_CONFIG_FILE     = "/usr/local/etc/tivowatch.yaml";
constexpr const char* DEFAULT_LOCK_FILE       = "/tmp/pytivo-watcher.lock";
// An empty lock file younger than this is an owner still writing its pid.
constexpr int LOCK_PUBLISH_GRACE_SECS        = 2;
constexpr const char* DEFAULT_LOG_FILE        = "/var/log/tivowatch.log";
constexpr const char* DEFAULT_SHARE_CONFIG    = "/usr/local/etc/pyTivo.conf";

// ── Subordinate process supervision ─────────────────────────
constexpr int OUTPUT_POLL_MS                  = 200;   // pipe poll timeout while monitoring
constexpr int TERMINATE_GRACE_MS              = 2000;  // SIGTERM → SIGKILL window
constexpr int OUTPUT_READ_BUF_SIZE            = 4096;
constexpr int ERROR_TAIL_LINES                = 5;     // trailing lines kept as error detail
constexpr int EXEC_FAILED_STATUS              = 127;

// ── Exit statuses ───────────────────────────────────────────
constexpr int EXIT_ORCHESTRATION_ERROR        = 70;    // EX_SOFTWARE
constexpr int EXIT_CONFIG_ERROR               = 78;    // EX_CONFIG
constexpr int DAEMON_SLEEP_SLICE_MS           = 250;

constexpr const char* TIVOWATCH_VERSION       = "1.0.0";
