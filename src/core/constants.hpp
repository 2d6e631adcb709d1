#pragma once

// ── Prompt detection ────────────────────────────────────────
// Characters a CLI prompt line usually ends with.
constexpr const char* PROMPT_ENDINGS = "#>$:])";

// Returned when no literal prompt could be found. It is a character class,
// not a literal, so completion falls back to quiescence.
constexpr const char* FALLBACK_PROMPT_PATTERN = "[#>$]";

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;

// ── Transport ───────────────────────────────────────────────
constexpr int DEFAULT_SSH_PORT           = 22;
constexpr int SSH_EAGAIN_SLEEP_MS        = 100;   // handshake/auth/open retry pause
constexpr int SSH_WRITE_MAX_EAGAIN       = 100;   // write stalls longer than this fail
constexpr int SSH_KEEPALIVE_SECS         = 30;
constexpr int PTY_COLS                   = 200;
constexpr int PTY_ROWS                   = 1000;

// ── Logging ─────────────────────────────────────────────────
constexpr int LOG_OUTPUT_PREVIEW_CHARS   = 500;

// ── Local paths ─────────────────────────────────────────────
constexpr const char* DEVPROBE_DIR_NAME  = ".devprobe";
constexpr const char* CONFIG_FILE_NAME   = "config.yaml";
constexpr const char* PROFILES_FILE_NAME = "profiles.yaml";
constexpr const char* DEFAULT_LOG_NAME   = "devprobe_debug.log";
constexpr const char* PASSWORD_ENV_VAR   = "DEVPROBE_PASSWORD";

// ── Version ─────────────────────────────────────────────────
constexpr const char* DEVPROBE_VERSION   = "0.1.0";
