#pragma once

// ── Version ─────────────────────────────────────────────────
constexpr const char* PORTSCOPE_VERSION = "0.2.0";

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 30;    // TCP connect + handshake
constexpr int SSH_CMD_TIMEOUT_SECS       = 120;   // Max time for a single remote command
constexpr int SSH_CHANNEL_OPEN_SECS      = 30;    // Max wait to open an exec channel
constexpr int SSH_POLL_INTERVAL_MS       = 10;    // Sleep between EAGAIN retries

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;

// ── Ports ───────────────────────────────────────────────────
constexpr int MIN_PORT                   = 1;
constexpr int MAX_PORT                   = 65535;
constexpr int DEFAULT_SSH_PORT           = 22;

// ── Discovery ───────────────────────────────────────────────
// Key used when only bare listener ports are known (no container names).
constexpr const char* UNKNOWN_SERVICES_KEY = "unknown-services";
constexpr const char* DEFAULT_HOST         = "localhost";

// ── Service table layout ────────────────────────────────────
constexpr int TABLE_MIN_SERVICE_WIDTH    = 15;
constexpr int TABLE_MAX_SERVICE_WIDTH    = 35;
constexpr int TABLE_MIN_URL_WIDTH        = 25;
constexpr int TABLE_GLYPH_COLUMNS        = 3;     // status glyph (2 cols) + space
constexpr int TABLE_MIN_PREFIX_STRIP     = 3;
