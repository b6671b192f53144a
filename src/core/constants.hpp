#pragma once

#include <cstddef>

// ── Identity ────────────────────────────────────────────────
constexpr const char* HANDOFF_VERSION        = "0.4.0";
constexpr const char* DEFAULT_APP_ID         = "handoff";
constexpr const char* REGISTRY_FILENAME      = "extern_app.json";
constexpr const char* ENDPOINT_PREFIX        = "handoff_sendto_";

// ── Timeouts ────────────────────────────────────────────────
constexpr int CONNECT_TIMEOUT_MS         = 3000;  // Client connect to a running instance
constexpr int WRITE_TIMEOUT_MS           = 2000;  // Client write of one message
constexpr int READ_TIMEOUT_MS            = 2000;  // Server read of one message
constexpr int PROBE_TIMEOUT_MS           = 300;   // Liveness probe of an occupied endpoint
constexpr int ACCEPT_POLL_MS             = 200;   // Accept loop wakeup for stop checks
constexpr int DISPATCH_WAIT_MS           = 250;   // Host main loop drain interval

// ── Limits ──────────────────────────────────────────────────
constexpr std::size_t MAX_MESSAGE_BYTES  = 1024 * 1024;  // One hand-off line
constexpr std::size_t READ_BUF_SIZE      = 4096;
constexpr std::size_t MAX_PIPE_NAME_LEN  = 200;          // Windows pipe names cap at 256
