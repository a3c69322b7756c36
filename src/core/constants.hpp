#pragma once

// ── SSH options ─────────────────────────────────────────────
constexpr const char* SSH_HOST_KEY_POLICY   = "StrictHostKeyChecking=accept-new";
constexpr const char* SSH_KEEPALIVE_INTERVAL = "ServerAliveInterval=60";
constexpr const char* SSH_KEEPALIVE_COUNT   = "ServerAliveCountMax=60";
constexpr const char* SSH_BATCH_MODE        = "BatchMode=yes";
constexpr const char* SSH_SINGLE_PROMPT     = "NumberOfPasswordPrompts=1";
constexpr const char* SSH_NO_AGENT_FORWARD  = "ForwardAgent=no";

// ── Timeouts ────────────────────────────────────────────────
constexpr int COMMAND_TIMEOUT_SECS      = 15;    // Interactive probes and listings
constexpr int TRANSFER_TIMEOUT_SECS     = 60;    // File content read/write
constexpr int TOOL_PROBE_TIMEOUT_SECS   = 5;     // `rsync --version` and friends
constexpr int KEYGEN_TIMEOUT_SECS       = 30;
constexpr int TERMINATE_GRACE_MS        = 2000;  // SIGTERM -> SIGKILL

// ── Caching ─────────────────────────────────────────────────
constexpr int DIR_CACHE_TTL_MS          = 30000;

// ── Buffers / limits ────────────────────────────────────────
constexpr int PROCESS_READ_BUF_SIZE     = 4096;
constexpr int OPERATION_LOG_MAX_LINES   = 2000;
constexpr int LOG_OUTPUT_PREVIEW        = 500;   // bytes of stdout/stderr kept in debug log
constexpr int DEFAULT_TREE_DEPTH        = 3;

// ── External tools ──────────────────────────────────────────
constexpr const char* SSH_EXE           = "ssh";
constexpr const char* RSYNC_EXE         = "rsync";
constexpr const char* SCP_EXE           = "scp";
constexpr const char* KEYGEN_EXE        = "ssh-keygen";
constexpr const char* COMPAT_LAYER_EXE  = "wsl";
constexpr const char* BUNDLED_RSYNC_PATH = "C:\\Program Files\\Git\\usr\\bin\\rsync.exe";

// ── Remote markers ──────────────────────────────────────────
constexpr const char* AUTH_PROBE_CMD    = "echo ok";
constexpr const char* KEY_INSTALLED_MARKER = "KEY_INSTALLED";
