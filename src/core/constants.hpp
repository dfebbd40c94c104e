#pragma once

constexpr const char* SSHCP_VERSION = "0.1.0";

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CMD_TIMEOUT_SECS       = 300;   // Max time for a single remote command
constexpr int SSH_CHANNEL_OPEN_SECS      = 30;    // Max time to open/exec a channel
constexpr int URL_FETCH_TIMEOUT_SECS     = 600;   // curl --max-time for remote URLs

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr int SEND_CHUNK_SIZE            = 32768;

// ── Cache layout ────────────────────────────────────────────
constexpr const char* DEFAULT_SALTENV          = "base";
constexpr const char* DEFAULT_NAMESPACE        = "salt-ssh";
constexpr const char* DEFAULT_REMOTE_CACHEDIR  = "/var/tmp/sshcp/cache";
constexpr const char* FILES_SUBDIR             = "files";
constexpr const char* EXTRN_SUBDIR             = "extrn_files";
constexpr const char* LOCALFILES_SUBDIR        = "localfiles";
constexpr const char* ABSOLUTE_ROOT_SUBDIR     = "absolute_root";

// ── Templates ───────────────────────────────────────────────
constexpr const char* DEFAULT_RENDERER   = "vars";
