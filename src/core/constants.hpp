#pragma once

// ── Remote command ──────────────────────────────────────────
constexpr const char* REMOTE_PROGRAM      = "cec-ctl";
constexpr const char* ECHO_OFF_PREFIX     = "stty -echo; ";
constexpr const char* CONFIG_FILE_NAME    = "cec-ssh_config.json";
constexpr const char* PATH_ENV_VAR        = "PATH";

// ── Pseudo-terminal ─────────────────────────────────────────
constexpr const char* PTY_TERM_TYPE       = "xterm";
constexpr int PTY_COLS                    = 80;
constexpr int PTY_ROWS                    = 24;

// ── Timings ─────────────────────────────────────────────────
constexpr int BANNER_SETTLE_MS            = 300;   // Wait for MOTD before draining
constexpr int DRAIN_POLL_MS               = 50;    // Gap between empty drain polls
constexpr int DRAIN_EMPTY_POLLS           = 2;     // Consecutive empty polls that end the drain
constexpr int LIVENESS_POLL_MS            = 200;   // Monitor interval
constexpr int SHUTDOWN_GRACE_MS           = 2000;  // Reader wind-down budget after cancel
constexpr int READ_POLL_MS                = 100;   // Max block per channel read
constexpr int SSH_KEEPALIVE_SECS          = 30;
constexpr int SSH_RETRY_SLEEP_MS          = 10;    // Between EAGAIN retries
constexpr int SIGNAL_POLL_MS              = 100;   // Forwarder wakeup interval

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE           = 4096;
constexpr int SSH_DRAIN_BUF_SIZE          = 2048;

// ── Control bytes ───────────────────────────────────────────
constexpr char CTRL_C                     = 0x03;

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_OK                     = 0;
constexpr int EXIT_USAGE                  = 1;
constexpr int EXIT_CONFIG_FLAG            = 2;     // --config without a path
constexpr int EXIT_CONFIG_MISSING         = 3;     // explicit path does not exist
constexpr int EXIT_CONFIG_NOT_FOUND       = 4;     // search found nothing
constexpr int EXIT_CONFIG_INVALID         = 5;
constexpr int EXIT_CONNECT_FAILED         = 6;
constexpr int EXIT_SHELL_FAILED           = 7;
constexpr int EXIT_DISPATCH_FAILED        = 8;
constexpr int EXIT_INTERNAL               = 9;
