#pragma once

// ── Connection defaults ─────────────────────────────────────
constexpr int DEFAULT_SSH_PORT                = 22;
constexpr int DEFAULT_INACTIVITY_TIMEOUT_SECS = 5;     // No traffic for this long drops the session

// Key exchange is restricted to these unless the config says otherwise.
constexpr const char* DEFAULT_KEX_ALGORITHMS =
    "curve25519-sha256,curve25519-sha256@libssh.org";

// Always advertised after the configured KEX list. ext-info-c makes the server
// send server-sig-algs (rsa-sha2-* signatures); the strict-kex marker enables
// the sequence-number reset.
constexpr const char* KEX_CLIENT_EXTENSIONS = "ext-info-c,kex-strict-c-v00@openssh.com";

constexpr const char* DEFAULT_DISCONNECT_MESSAGE = "rexec: session closed by client";
constexpr const char* DISCONNECT_LANGUAGE        = "English";

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE  = 16384;

// ── Credential limits ───────────────────────────────────────
constexpr long MAX_KEY_FILE_BYTES = 64 * 1024;

// ── Process exit codes ──────────────────────────────────────
constexpr int EXIT_LOCAL_FAILURE = 255;   // Same code OpenSSH uses for its own errors

// ── Environment ─────────────────────────────────────────────
constexpr const char* ENV_KEY_PASSPHRASE = "REXEC_KEY_PASSPHRASE";

constexpr const char* REXEC_VERSION = "0.1.0";
