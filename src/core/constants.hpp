#pragma once

// ── Files ───────────────────────────────────────────────────
constexpr const char* CREDENTIAL_EXT         = ".json";
constexpr const char* SETTINGS_FILE          = "config.yaml";
constexpr const char* DEFAULT_VAULT_DIR      = ".config/claspalt";   // under $HOME
constexpr const char* DEFAULT_ACTIVE_SLOT    = ".clasprc.json";      // under $HOME
constexpr const char* SETTINGS_DIR_ENV       = "CLASPALT_HOME";

// ── Project config keys ─────────────────────────────────────
constexpr const char* KEY_ACCOUNT            = "account";
constexpr const char* KEY_DEPLOYMENT_ID      = "deploymentId";

// ── Permissions ─────────────────────────────────────────────
constexpr unsigned VAULT_DIR_MODE            = 0700;
constexpr unsigned CREDENTIAL_FILE_MODE      = 0600;
constexpr unsigned CONFIG_FILE_MODE          = 0644;   // new files only

// ── Terminal ────────────────────────────────────────────────
constexpr int ESCAPE_SEQ_TIMEOUT_MS          = 100;   // wait for "[A" after a lone ESC

constexpr const char* CLASPALT_VERSION_STR =
#ifdef CLASPALT_VERSION
    CLASPALT_VERSION;
#else
    "1.0.0";
#endif
