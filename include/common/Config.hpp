#pragma once

#include <array>
#include <string>

#include "common/Types.hpp"

namespace porkbun::common {

/// Production API base URL used when no endpoint is configured.
inline constexpr const char* kDefaultEndpoint = "https://api-ipv4.porkbun.com/api/json/v3";

/// One entry of the configuration file schema.
struct ConfigField {
  const char* pKey;
  bool bRequired;
};

/// Configuration loader: JSON file, then PORKBUN_* environment variables.
/// Command-line overrides are applied by the caller before validate().
/// Class abbreviation: cfg
struct Config {
  // ── Credentials ───────────────────────────────────────────────────────
  std::string sApiKey;
  std::string sSecretApiKey;  // zeroed once handed to ApiClient
  std::string sEndpoint = kDefaultEndpoint;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  // ── HTTP ──────────────────────────────────────────────────────────────
  int iHttpTimeoutSeconds = 0;  // 0 = no timeout

  // ── ACME ──────────────────────────────────────────────────────────────
  int iAcmePropagationSeconds = 120;

  /// Keys accepted in the configuration file.
  static constexpr std::array<ConfigField, 6> kSchema = {{
      {"api_key", true},
      {"secret_api_key", true},
      {"endpoint", false},
      {"log_level", false},
      {"http_timeout_seconds", false},
      {"acme_propagation_seconds", false},
  }};

  /// Accepted values of log_level.
  static constexpr std::array<const char*, 7> kLogLevels = {
      "trace", "debug", "info", "warn", "error", "critical", "off"};

  /// Parse a JSON configuration file.
  /// Throws ConfigError listing every missing required key.
  static Config loadFile(const std::string& sPath);

  /// Load sPath (if it exists, or unconditionally when bRequireFile) and
  /// apply environment overrides. Does not validate.
  static Config load(const std::string& sPath, bool bRequireFile);

  /// Apply PORKBUN_* environment variables on top of the current values.
  void applyEnv();

  /// Throws ConfigError if endpoint, API key or secret API key is empty,
  /// the log level is unknown, or a numeric setting is negative.
  void validate() const;

  Credentials credentials() const;

 private:
  /// Read an env var with _FILE fallback for secrets.
  /// Returns empty string when neither is set.
  static std::string loadSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);
};

}  // namespace porkbun::common
