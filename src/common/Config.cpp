#include "common/Config.hpp"

#include "common/Errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace porkbun::common {

namespace {

std::string joinKeys(const std::vector<std::string>& vKeys) {
  std::string sOut;
  for (const auto& sKey : vKeys) {
    if (!sOut.empty()) sOut += ", ";
    sOut += sKey;
  }
  return sOut;
}

int readInt(const nlohmann::json& jConfig, const char* pKey, int iDefault,
            const std::string& sPath) {
  if (!jConfig.contains(pKey)) {
    return iDefault;
  }
  const std::string sError =
      std::string("Invalid integer value for '") + pKey + "' in '" + sPath + "'";
  const auto& jValue = jConfig.at(pKey);
  if (jValue.is_number_unsigned()) {
    if (jValue.get<std::uint64_t>() >
        static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
      throw ConfigError("invalid_config", sError + ": out of range");
    }
    return static_cast<int>(jValue.get<std::uint64_t>());
  }
  if (jValue.is_number_integer()) {
    const std::int64_t iValue = jValue.get<std::int64_t>();
    if (iValue < std::numeric_limits<int>::min() || iValue > std::numeric_limits<int>::max()) {
      throw ConfigError("invalid_config", sError + ": out of range");
    }
    return static_cast<int>(iValue);
  }
  if (!jValue.is_string()) {
    throw ConfigError("invalid_config", sError);
  }
  try {
    return std::stoi(jValue.get<std::string>());
  } catch (const std::exception&) {
    throw ConfigError("invalid_config", sError);
  }
}

std::string readString(const nlohmann::json& jConfig, const char* pKey,
                       const std::string& sDefault, const std::string& sPath) {
  if (!jConfig.contains(pKey)) {
    return sDefault;
  }
  const auto& jValue = jConfig.at(pKey);
  if (!jValue.is_string()) {
    throw ConfigError("invalid_config",
                      std::string("'") + pKey + "' in '" + sPath + "' must be a string");
  }
  return jValue.get<std::string>();
}

}  // namespace

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    return std::stoi(sValue);
  } catch (const std::exception&) {
    throw ConfigError("invalid_config",
                      std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
}

std::string Config::loadSecret(const char* pVarName) {
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    return {};
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw ConfigError("secret_file_unreadable",
                      std::string("Cannot open secret file specified by ") + sFileVar + ": " +
                          sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  // Trim trailing whitespace/newlines
  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw ConfigError("secret_file_empty",
                      std::string("Secret file is empty: ") + sFilePath + " (from " + sFileVar +
                          ")");
  }
  return sValue;
}

Config Config::loadFile(const std::string& sPath) {
  std::ifstream ifs(sPath);
  if (!ifs.is_open()) {
    throw ConfigError("config_unreadable", "Cannot open config file: " + sPath);
  }

  nlohmann::json jConfig;
  try {
    jConfig = nlohmann::json::parse(ifs);
  } catch (const nlohmann::json::exception& ex) {
    throw ConfigError("config_invalid_json",
                      "Config file '" + sPath + "' is not valid JSON: " + ex.what());
  }
  if (!jConfig.is_object()) {
    throw ConfigError("config_not_object", "Config file '" + sPath + "' must hold a JSON object");
  }

  std::vector<std::string> vRequired;
  std::vector<std::string> vMissing;
  for (const auto& cf : kSchema) {
    if (!cf.bRequired) continue;
    vRequired.emplace_back(cf.pKey);
    if (!jConfig.contains(cf.pKey)) {
      vMissing.emplace_back(cf.pKey);
    }
  }
  if (!vMissing.empty()) {
    throw ConfigError("config_missing_fields",
                      "all of the following are required in '" + sPath + "': [" +
                          joinKeys(vRequired) + "] (missing: " + joinKeys(vMissing) + ")");
  }

  Config cfg;
  cfg.sApiKey = readString(jConfig, "api_key", "", sPath);
  cfg.sSecretApiKey = readString(jConfig, "secret_api_key", "", sPath);
  cfg.sEndpoint = readString(jConfig, "endpoint", kDefaultEndpoint, sPath);
  cfg.sLogLevel = readString(jConfig, "log_level", cfg.sLogLevel, sPath);
  cfg.iHttpTimeoutSeconds =
      readInt(jConfig, "http_timeout_seconds", cfg.iHttpTimeoutSeconds, sPath);
  cfg.iAcmePropagationSeconds =
      readInt(jConfig, "acme_propagation_seconds", cfg.iAcmePropagationSeconds, sPath);
  return cfg;
}

Config Config::load(const std::string& sPath, bool bRequireFile) {
  Config cfg;
  if (bRequireFile || std::filesystem::exists(sPath)) {
    cfg = loadFile(sPath);
  }
  cfg.applyEnv();
  return cfg;
}

void Config::applyEnv() {
  const std::string sKey = loadSecret("PORKBUN_API_KEY");
  if (!sKey.empty()) {
    sApiKey = sKey;
  }
  const std::string sSecret = loadSecret("PORKBUN_SECRET_API_KEY");
  if (!sSecret.empty()) {
    sSecretApiKey = sSecret;
  }
  const std::string sEnvEndpoint = getEnv("PORKBUN_ENDPOINT");
  if (!sEnvEndpoint.empty()) {
    sEndpoint = sEnvEndpoint;
  }
  const std::string sEnvLevel = getEnv("PORKBUN_LOG_LEVEL");
  if (!sEnvLevel.empty()) {
    sLogLevel = sEnvLevel;
  }
  iHttpTimeoutSeconds = getEnvInt("PORKBUN_HTTP_TIMEOUT_SECONDS", iHttpTimeoutSeconds);
  iAcmePropagationSeconds =
      getEnvInt("PORKBUN_ACME_PROPAGATION_SECONDS", iAcmePropagationSeconds);
}

void Config::validate() const {
  std::vector<std::string> vMissing;
  if (sEndpoint.empty()) vMissing.emplace_back("API endpoint");
  if (sApiKey.empty()) vMissing.emplace_back("API key");
  if (sSecretApiKey.empty()) vMissing.emplace_back("secret API key");
  if (!vMissing.empty()) {
    throw ConfigError("credentials_missing", "must be specified: " + joinKeys(vMissing));
  }

  const bool bKnownLevel =
      std::any_of(kLogLevels.begin(), kLogLevels.end(),
                  [this](const char* pLevel) { return sLogLevel == pLevel; });
  if (!bKnownLevel) {
    throw ConfigError("invalid_config",
                      "log_level must be one of trace, debug, info, warn, error, critical, "
                      "off (got '" + sLogLevel + "')");
  }

  if (iHttpTimeoutSeconds < 0) {
    throw ConfigError("invalid_config", "http_timeout_seconds must be >= 0 (got " +
                                            std::to_string(iHttpTimeoutSeconds) + ")");
  }
  if (iAcmePropagationSeconds < 0) {
    throw ConfigError("invalid_config", "acme_propagation_seconds must be >= 0 (got " +
                                            std::to_string(iAcmePropagationSeconds) + ")");
  }
}

Credentials Config::credentials() const {
  return Credentials{sApiKey, sSecretApiKey, sEndpoint};
}

}  // namespace porkbun::common
