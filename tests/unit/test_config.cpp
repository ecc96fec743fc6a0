#include "common/Config.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

using namespace porkbun::common;

namespace {

void clearAllPorkbunEnv() {
  const char* vVars[] = {
      "PORKBUN_API_KEY", "PORKBUN_API_KEY_FILE", "PORKBUN_SECRET_API_KEY",
      "PORKBUN_SECRET_API_KEY_FILE", "PORKBUN_ENDPOINT", "PORKBUN_LOG_LEVEL",
      "PORKBUN_HTTP_TIMEOUT_SECONDS", "PORKBUN_ACME_PROPAGATION_SECONDS",
      nullptr};
  for (int i = 0; vVars[i] != nullptr; ++i) {
    unsetenv(vVars[i]);
  }
}

std::string writeTempFile(const std::string& sName, const std::string& sContents) {
  const std::string sPath = "/tmp/" + sName;
  std::ofstream ofs(sPath);
  ofs << sContents;
  return sPath;
}

}  // namespace

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { clearAllPorkbunEnv(); }
  void TearDown() override {
    clearAllPorkbunEnv();
    for (const auto& sPath : _vFiles) std::remove(sPath.c_str());
  }

  std::string file(const std::string& sName, const std::string& sContents) {
    _vFiles.push_back(writeTempFile(sName, sContents));
    return _vFiles.back();
  }

  std::vector<std::string> _vFiles;
};

TEST_F(ConfigTest, LoadFileWithRequiredFields) {
  const auto sPath = file("porkbun_cfg_ok.json",
                          R"({"api_key": "pk1_abc", "secret_api_key": "sk1_def"})");
  auto cfg = Config::loadFile(sPath);
  EXPECT_EQ(cfg.sApiKey, "pk1_abc");
  EXPECT_EQ(cfg.sSecretApiKey, "sk1_def");
  EXPECT_EQ(cfg.sEndpoint, kDefaultEndpoint);
  EXPECT_EQ(cfg.sLogLevel, "info");
  EXPECT_EQ(cfg.iHttpTimeoutSeconds, 0);
  EXPECT_EQ(cfg.iAcmePropagationSeconds, 120);
}

TEST_F(ConfigTest, OptionalFieldsOverrideDefaults) {
  const auto sPath = file("porkbun_cfg_opt.json", R"({
    "api_key": "pk1_abc", "secret_api_key": "sk1_def",
    "endpoint": "https://api.porkbun.com/api/json/v3",
    "log_level": "debug", "http_timeout_seconds": 15, "acme_propagation_seconds": "30"
  })");
  auto cfg = Config::loadFile(sPath);
  EXPECT_EQ(cfg.sEndpoint, "https://api.porkbun.com/api/json/v3");
  EXPECT_EQ(cfg.sLogLevel, "debug");
  EXPECT_EQ(cfg.iHttpTimeoutSeconds, 15);
  EXPECT_EQ(cfg.iAcmePropagationSeconds, 30);
}

TEST_F(ConfigTest, MissingRequiredFieldsAreAllListed) {
  const auto sPath = file("porkbun_cfg_missing.json", R"({"endpoint": "https://x"})");
  try {
    Config::loadFile(sPath);
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& err) {
    const std::string sWhat = err.what();
    EXPECT_EQ(err._sErrorCode, "config_missing_fields");
    EXPECT_NE(sWhat.find("missing: api_key, secret_api_key"), std::string::npos);
  }
}

TEST_F(ConfigTest, ThrowsOnUnreadableFile) {
  EXPECT_THROW(Config::loadFile("/tmp/porkbun_does_not_exist.json"), ConfigError);
}

TEST_F(ConfigTest, ThrowsOnInvalidJson) {
  const auto sPath = file("porkbun_cfg_bad.json", "api_key = \"toml\"");
  EXPECT_THROW(Config::loadFile(sPath), ConfigError);
}

TEST_F(ConfigTest, ThrowsOnNonObject) {
  const auto sPath = file("porkbun_cfg_array.json", "[1, 2]");
  EXPECT_THROW(Config::loadFile(sPath), ConfigError);
}

TEST_F(ConfigTest, ThrowsOnMistypedField) {
  const auto sPath = file("porkbun_cfg_type.json",
                          R"({"api_key": 42, "secret_api_key": "sk1_def"})");
  EXPECT_THROW(Config::loadFile(sPath), ConfigError);
}

TEST_F(ConfigTest, MissingOptionalFileFallsBackToEnv) {
  setenv("PORKBUN_API_KEY", "pk1_env", 1);
  setenv("PORKBUN_SECRET_API_KEY", "sk1_env", 1);

  auto cfg = Config::load("/tmp/porkbun_absent.json", false);
  EXPECT_EQ(cfg.sApiKey, "pk1_env");
  EXPECT_EQ(cfg.sSecretApiKey, "sk1_env");
  EXPECT_NO_THROW(cfg.validate());
}

TEST_F(ConfigTest, RequiredFileMustExist) {
  EXPECT_THROW(Config::load("/tmp/porkbun_absent.json", true), ConfigError);
}

TEST_F(ConfigTest, EnvOverridesFile) {
  const auto sPath = file("porkbun_cfg_env.json",
                          R"({"api_key": "pk1_file", "secret_api_key": "sk1_file"})");
  setenv("PORKBUN_API_KEY", "pk1_env", 1);
  setenv("PORKBUN_ENDPOINT", "https://api-ipv6.porkbun.com/api/json/v3", 1);
  setenv("PORKBUN_HTTP_TIMEOUT_SECONDS", "20", 1);

  auto cfg = Config::load(sPath, true);
  EXPECT_EQ(cfg.sApiKey, "pk1_env");
  EXPECT_EQ(cfg.sSecretApiKey, "sk1_file");
  EXPECT_EQ(cfg.sEndpoint, "https://api-ipv6.porkbun.com/api/json/v3");
  EXPECT_EQ(cfg.iHttpTimeoutSeconds, 20);
}

TEST_F(ConfigTest, FallsBackToFileForSecret) {
  const auto sSecretPath = file("porkbun_secret", "sk1_from_file\n");
  setenv("PORKBUN_API_KEY", "pk1_env", 1);
  setenv("PORKBUN_SECRET_API_KEY_FILE", sSecretPath.c_str(), 1);

  auto cfg = Config::load("/tmp/porkbun_absent.json", false);
  EXPECT_EQ(cfg.sSecretApiKey, "sk1_from_file");
}

TEST_F(ConfigTest, EmptySecretFileThrows) {
  const auto sSecretPath = file("porkbun_secret_empty", "\n");
  setenv("PORKBUN_SECRET_API_KEY_FILE", sSecretPath.c_str(), 1);

  EXPECT_THROW(Config::load("/tmp/porkbun_absent.json", false), ConfigError);
}

TEST_F(ConfigTest, InvalidIntegerEnvThrows) {
  setenv("PORKBUN_ACME_PROPAGATION_SECONDS", "soon", 1);
  EXPECT_THROW(Config::load("/tmp/porkbun_absent.json", false), ConfigError);
}

TEST_F(ConfigTest, ValidateNamesEveryMissingCredential) {
  Config cfg;
  cfg.sEndpoint.clear();
  try {
    cfg.validate();
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& err) {
    const std::string sWhat = err.what();
    EXPECT_NE(sWhat.find("API endpoint"), std::string::npos);
    EXPECT_NE(sWhat.find("API key"), std::string::npos);
    EXPECT_NE(sWhat.find("secret API key"), std::string::npos);
  }
}

TEST_F(ConfigTest, ValidateRejectsNegativeTimeout) {
  Config cfg;
  cfg.sApiKey = "pk1";
  cfg.sSecretApiKey = "sk1";
  cfg.iHttpTimeoutSeconds = -1;
  EXPECT_THROW(cfg.validate(), ConfigError);
}

TEST_F(ConfigTest, OutOfRangeIntegerInFileThrows) {
  const auto sPath = file("porkbun_cfg_wide.json", R"({
    "api_key": "pk1_abc", "secret_api_key": "sk1_def", "http_timeout_seconds": 4294967297
  })");
  EXPECT_THROW(Config::loadFile(sPath), ConfigError);

  const auto sNegative = file("porkbun_cfg_wide_neg.json", R"({
    "api_key": "pk1_abc", "secret_api_key": "sk1_def", "acme_propagation_seconds": -4294967297
  })");
  EXPECT_THROW(Config::loadFile(sNegative), ConfigError);
}

TEST_F(ConfigTest, ValidateRejectsUnknownLogLevel) {
  Config cfg;
  cfg.sApiKey = "pk1";
  cfg.sSecretApiKey = "sk1";
  cfg.sLogLevel = "verbose";
  try {
    cfg.validate();
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& err) {
    EXPECT_EQ(err._sErrorCode, "invalid_config");
    EXPECT_NE(std::string(err.what()).find("verbose"), std::string::npos);
  }
}

TEST_F(ConfigTest, ValidateAcceptsEveryLogLevel) {
  Config cfg;
  cfg.sApiKey = "pk1";
  cfg.sSecretApiKey = "sk1";
  for (const char* pLevel : Config::kLogLevels) {
    cfg.sLogLevel = pLevel;
    EXPECT_NO_THROW(cfg.validate()) << pLevel;
  }
}

TEST_F(ConfigTest, LoggerRejectsUnknownLevelAndKeepsCurrentOne) {
  Logger::init("warn");
  EXPECT_THROW(Logger::init("verbose"), ConfigError);
  EXPECT_EQ(Logger::get()->level(), spdlog::level::warn);
}

TEST_F(ConfigTest, CredentialsCopyAuthFields) {
  Config cfg;
  cfg.sApiKey = "pk1";
  cfg.sSecretApiKey = "sk1";
  const auto cr = cfg.credentials();
  EXPECT_EQ(cr.sApiKey, "pk1");
  EXPECT_EQ(cr.sSecretApiKey, "sk1");
  EXPECT_EQ(cr.sEndpoint, kDefaultEndpoint);
}
