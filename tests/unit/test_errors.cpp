#include "common/Errors.hpp"

#include <gtest/gtest.h>

using namespace porkbun::common;

TEST(ErrorsTest, AppErrorCarriesExitCodeAndCode) {
  AppError err(1, "internal_error", "Something went wrong");
  EXPECT_EQ(err._iExitCode, 1);
  EXPECT_EQ(err._sErrorCode, "internal_error");
  EXPECT_STREQ(err.what(), "Something went wrong");
}

TEST(ErrorsTest, ConfigErrorExits2) {
  ConfigError err("config_missing_fields", "api_key missing");
  EXPECT_EQ(err._iExitCode, 2);
  EXPECT_EQ(err._sErrorCode, "config_missing_fields");
}

TEST(ErrorsTest, ValidationErrorExits2) {
  ValidationError err("invalid_payload", "API payload must be a JSON object");
  EXPECT_EQ(err._iExitCode, 2);
  EXPECT_EQ(err._sErrorCode, "invalid_payload");
}

TEST(ErrorsTest, TransportErrorExits3) {
  TransportError err("request_failed", "Connection reset");
  EXPECT_EQ(err._iExitCode, 3);
  EXPECT_EQ(err._sErrorCode, "request_failed");
}

TEST(ErrorsTest, ApiHttpErrorCarriesStatusAndBody) {
  ApiHttpError err(503, "<html>busy</html>");
  EXPECT_EQ(err._iExitCode, 4);
  EXPECT_EQ(err._iStatusCode, 503);
  EXPECT_EQ(err._sBody, "<html>busy</html>");
  const std::string sWhat = err.what();
  EXPECT_NE(sWhat.find("503"), std::string::npos);
  EXPECT_NE(sWhat.find("<html>busy</html>"), std::string::npos);
}

TEST(ErrorsTest, ApiDecodeErrorExits5) {
  ApiDecodeError err("invalid_json", "not json");
  EXPECT_EQ(err._iExitCode, 5);
  EXPECT_EQ(err._sErrorCode, "invalid_json");
}

TEST(ErrorsTest, RegistrarErrorCarriesPathAndDomain) {
  RegistrarError err("/dns/retrieve/example.com", "example.com", "Failed to get records.");
  EXPECT_EQ(err._iExitCode, 6);
  EXPECT_EQ(err._sErrorCode, "registrar_error");
  EXPECT_EQ(err._sPath, "/dns/retrieve/example.com");
  EXPECT_EQ(err._sDomain, "example.com");
}

TEST(ErrorsTest, PolymorphicCatchAsAppError) {
  try {
    throw ConfigError("test", "test message");
  } catch (const AppError& err) {
    EXPECT_EQ(err._iExitCode, 2);
    EXPECT_EQ(err._sErrorCode, "test");
    EXPECT_STREQ(err.what(), "test message");
  }

  try {
    throw ApiHttpError(500, "oops");
  } catch (const AppError& err) {
    EXPECT_EQ(err._iExitCode, 4);
  }

  try {
    throw RegistrarError("/dns/create/x.com", "x.com", "fail");
  } catch (const AppError& err) {
    EXPECT_EQ(err._iExitCode, 6);
  }
}

TEST(ErrorsTest, CatchableAsStdRuntimeError) {
  try {
    throw TransportError("request_failed", "timed out");
  } catch (const std::runtime_error& err) {
    EXPECT_STREQ(err.what(), "timed out");
  }
}
