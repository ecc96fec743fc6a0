#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace porkbun::common {

/// Base error for all application-level exceptions.
/// Carries the process exit code and machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iExitCode;
  std::string _sErrorCode;

  explicit AppError(int iExitCode, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iExitCode(iExitCode),
        _sErrorCode(std::move(sCode)) {}
};

/// Exit 2: missing or invalid configuration / command-line input.
struct ConfigError : AppError {
  explicit ConfigError(std::string sCode, std::string sMsg)
      : AppError(2, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 2: a caller passed an argument the library cannot use.
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(2, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 3: the HTTP layer could not complete the request (DNS, timeout, reset).
struct TransportError : AppError {
  explicit TransportError(std::string sCode, std::string sMsg)
      : AppError(3, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 4: registrar answered with an HTTP status other than 200.
struct ApiHttpError : AppError {
  long _iStatusCode;
  std::string _sBody;

  explicit ApiHttpError(long iStatusCode, std::string sBody)
      : AppError(4, "http_status",
                 "Fail (code " + std::to_string(iStatusCode) + ").\nText: \n" + sBody),
        _iStatusCode(iStatusCode),
        _sBody(std::move(sBody)) {}
};

/// Exit 5: response body is not a JSON object, or an IP literal failed to parse.
struct ApiDecodeError : AppError {
  explicit ApiDecodeError(std::string sCode, std::string sMsg)
      : AppError(5, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 6: well-formed response whose status is not "SUCCESS".
struct RegistrarError : AppError {
  std::string _sPath;
  std::string _sDomain;

  explicit RegistrarError(std::string sPath, std::string sDomain, std::string sMsg)
      : AppError(6, "registrar_error", std::move(sMsg)),
        _sPath(std::move(sPath)),
        _sDomain(std::move(sDomain)) {}
};

}  // namespace porkbun::common
