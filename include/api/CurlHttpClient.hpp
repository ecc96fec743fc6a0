#pragma once

#include <string>

#include "api/IHttpClient.hpp"

namespace porkbun::api {

/// libcurl easy-interface implementation of IHttpClient.
/// Sends JSON bodies; a timeout of 0 leaves the request unbounded.
/// Class abbreviation: chc
class CurlHttpClient : public IHttpClient {
 public:
  explicit CurlHttpClient(int iTimeoutSeconds = 0);
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient&) = delete;
  CurlHttpClient& operator=(const CurlHttpClient&) = delete;

  HttpResponse post(const std::string& sUrl, const std::string& sBody) override;

 private:
  int _iTimeoutSeconds;
};

}  // namespace porkbun::api
