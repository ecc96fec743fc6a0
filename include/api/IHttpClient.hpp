#pragma once

#include <string>

namespace porkbun::api {

/// Raw HTTP response: status code and undecoded body.
/// Class abbreviation: hr
struct HttpResponse {
  long iStatus = 0;
  std::string sBody;
};

/// Pure abstract interface for the HTTP layer under ApiClient.
/// Implementations throw common::TransportError when no response was obtained.
class IHttpClient {
 public:
  virtual ~IHttpClient() = default;

  virtual HttpResponse post(const std::string& sUrl, const std::string& sBody) = 0;
};

}  // namespace porkbun::api
