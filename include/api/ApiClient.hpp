#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "api/IHttpClient.hpp"
#include "common/Types.hpp"

namespace porkbun::api {

/// Authenticated transport for the registrar's JSON API.
/// Holds the credentials and injects them into every request body.
/// Class abbreviation: ac
class ApiClient {
 public:
  ApiClient(common::Credentials crCredentials, IHttpClient& hcClient);
  ~ApiClient();

  ApiClient(const ApiClient&) = delete;
  ApiClient& operator=(const ApiClient&) = delete;

  const std::string& endpoint() const;

  /// Merge the authentication fields into jPayload.
  /// endpoint/apikey/secretapikey always come from the held credentials.
  nlohmann::json authenticate(const nlohmann::json& jPayload) const;

  /// POST the authenticated payload to endpoint + sPath.
  /// Throws TransportError, ApiHttpError (status != 200) or ApiDecodeError
  /// (body not a JSON object). The registrar "status" is left to the caller.
  nlohmann::json send(const std::string& sPath,
                      const nlohmann::json& jPayload = nlohmann::json::object()) const;

 private:
  common::Credentials _crCredentials;
  IHttpClient& _hcClient;
};

}  // namespace porkbun::api
