#include "api/ApiClient.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <openssl/crypto.h>

#include <utility>

namespace porkbun::api {

namespace {

constexpr const char* kEndpointKey = "endpoint";
constexpr const char* kApiKeyKey = "apikey";
constexpr const char* kSecretApiKeyKey = "secretapikey";

std::string redacted(nlohmann::json jPayload) {
  jPayload[kApiKeyKey] = "***";
  jPayload[kSecretApiKeyKey] = "***";
  return jPayload.dump();
}

}  // anonymous namespace

ApiClient::ApiClient(common::Credentials crCredentials, IHttpClient& hcClient)
    : _crCredentials(std::move(crCredentials)), _hcClient(hcClient) {}

ApiClient::~ApiClient() {
  if (!_crCredentials.sSecretApiKey.empty()) {
    OPENSSL_cleanse(_crCredentials.sSecretApiKey.data(), _crCredentials.sSecretApiKey.size());
  }
  if (!_crCredentials.sApiKey.empty()) {
    OPENSSL_cleanse(_crCredentials.sApiKey.data(), _crCredentials.sApiKey.size());
  }
}

const std::string& ApiClient::endpoint() const { return _crCredentials.sEndpoint; }

nlohmann::json ApiClient::authenticate(const nlohmann::json& jPayload) const {
  if (!jPayload.is_null() && !jPayload.is_object()) {
    throw common::ValidationError("invalid_payload", "API payload must be a JSON object");
  }

  // endpoint is a legacy field some API paths still expect in the body.
  nlohmann::json jAuthenticated = {
      {kEndpointKey, _crCredentials.sEndpoint},
      {kApiKeyKey, _crCredentials.sApiKey},
      {kSecretApiKeyKey, _crCredentials.sSecretApiKey}};

  if (jPayload.is_object()) {
    for (auto it = jPayload.begin(); it != jPayload.end(); ++it) {
      if (!jAuthenticated.contains(it.key())) {
        jAuthenticated[it.key()] = it.value();
      }
    }
  }
  return jAuthenticated;
}

nlohmann::json ApiClient::send(const std::string& sPath, const nlohmann::json& jPayload) const {
  const nlohmann::json jAuthenticated = authenticate(jPayload);
  const std::string sUrl = _crCredentials.sEndpoint + sPath;

  auto spLog = common::Logger::get();
  if (spLog->should_log(spdlog::level::debug)) {
    spLog->debug("POST {} {}", sUrl, redacted(jAuthenticated));
  }

  const HttpResponse hr = _hcClient.post(sUrl, jAuthenticated.dump());
  if (hr.iStatus != 200) {
    throw common::ApiHttpError(hr.iStatus, hr.sBody);
  }

  nlohmann::json jResponse;
  try {
    jResponse = nlohmann::json::parse(hr.sBody);
  } catch (const nlohmann::json::exception& ex) {
    throw common::ApiDecodeError("invalid_json",
                                 "Response from " + sPath + " is not valid JSON: " + ex.what());
  }
  if (!jResponse.is_object()) {
    throw common::ApiDecodeError("not_an_object",
                                 "Response json was not an object: " + jResponse.dump());
  }

  // Bodies may carry certificate material; only the status is logged.
  const auto it = jResponse.find("status");
  spLog->debug("Response from {}: status={}", sPath,
               (it != jResponse.end() && it->is_string()) ? it->get<std::string>() : "<none>");
  return jResponse;
}

}  // namespace porkbun::api
