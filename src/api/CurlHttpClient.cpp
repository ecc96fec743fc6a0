#include "api/CurlHttpClient.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <curl/curl.h>

#include <memory>
#include <string>

namespace porkbun::api {

namespace {

size_t writeToString(char* pData, size_t nSize, size_t nCount, void* pUser) {
  auto* pBuffer = static_cast<std::string*>(pUser);
  pBuffer->append(pData, nSize * nCount);
  return nSize * nCount;
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaders = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

// On failure curl_slist_append returns NULL and leaves the list untouched.
void appendHeader(CurlHeaders& upHeaders, const char* pHeader) {
  curl_slist* pAppended = curl_slist_append(upHeaders.get(), pHeader);
  if (pAppended == nullptr) {
    throw common::TransportError("curl_init_failed",
                                 std::string("curl_slist_append() failed for ") + pHeader);
  }
  upHeaders.release();
  upHeaders.reset(pAppended);
}

}  // anonymous namespace

CurlHttpClient::CurlHttpClient(int iTimeoutSeconds) : _iTimeoutSeconds(iTimeoutSeconds) {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    throw common::TransportError("curl_init_failed", "curl_global_init() failed");
  }
}

CurlHttpClient::~CurlHttpClient() {
  curl_global_cleanup();
}

HttpResponse CurlHttpClient::post(const std::string& sUrl, const std::string& sBody) {
  CurlHandle upCurl(curl_easy_init(), &curl_easy_cleanup);
  if (!upCurl) {
    throw common::TransportError("curl_init_failed", "curl_easy_init() failed");
  }

  CurlHeaders upHeaders(nullptr, &curl_slist_free_all);
  appendHeader(upHeaders, "Content-Type: application/json");
  appendHeader(upHeaders, "Accept: application/json");

  HttpResponse hr;
  CURL* pCurl = upCurl.get();
  curl_easy_setopt(pCurl, CURLOPT_URL, sUrl.c_str());
  curl_easy_setopt(pCurl, CURLOPT_POST, 1L);
  curl_easy_setopt(pCurl, CURLOPT_POSTFIELDS, sBody.data());
  curl_easy_setopt(pCurl, CURLOPT_POSTFIELDSIZE, static_cast<long>(sBody.size()));
  curl_easy_setopt(pCurl, CURLOPT_HTTPHEADER, upHeaders.get());
  curl_easy_setopt(pCurl, CURLOPT_USERAGENT, "porkbun-dns");
  curl_easy_setopt(pCurl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(pCurl, CURLOPT_NOPROGRESS, 1L);
  curl_easy_setopt(pCurl, CURLOPT_WRITEFUNCTION, writeToString);
  curl_easy_setopt(pCurl, CURLOPT_WRITEDATA, &hr.sBody);
  if (_iTimeoutSeconds > 0) {
    curl_easy_setopt(pCurl, CURLOPT_TIMEOUT, static_cast<long>(_iTimeoutSeconds));
  }

  const CURLcode rc = curl_easy_perform(pCurl);
  if (rc != CURLE_OK) {
    throw common::TransportError(
        "request_failed", "POST " + sUrl + " failed: " + curl_easy_strerror(rc));
  }

  const CURLcode rcInfo = curl_easy_getinfo(pCurl, CURLINFO_RESPONSE_CODE, &hr.iStatus);
  if (rcInfo != CURLE_OK) {
    throw common::TransportError("request_failed", "POST " + sUrl +
                                                       ": no response code: " +
                                                       curl_easy_strerror(rcInfo));
  }
  common::Logger::get()->debug("POST {} -> HTTP {} ({} bytes)", sUrl, hr.iStatus,
                               hr.sBody.size());
  return hr;
}

}  // namespace porkbun::api
