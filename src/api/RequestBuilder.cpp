#include "api/RequestBuilder.hpp"

namespace porkbun::api {

std::string RequestBuilder::pingPath() { return "/ping/"; }

std::string RequestBuilder::retrievePath(const std::string& sDomain) {
  return "/dns/retrieve/" + sDomain;
}

std::string RequestBuilder::retrieveByIdPath(const std::string& sDomain,
                                             const std::string& sId) {
  return "/dns/retrieve/" + sDomain + "/" + sId;
}

std::string RequestBuilder::createPath(const std::string& sDomain) {
  return "/dns/create/" + sDomain;
}

std::string RequestBuilder::deletePath(const std::string& sDomain, const std::string& sId) {
  return "/dns/delete/" + sDomain + "/" + sId;
}

std::string RequestBuilder::sslRetrievePath(const std::string& sDomain) {
  return "/ssl/retrieve/" + sDomain;
}

nlohmann::json RequestBuilder::createRecordPayload(const std::string& sName,
                                                   const std::string& sType,
                                                   const std::string& sContent,
                                                   const std::optional<std::string>& oTtl,
                                                   const std::optional<std::string>& oPriority) {
  nlohmann::json jPayload = {{"name", sName}, {"type", sType}, {"content", sContent}};
  if (oTtl.has_value()) {
    jPayload["ttl"] = *oTtl;
  }
  if (oPriority.has_value()) {
    jPayload["prio"] = *oPriority;
  }
  return jPayload;
}

}  // namespace porkbun::api
