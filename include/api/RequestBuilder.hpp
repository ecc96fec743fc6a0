#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace porkbun::api {

/// Paths and request bodies for each registrar API operation.
/// Every call returns a freshly built value; nothing is shared between requests.
/// Class abbreviation: N/A (static interface)
class RequestBuilder {
 public:
  static std::string pingPath();
  static std::string retrievePath(const std::string& sDomain);
  static std::string retrieveByIdPath(const std::string& sDomain, const std::string& sId);
  static std::string createPath(const std::string& sDomain);
  static std::string deletePath(const std::string& sDomain, const std::string& sId);
  static std::string sslRetrievePath(const std::string& sDomain);

  /// Body for /dns/create. Unset optionals are omitted, never sent as null.
  static nlohmann::json createRecordPayload(const std::string& sName,
                                            const std::string& sType,
                                            const std::string& sContent,
                                            const std::optional<std::string>& oTtl,
                                            const std::optional<std::string>& oPriority);
};

}  // namespace porkbun::api
