#pragma once

#include <optional>
#include <string>
#include <vector>

#include <boost/asio/ip/address.hpp>
#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace porkbun::api {
class ApiClient;
}

namespace porkbun::core {

/// TTL used for dynamic address records.
inline constexpr const char* kAddressRecordTtl = "300";

/// Record discovery and the delete-then-create upsert protocol.
/// Every operation lists fresh state from the registrar; nothing is cached.
/// Calls are strictly sequential and a failed step aborts the rest.
/// Class abbreviation: rr
class RecordReconciler {
 public:
  explicit RecordReconciler(api::ApiClient& acClient);
  ~RecordReconciler();

  /// Throws RegistrarError when the registrar reports ERROR (wrong domain,
  /// API access disabled, or invalid domain).
  std::vector<common::DnsRecord> listRecords(const std::string& sDomain) const;

  std::optional<common::DnsRecord> getRecordById(const std::string& sDomain,
                                                 const std::string& sId) const;

  std::vector<common::DnsRecord> searchRecords(const std::string& sDomain,
                                               const common::RecordQuery& rqQuery) const;

  nlohmann::json createRecord(const std::string& sDomain, const std::string& sName,
                              const std::string& sType, const std::string& sContent,
                              const std::optional<std::string>& oTtl = std::nullopt,
                              const std::optional<std::string>& oPriority = std::nullopt) const;

  nlohmann::json deleteRecord(const std::string& sDomain, const std::string& sId) const;

  /// Delete the first record matching (FQDN, type), if any, then create the target.
  /// Later duplicates of the same identity are left in place.
  common::UpsertResult upsertRecord(const common::TargetSpec& tsTarget) const;

  /// Replace whatever A, AAAA, ALIAS or CNAME records exist at the FQDN with
  /// one A/AAAA record for ipAddress (TTL kAddressRecordTtl).
  common::AddressUpdateResult upsertAddressRecord(
      const std::string& sDomain, const boost::asio::ip::address& ipAddress,
      const std::optional<std::string>& oSubdomain = std::nullopt) const;

  /// Delete every record at (FQDN, type), restricted to oContent when given.
  std::vector<nlohmann::json> removeRecords(
      const std::string& sDomain, const std::string& sName, const std::string& sType,
      const std::optional<std::string>& oContent = std::nullopt) const;

  /// Public address of the caller as seen by the registrar.
  boost::asio::ip::address resolvePublicIp() const;

  /// Certificate bundle for sDomain, verbatim.
  nlohmann::json retrieveSsl(const std::string& sDomain) const;

 private:
  api::ApiClient& _acClient;
};

}  // namespace porkbun::core
