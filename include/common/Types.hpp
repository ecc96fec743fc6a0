#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace porkbun::common {

/// Registrar API credentials. Owned by the ApiClient that authenticates with them.
/// Class abbreviation: cr
struct Credentials {
  std::string sApiKey;
  std::string sSecretApiKey;
  std::string sEndpoint;
};

/// DNS record as seen by the registrar.
/// sName is the fully-qualified, lowercase name.
/// Class abbreviation: dr
struct DnsRecord {
  std::string sId;
  std::string sName;
  std::string sType;
  std::string sContent;
  std::optional<std::string> oTtl;
  std::optional<std::string> oPriority;
  std::optional<std::string> oNotes;
};

/// Desired end state for one record identity (FQDN + type).
/// sName is the subdomain label; empty for the apex.
/// Class abbreviation: ts
struct TargetSpec {
  std::string sDomain;
  std::string sName;
  std::string sType;
  std::string sContent;
  std::optional<std::string> oTtl;
  std::optional<std::string> oPriority;
};

/// Field filter for searchRecords(). Unset fields match everything.
/// Class abbreviation: rq
struct RecordQuery {
  std::optional<std::string> oName;
  std::optional<std::string> oType;
  std::optional<std::string> oContent;
  std::optional<std::string> oTtl;
  std::optional<std::string> oPriority;
  std::optional<std::string> oNotes;
};

/// Result of the generic upsert: at most one deletion, then one creation.
/// Class abbreviation: ur
struct UpsertResult {
  std::optional<nlohmann::json> ojDeleted;
  nlohmann::json jCreated;
};

/// Result of the address-record upsert: every conflicting record removed.
/// Class abbreviation: aur
struct AddressUpdateResult {
  std::string sType;
  std::string sContent;
  std::vector<nlohmann::json> vDeleted;
  nlohmann::json jCreated;
};

}  // namespace porkbun::common
