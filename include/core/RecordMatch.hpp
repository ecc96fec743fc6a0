#pragma once

#include <string>
#include <vector>

#include <boost/asio/ip/address.hpp>

#include "common/Types.hpp"

namespace porkbun::core {

std::string toLower(std::string sValue);
std::string toUpper(std::string sValue);

/// lowercase(name) + "." + lowercase(domain), with no leading or trailing dot.
/// makeFqdn("", "example.com") == "example.com"
std::string makeFqdn(const std::string& sName, const std::string& sDomain);

/// Lowercase domain and name, uppercase type.
common::TargetSpec normalizeTarget(common::TargetSpec tsTarget);

/// Records whose name equals sFqdn and whose type equals sType exactly,
/// in registrar order. Never throws; empty when nothing matches.
std::vector<common::DnsRecord> findMatches(const std::vector<common::DnsRecord>& vRecords,
                                           const std::string& sFqdn,
                                           const std::string& sType);

/// True when every populated field of rqQuery equals the record's field.
bool matchesQuery(const common::DnsRecord& drRecord, const common::RecordQuery& rqQuery);

/// Parse an IPv4/IPv6 literal. Throws ApiDecodeError on failure.
boost::asio::ip::address parseIpAddress(const std::string& sLiteral);

/// "A" for IPv4, "AAAA" for IPv6.
std::string addressRecordType(const boost::asio::ip::address& ipAddress);

}  // namespace porkbun::core
