#include "core/RecordMatch.hpp"

#include "common/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

namespace porkbun::core {

namespace {

bool fieldMatches(const std::optional<std::string>& oWanted,
                  const std::optional<std::string>& oActual) {
  return !oWanted.has_value() || (oActual.has_value() && *oActual == *oWanted);
}

}  // anonymous namespace

std::string toLower(std::string sValue) {
  std::transform(sValue.begin(), sValue.end(), sValue.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sValue;
}

std::string toUpper(std::string sValue) {
  std::transform(sValue.begin(), sValue.end(), sValue.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return sValue;
}

std::string makeFqdn(const std::string& sName, const std::string& sDomain) {
  std::string sFqdn = toLower(sName) + "." + toLower(sDomain);
  const auto nFirst = sFqdn.find_first_not_of('.');
  if (nFirst == std::string::npos) {
    return {};
  }
  const auto nLast = sFqdn.find_last_not_of('.');
  return sFqdn.substr(nFirst, nLast - nFirst + 1);
}

common::TargetSpec normalizeTarget(common::TargetSpec tsTarget) {
  tsTarget.sDomain = toLower(std::move(tsTarget.sDomain));
  tsTarget.sName = toLower(std::move(tsTarget.sName));
  tsTarget.sType = toUpper(std::move(tsTarget.sType));
  return tsTarget;
}

std::vector<common::DnsRecord> findMatches(const std::vector<common::DnsRecord>& vRecords,
                                           const std::string& sFqdn,
                                           const std::string& sType) {
  std::vector<common::DnsRecord> vMatches;
  std::copy_if(vRecords.begin(), vRecords.end(), std::back_inserter(vMatches),
               [&](const common::DnsRecord& dr) {
                 return dr.sName == sFqdn && dr.sType == sType;
               });
  return vMatches;
}

bool matchesQuery(const common::DnsRecord& drRecord, const common::RecordQuery& rqQuery) {
  return fieldMatches(rqQuery.oName, drRecord.sName) &&
         fieldMatches(rqQuery.oType, drRecord.sType) &&
         fieldMatches(rqQuery.oContent, drRecord.sContent) &&
         fieldMatches(rqQuery.oTtl, drRecord.oTtl) &&
         fieldMatches(rqQuery.oPriority, drRecord.oPriority) &&
         fieldMatches(rqQuery.oNotes, drRecord.oNotes);
}

boost::asio::ip::address parseIpAddress(const std::string& sLiteral) {
  boost::system::error_code ec;
  auto ipAddress = boost::asio::ip::make_address(sLiteral, ec);
  if (ec) {
    throw common::ApiDecodeError("invalid_ip",
                                 "'" + sLiteral + "' is not a valid IP address: " + ec.message());
  }
  return ipAddress;
}

std::string addressRecordType(const boost::asio::ip::address& ipAddress) {
  return ipAddress.is_v4() ? "A" : "AAAA";
}

}  // namespace porkbun::core
