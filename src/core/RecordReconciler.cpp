#include "core/RecordReconciler.hpp"

#include "api/ApiClient.hpp"
#include "api/RequestBuilder.hpp"
#include "api/ResponseParser.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/RecordMatch.hpp"

#include <algorithm>
#include <array>
#include <iterator>

namespace porkbun::core {

namespace {

/// Types that cannot coexist with an address record at the same name.
constexpr std::array<const char*, 4> kAddressConflictTypes = {"A", "AAAA", "ALIAS", "CNAME"};

bool isAddressConflict(const std::string& sType) {
  return std::any_of(kAddressConflictTypes.begin(), kAddressConflictTypes.end(),
                     [&sType](const char* pType) { return sType == pType; });
}

std::string withRegistrarMessage(std::string sMsg, const nlohmann::json& jResponse) {
  if (auto oMessage = api::ResponseParser::message(jResponse)) {
    sMsg += " Registrar said: " + *oMessage;
  }
  return sMsg;
}

void requireSuccess(const nlohmann::json& jResponse, const std::string& sPath,
                    const std::string& sDomain, const std::string& sAction) {
  if (api::ResponseParser::isSuccess(jResponse)) {
    return;
  }
  throw common::RegistrarError(
      sPath, sDomain,
      withRegistrarMessage("Failed to " + sAction + " (" + sPath + ").", jResponse));
}

std::string describe(const common::DnsRecord& dr) {
  return "id=" + dr.sId + " name=" + dr.sName + " type=" + dr.sType + " content=" + dr.sContent;
}

}  // anonymous namespace

RecordReconciler::RecordReconciler(api::ApiClient& acClient) : _acClient(acClient) {}

RecordReconciler::~RecordReconciler() = default;

std::vector<common::DnsRecord> RecordReconciler::listRecords(const std::string& sDomain) const {
  const std::string sPath = api::RequestBuilder::retrievePath(sDomain);
  const auto jResponse = _acClient.send(sPath);
  if (!api::ResponseParser::isSuccess(jResponse)) {
    throw common::RegistrarError(
        sPath, sDomain,
        withRegistrarMessage("Failed to get records. Make sure you specified the correct domain (" +
                                 sDomain +
                                 "), that the domain is valid, and that API access has been "
                                 "enabled for this domain.",
                             jResponse));
  }
  return api::ResponseParser::parseRecordSet(jResponse);
}

std::optional<common::DnsRecord> RecordReconciler::getRecordById(const std::string& sDomain,
                                                                 const std::string& sId) const {
  const std::string sPath = api::RequestBuilder::retrieveByIdPath(sDomain, sId);
  const auto jResponse = _acClient.send(sPath);
  if (!api::ResponseParser::isSuccess(jResponse)) {
    throw common::RegistrarError(
        sPath, sDomain,
        withRegistrarMessage("Failed to get record " + sId +
                                 ". Make sure you specified the correct domain (" + sDomain +
                                 "), that the domain is valid, and that API access has been "
                                 "enabled for this domain.",
                             jResponse));
  }

  auto vRecords = api::ResponseParser::parseRecordSet(jResponse);
  if (vRecords.empty()) {
    return std::nullopt;
  }
  return vRecords.front();
}

std::vector<common::DnsRecord> RecordReconciler::searchRecords(
    const std::string& sDomain, const common::RecordQuery& rqQuery) const {
  const auto vRecords = listRecords(toLower(sDomain));

  std::vector<common::DnsRecord> vMatches;
  std::copy_if(vRecords.begin(), vRecords.end(), std::back_inserter(vMatches),
               [&rqQuery](const common::DnsRecord& dr) { return matchesQuery(dr, rqQuery); });
  return vMatches;
}

nlohmann::json RecordReconciler::createRecord(const std::string& sDomain,
                                              const std::string& sName,
                                              const std::string& sType,
                                              const std::string& sContent,
                                              const std::optional<std::string>& oTtl,
                                              const std::optional<std::string>& oPriority) const {
  common::Logger::get()->info("Creating {}-Record for '{}' with answer of '{}'", sType,
                              makeFqdn(sName, sDomain), sContent);

  const std::string sPath = api::RequestBuilder::createPath(sDomain);
  auto jResponse = _acClient.send(
      sPath, api::RequestBuilder::createRecordPayload(sName, sType, sContent, oTtl, oPriority));
  requireSuccess(jResponse, sPath, sDomain, "create " + sType + " record");
  return jResponse;
}

nlohmann::json RecordReconciler::deleteRecord(const std::string& sDomain,
                                              const std::string& sId) const {
  const std::string sPath = api::RequestBuilder::deletePath(sDomain, sId);
  auto jResponse = _acClient.send(sPath);
  requireSuccess(jResponse, sPath, sDomain, "delete record " + sId);
  return jResponse;
}

common::UpsertResult RecordReconciler::upsertRecord(const common::TargetSpec& tsTarget) const {
  const auto ts = normalizeTarget(tsTarget);
  const std::string sFqdn = makeFqdn(ts.sName, ts.sDomain);
  auto spLog = common::Logger::get();

  const auto vMatches = findMatches(listRecords(ts.sDomain), sFqdn, ts.sType);

  common::UpsertResult ur;
  if (!vMatches.empty()) {
    const auto& drStale = vMatches.front();
    spLog->info("Deleting existing {}-Record: {}", drStale.sType, describe(drStale));
    ur.ojDeleted = deleteRecord(ts.sDomain, drStale.sId);
    if (vMatches.size() > 1) {
      spLog->warn("{} further {}-Records at '{}' were left in place", vMatches.size() - 1,
                  ts.sType, sFqdn);
    }
  } else {
    spLog->debug("No existing {}-Record at '{}'", ts.sType, sFqdn);
  }

  ur.jCreated = createRecord(ts.sDomain, ts.sName, ts.sType, ts.sContent, ts.oTtl, ts.oPriority);
  return ur;
}

common::AddressUpdateResult RecordReconciler::upsertAddressRecord(
    const std::string& sDomain, const boost::asio::ip::address& ipAddress,
    const std::optional<std::string>& oSubdomain) const {
  const std::string sDomainLc = toLower(sDomain);
  const std::string sName = toLower(oSubdomain.value_or(""));
  const std::string sFqdn = makeFqdn(sName, sDomainLc);
  auto spLog = common::Logger::get();

  common::AddressUpdateResult aur;
  aur.sType = addressRecordType(ipAddress);
  aur.sContent = ipAddress.to_string();

  for (const auto& dr : listRecords(sDomainLc)) {
    if (dr.sName == sFqdn && isAddressConflict(dr.sType)) {
      spLog->info("Deleting existing {}-Record: {}", dr.sType, describe(dr));
      aur.vDeleted.push_back(deleteRecord(sDomainLc, dr.sId));
    }
  }

  aur.jCreated = createRecord(sDomainLc, sName, aur.sType, aur.sContent, kAddressRecordTtl);
  return aur;
}

std::vector<nlohmann::json> RecordReconciler::removeRecords(
    const std::string& sDomain, const std::string& sName, const std::string& sType,
    const std::optional<std::string>& oContent) const {
  const std::string sDomainLc = toLower(sDomain);
  const std::string sFqdn = makeFqdn(sName, sDomainLc);
  auto spLog = common::Logger::get();

  std::vector<nlohmann::json> vDeleted;
  for (const auto& dr : findMatches(listRecords(sDomainLc), sFqdn, toUpper(sType))) {
    if (oContent.has_value() && dr.sContent != *oContent) {
      continue;
    }
    spLog->info("Deleting {}-Record: {}", dr.sType, describe(dr));
    vDeleted.push_back(deleteRecord(sDomainLc, dr.sId));
  }
  if (vDeleted.empty()) {
    spLog->info("No {}-Record at '{}' to delete", toUpper(sType), sFqdn);
  }
  return vDeleted;
}

boost::asio::ip::address RecordReconciler::resolvePublicIp() const {
  const std::string sPath = api::RequestBuilder::pingPath();
  const auto jResponse = _acClient.send(sPath);
  requireSuccess(jResponse, sPath, "", "determine public IP");
  return parseIpAddress(api::ResponseParser::parseYourIp(jResponse));
}

nlohmann::json RecordReconciler::retrieveSsl(const std::string& sDomain) const {
  const std::string sDomainLc = toLower(sDomain);
  const std::string sPath = api::RequestBuilder::sslRetrievePath(sDomainLc);
  auto jResponse = _acClient.send(sPath);
  requireSuccess(jResponse, sPath, sDomainLc, "retrieve SSL bundle for " + sDomainLc);
  return jResponse;
}

}  // namespace porkbun::core
