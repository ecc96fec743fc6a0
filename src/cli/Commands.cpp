#include "cli/Commands.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/RecordMatch.hpp"
#include "core/RecordReconciler.hpp"

#include <cstdlib>

namespace porkbun::cli {

namespace {

bool isGlobalValueOption(const std::string& sToken, bool& bInlineValue) {
  for (const char* pOption : kGlobalValueOptions) {
    const std::string sOption = pOption;
    if (sToken == sOption) {
      bInlineValue = false;
      return true;
    }
    if (sToken.rfind(sOption + "=", 0) == 0) {
      bInlineValue = true;
      return true;
    }
  }
  return false;
}

}  // namespace

CommandLine splitCommandLine(const std::vector<std::string>& vArgs) {
  CommandLine cl;
  for (size_t i = 0; i < vArgs.size(); ++i) {
    const std::string& sToken = vArgs[i];
    bool bInlineValue = false;
    if (isGlobalValueOption(sToken, bInlineValue)) {
      cl.vGlobalArgs.push_back(sToken);
      if (!bInlineValue && i + 1 < vArgs.size()) {
        cl.vGlobalArgs.push_back(vArgs[++i]);
      }
    } else if (sToken == "--help" || sToken == "-h") {
      cl.vGlobalArgs.push_back(sToken);
    } else if (!cl.sMode.empty()) {
      cl.vModeArgs.push_back(sToken);
    } else if (sToken.size() > 1 && sToken[0] == '-') {
      throw common::ConfigError("invalid_argument",
                                "Unknown option '" + sToken +
                                    "' before the mode; mode options go after the mode");
    } else {
      cl.sMode = sToken;
    }
  }
  return cl;
}

std::string requireEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  if (pValue == nullptr || *pValue == '\0') {
    throw common::ConfigError("env_missing",
                              std::string("Required environment variable ") + pVarName +
                                  " is not set");
  }
  return pValue;
}

AcmeChallenge acmeChallengeFor(const std::string& sAcmeDomain,
                               const std::optional<std::string>& oRootDomain) {
  std::string sDomain = core::toLower(sAcmeDomain);
  if (sDomain.rfind("*.", 0) == 0) {
    sDomain.erase(0, 2);
  }
  if (!oRootDomain.has_value()) {
    return AcmeChallenge{sDomain, kAcmeChallengeLabel};
  }

  const std::string sRoot = core::toLower(*oRootDomain);
  if (sDomain == sRoot) {
    return AcmeChallenge{sRoot, kAcmeChallengeLabel};
  }
  const std::string sSuffix = "." + sRoot;
  if (sDomain.size() > sSuffix.size() &&
      sDomain.compare(sDomain.size() - sSuffix.size(), sSuffix.size(), sSuffix) == 0) {
    return AcmeChallenge{sRoot, std::string(kAcmeChallengeLabel) + "." +
                                    sDomain.substr(0, sDomain.size() - sSuffix.size())};
  }
  throw common::ConfigError("domain_outside_root",
                            "'" + sDomain + "' is not within root domain '" + sRoot + "'");
}

common::AddressUpdateResult runDdns(const core::RecordReconciler& rrReconciler,
                                    const std::string& sDomain,
                                    const std::optional<std::string>& oSubdomain,
                                    const std::optional<std::string>& oIp) {
  auto spLog = common::Logger::get();

  boost::asio::ip::address ipAddress;
  if (oIp.has_value()) {
    ipAddress = core::parseIpAddress(*oIp);
  } else {
    ipAddress = rrReconciler.resolvePublicIp();
    spLog->info("Detected public IP {}", ipAddress.to_string());
  }

  auto aur = rrReconciler.upsertAddressRecord(sDomain, ipAddress, oSubdomain);
  spLog->info("{}-Record for '{}' now points at {} ({} replaced)", aur.sType,
              core::makeFqdn(oSubdomain.value_or(""), sDomain), aur.sContent,
              aur.vDeleted.size());
  return aur;
}

common::UpsertResult runAcmeRespond(
    const core::RecordReconciler& rrReconciler, const AcmeChallenge& chlChallenge,
    const std::string& sValidation, std::chrono::seconds durPropagation,
    const std::function<void(std::chrono::seconds)>& fnSleep) {
  common::TargetSpec ts;
  ts.sDomain = chlChallenge.sDomain;
  ts.sName = chlChallenge.sName;
  ts.sType = "TXT";
  ts.sContent = sValidation;
  ts.oTtl = kAcmeTxtTtl;

  auto ur = rrReconciler.upsertRecord(ts);

  if (durPropagation.count() > 0) {
    common::Logger::get()->info("Waiting {}s for DNS propagation", durPropagation.count());
    fnSleep(durPropagation);
  }
  return ur;
}

std::vector<nlohmann::json> runAcmeCleanup(const core::RecordReconciler& rrReconciler,
                                           const AcmeChallenge& chlChallenge,
                                           const std::string& sValidation) {
  return rrReconciler.removeRecords(chlChallenge.sDomain, chlChallenge.sName, "TXT",
                                    sValidation);
}

std::string formatRecord(const common::DnsRecord& drRecord) {
  std::string sLine = drRecord.sId + "\t" + drRecord.sName + "\t" + drRecord.sType + "\t" +
                      drRecord.sContent;
  if (drRecord.oTtl) sLine += "\tttl=" + *drRecord.oTtl;
  if (drRecord.oPriority) sLine += "\tprio=" + *drRecord.oPriority;
  if (drRecord.oNotes && !drRecord.oNotes->empty()) sLine += "\tnotes=" + *drRecord.oNotes;
  return sLine;
}

}  // namespace porkbun::cli
