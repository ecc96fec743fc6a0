#pragma once

#include <array>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace porkbun::core {
class RecordReconciler;
}

namespace porkbun::cli {

inline constexpr const char* kAcmeChallengeLabel = "_acme-challenge";
inline constexpr const char* kAcmeTxtTtl = "120";

/// Global options that take a value; accepted before or after the mode.
inline constexpr std::array<const char*, 5> kGlobalValueOptions = {
    "--config", "--key", "--seckey", "--endpoint", "--log-level"};

/// argv split into global options, the mode word and the mode's own arguments.
/// Class abbreviation: cl
struct CommandLine {
  std::vector<std::string> vGlobalArgs;
  std::string sMode;  // empty when no mode was given
  std::vector<std::string> vModeArgs;
};

/// Split argv (without the program name). The mode is the first token that
/// is neither a global option nor its value. Throws ConfigError for an
/// unknown option ahead of the mode.
CommandLine splitCommandLine(const std::vector<std::string>& vArgs);

/// Where an ACME DNS-01 challenge record lives.
/// Class abbreviation: chl
struct AcmeChallenge {
  std::string sDomain;  // zone registered at the registrar
  std::string sName;    // label within sDomain
};

/// Read an environment variable; throws ConfigError when unset or empty.
std::string requireEnv(const char* pVarName);

/// Challenge location for sAcmeDomain. With oRootDomain, a subdomain's
/// challenge goes into the root zone as "_acme-challenge.<sub>".
AcmeChallenge acmeChallengeFor(const std::string& sAcmeDomain,
                               const std::optional<std::string>& oRootDomain);

/// Point <subdomain.>domain at oIp, or at the registrar-observed public IP.
common::AddressUpdateResult runDdns(const core::RecordReconciler& rrReconciler,
                                    const std::string& sDomain,
                                    const std::optional<std::string>& oSubdomain,
                                    const std::optional<std::string>& oIp);

/// Publish the validation TXT record, then block for durPropagation.
common::UpsertResult runAcmeRespond(
    const core::RecordReconciler& rrReconciler, const AcmeChallenge& chlChallenge,
    const std::string& sValidation, std::chrono::seconds durPropagation,
    const std::function<void(std::chrono::seconds)>& fnSleep);

/// Remove the TXT record(s) holding sValidation.
std::vector<nlohmann::json> runAcmeCleanup(const core::RecordReconciler& rrReconciler,
                                           const AcmeChallenge& chlChallenge,
                                           const std::string& sValidation);

/// One-line rendering for `list`.
std::string formatRecord(const common::DnsRecord& drRecord);

}  // namespace porkbun::cli
