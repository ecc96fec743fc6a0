#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/program_options.hpp>
#include <openssl/crypto.h>

#include "api/ApiClient.hpp"
#include "api/CurlHttpClient.hpp"
#include "cli/Commands.hpp"
#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/RecordMatch.hpp"
#include "core/RecordReconciler.hpp"

namespace po = boost::program_options;

namespace {

constexpr const char* kDefaultConfigPath = "config.json";

constexpr const char* kUsage =
    "Usage: porkbun-dns [global options] <mode> [mode options]\n"
    "\n"
    "Modes:\n"
    "  ddns <domain> [--subdomain S] [--ip IP]   point an A/AAAA record at this host\n"
    "  acme-respond [--root-domain D]            publish CERTBOT_VALIDATION as TXT\n"
    "               [--propagation-seconds N]\n"
    "  acme-cleanup [--root-domain D]            remove the CERTBOT_VALIDATION TXT\n"
    "  get-ssl <domain>                          print the certificate bundle\n"
    "  list <domain>                             print all records of a domain\n"
    "\n"
    "Global options";

std::optional<std::string> optionalArg(const po::variables_map& vm, const char* pName) {
  if (vm.count(pName) == 0) {
    return std::nullopt;
  }
  return vm[pName].as<std::string>();
}

po::variables_map parseMode(const std::vector<std::string>& vArgs,
                            const po::options_description& odMode,
                            const po::positional_options_description& podMode) {
  po::variables_map vm;
  po::store(po::command_line_parser(vArgs).options(odMode).positional(podMode).run(), vm);
  po::notify(vm);
  return vm;
}

std::string requireDomain(const po::variables_map& vm, const std::string& sMode) {
  if (vm.count("domain") == 0) {
    throw porkbun::common::ConfigError("domain_missing", sMode + ": a root domain is required");
  }
  return vm["domain"].as<std::string>();
}

}  // namespace

int main(int argc, char* argv[]) {
  po::options_description odGlobal(kUsage);
  odGlobal.add_options()
    ("help,h", "produce help message")
    ("config", po::value<std::string>(), "path to JSON config file (default: config.json)")
    ("key", po::value<std::string>(), "API key")
    ("seckey", po::value<std::string>(), "secret API key")
    ("endpoint", po::value<std::string>(), "API endpoint")
    ("log-level", po::value<std::string>(), "trace|debug|info|warn|error|critical|off");

  try {
    // ── Global options ───────────────────────────────────────────────────
    const auto cl =
        porkbun::cli::splitCommandLine(std::vector<std::string>(argv + 1, argv + argc));

    po::variables_map vm;
    po::store(po::command_line_parser(cl.vGlobalArgs).options(odGlobal).run(), vm);
    po::notify(vm);

    if (vm.count("help") != 0 || cl.sMode.empty()) {
      std::cerr << odGlobal << std::endl;
      return vm.count("help") != 0 ? EXIT_SUCCESS : 2;
    }

    const std::string& sMode = cl.sMode;
    const std::vector<std::string>& vModeArgs = cl.vModeArgs;

    // ── Configuration: file, environment, flags ──────────────────────────
    const bool bExplicitConfig = vm.count("config") != 0;
    auto cfgApp = porkbun::common::Config::load(
        bExplicitConfig ? vm["config"].as<std::string>() : kDefaultConfigPath, bExplicitConfig);
    if (auto oKey = optionalArg(vm, "key")) cfgApp.sApiKey = *oKey;
    if (auto oSecret = optionalArg(vm, "seckey")) cfgApp.sSecretApiKey = *oSecret;
    if (auto oEndpoint = optionalArg(vm, "endpoint")) cfgApp.sEndpoint = *oEndpoint;
    if (auto oLevel = optionalArg(vm, "log-level")) cfgApp.sLogLevel = *oLevel;
    cfgApp.validate();

    porkbun::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = porkbun::common::Logger::get();

    // ── Transport ────────────────────────────────────────────────────────
    porkbun::api::CurlHttpClient chcHttp(cfgApp.iHttpTimeoutSeconds);
    porkbun::api::ApiClient acClient(cfgApp.credentials(), chcHttp);

    // Zero secrets from Config after handoff
    OPENSSL_cleanse(cfgApp.sSecretApiKey.data(), cfgApp.sSecretApiKey.size());
    cfgApp.sSecretApiKey.clear();
    OPENSSL_cleanse(cfgApp.sApiKey.data(), cfgApp.sApiKey.size());
    cfgApp.sApiKey.clear();

    porkbun::core::RecordReconciler rrReconciler(acClient);
    spLog->debug("Using endpoint {}", acClient.endpoint());

    // ── Modes ────────────────────────────────────────────────────────────
    if (sMode == "ddns") {
      po::options_description odMode("ddns options");
      odMode.add_options()
        ("domain", po::value<std::string>(), "root domain name; must not contain subdomains")
        ("subdomain", po::value<std::string>(), "subdomain(s); must not contain the root domain")
        ("ip", po::value<std::string>(), "use this IP instead of auto-detection");
      po::positional_options_description podMode;
      podMode.add("domain", 1);
      const auto vmMode = parseMode(vModeArgs, odMode, podMode);

      const auto aur = porkbun::cli::runDdns(rrReconciler, requireDomain(vmMode, sMode),
                                             optionalArg(vmMode, "subdomain"),
                                             optionalArg(vmMode, "ip"));
      std::cout << aur.jCreated.value("status", std::string{"SUCCESS"}) << std::endl;
    } else if (sMode == "acme-respond" || sMode == "acme-cleanup") {
      po::options_description odMode(sMode + " options");
      odMode.add_options()
        ("root-domain", po::value<std::string>(), "registered zone when CERTBOT_DOMAIN is a subdomain")
        ("propagation-seconds", po::value<int>(), "seconds to wait after publishing");
      const auto vmMode = parseMode(vModeArgs, odMode, po::positional_options_description{});

      const auto chlChallenge = porkbun::cli::acmeChallengeFor(
          porkbun::cli::requireEnv("CERTBOT_DOMAIN"), optionalArg(vmMode, "root-domain"));
      const std::string sValidation = porkbun::cli::requireEnv("CERTBOT_VALIDATION");

      if (sMode == "acme-respond") {
        int iWait = cfgApp.iAcmePropagationSeconds;
        if (vmMode.count("propagation-seconds") != 0) {
          iWait = vmMode["propagation-seconds"].as<int>();
        }
        if (iWait < 0) {
          throw porkbun::common::ConfigError("invalid_argument",
                                             "--propagation-seconds must be >= 0");
        }
        porkbun::cli::runAcmeRespond(
            rrReconciler, chlChallenge, sValidation, std::chrono::seconds(iWait),
            [](std::chrono::seconds durWait) { std::this_thread::sleep_for(durWait); });
      } else {
        porkbun::cli::runAcmeCleanup(rrReconciler, chlChallenge, sValidation);
      }
    } else if (sMode == "get-ssl" || sMode == "list") {
      po::options_description odMode(sMode + " options");
      odMode.add_options()("domain", po::value<std::string>(), "root domain name");
      po::positional_options_description podMode;
      podMode.add("domain", 1);
      const auto vmMode = parseMode(vModeArgs, odMode, podMode);
      const std::string sDomain = requireDomain(vmMode, sMode);

      if (sMode == "get-ssl") {
        std::cout << rrReconciler.retrieveSsl(sDomain).dump(2) << std::endl;
      } else {
        for (const auto& dr : rrReconciler.listRecords(porkbun::core::toLower(sDomain))) {
          std::cout << porkbun::cli::formatRecord(dr) << "\n";
        }
      }
    } else {
      throw porkbun::common::ConfigError("unknown_mode", "Unknown mode: '" + sMode + "'");
    }

    return EXIT_SUCCESS;
  } catch (const po::error& ex) {
    std::cerr << "error: " << ex.what() << "\n" << odGlobal << std::endl;
    return 2;
  } catch (const porkbun::common::AppError& ex) {
    std::cerr << "error: " << ex.what() << std::endl;
    return ex._iExitCode;
  } catch (const std::exception& ex) {
    std::cerr << "error: " << ex.what() << std::endl;
    return EXIT_FAILURE;
  }
}
