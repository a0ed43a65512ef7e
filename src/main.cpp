#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "cli/CliOptions.hpp"
#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/CredentialResolver.hpp"
#include "core/DeploymentEngine.hpp"
#include "core/DeviceLockRegistry.hpp"
#include "core/ProvisioningBatch.hpp"
#include "core/ProvisioningJob.hpp"
#include "core/ThreadPool.hpp"
#include "dal/ConnectionPool.hpp"
#include "dal/DeviceRepository.hpp"
#include "dal/IntendedConfigRepository.hpp"
#include "dal/SecretsGroupRepository.hpp"
#include "secrets/SecretStore.hpp"
#include "transport/TransportFactory.hpp"

#include <openssl/crypto.h>

namespace {

constexpr int kExitUsage = 2;

void printSummary(const std::vector<netprov::core::BatchItem>& vItems) {
  using netprov::common::LogTier;
  for (const auto& bi : vItems) {
    const auto& dr = bi.result;
    std::cout << bi.sDevice << ": " << netprov::common::toString(dr.status);
    if (dr.oError) {
      std::cout << " [" << netprov::common::toString(dr.oError->kind) << "/"
                << dr.oError->sCode << "] " << dr.oError->sMessage;
    }
    std::cout << "\n";
    for (const auto& le : dr.vTrail) {
      if (le.tier == LogTier::Warning || le.tier == LogTier::Error) {
        std::cout << "  " << netprov::common::toString(le.tier) << ": " << le.sMessage << "\n";
      }
    }
    if (dr.oDiffText) {
      std::cout << "  diff:\n" << *dr.oDiffText << "\n";
    }
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  netprov::cli::CliOptions coArgs;
  try {
    coArgs = netprov::cli::parseCliOptions(argc, argv);
  } catch (const netprov::common::ValidationError& ex) {
    std::cerr << "netprov: " << ex.what() << "\n\n" << netprov::cli::usage();
    return kExitUsage;
  }
  if (coArgs.bHelp) {
    std::cout << netprov::cli::usage();
    return EXIT_SUCCESS;
  }

  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = netprov::common::Config::load();

    netprov::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = netprov::common::Logger::get();
    spLog->info("Step 1: Configuration loaded");

    // ── Step 2: Source-of-truth connection pool and repositories ─────────
    auto cpPool = std::make_unique<netprov::dal::ConnectionPool>(
        cfgApp.sDbUrl, cfgApp.iDbPoolSize,
        std::chrono::seconds(cfgApp.iDbCheckoutTimeoutSeconds));
    auto dvrDevices = std::make_unique<netprov::dal::DeviceRepository>(*cpPool);
    auto icrConfigs = std::make_unique<netprov::dal::IntendedConfigRepository>(*cpPool);
    auto sgrGroups = std::make_unique<netprov::dal::SecretsGroupRepository>(*cpPool);
    spLog->info("Step 2: Repositories ready");

    // ── Step 3: Secret store and credential resolver ─────────────────────
    auto upStore = netprov::secrets::SecretStore::withBuiltins(*sgrGroups);
    auto cresResolver = std::make_unique<netprov::core::CredentialResolver>(
        upStore.get(),
        netprov::core::DefaultCredentials{cfgApp.sDefaultUsername, cfgApp.sDefaultPassword});

    // Zero the fallback password in Config after handoff
    OPENSSL_cleanse(cfgApp.sDefaultPassword.data(), cfgApp.sDefaultPassword.size());
    cfgApp.sDefaultPassword.clear();
    spLog->info("Step 3: CredentialResolver ready (default user={})", cfgApp.sDefaultUsername);

    // ── Step 4: Transport drivers and deployment engine ──────────────────
    auto tfFactory = netprov::transport::TransportFactory::withBuiltins(cfgApp.sLabRoot);
    auto depEngine = std::make_unique<netprov::core::DeploymentEngine>(
        tfFactory, *cresResolver,
        netprov::core::EngineTimeouts{std::chrono::seconds(cfgApp.iConnectTimeoutSeconds),
                                      std::chrono::seconds(cfgApp.iOperationTimeoutSeconds)});
    spLog->info("Step 4: DeploymentEngine ready (connect timeout={}s, operation timeout={}s)",
                cfgApp.iConnectTimeoutSeconds, cfgApp.iOperationTimeoutSeconds);

    // ── Step 5: Jobs and thread pool ─────────────────────────────────────
    netprov::core::DeviceLockRegistry dlrLocks;
    netprov::core::ProvisioningJob pjJob(*dvrDevices, *icrConfigs, *depEngine, &dlrLocks);
    netprov::core::ThreadPool tpPool(cfgApp.iThreadPoolSize);
    netprov::core::ProvisioningBatch pbBatch(pjJob, tpPool);
    spLog->info("Step 5: ThreadPool started ({} workers)", tpPool.size());

    // ── Step 6: Provision ────────────────────────────────────────────────
    netprov::core::JobParams jpTemplate;
    jpTemplate.bDryRun = !coArgs.bLive;
    jpTemplate.bReplace = coArgs.bReplace;
    jpTemplate.bCommit = coArgs.bCommit;
    jpTemplate.bVerbose = coArgs.bVerbose;

    auto vItems = pbBatch.run(coArgs.vDevices, jpTemplate);
    tpPool.shutdown();

    printSummary(vItems);
    const bool bFailed = netprov::core::ProvisioningBatch::anyFailed(vItems);
    spLog->info("netprov finished: {} device(s), {}", vItems.size(),
                bFailed ? "with failures" : "all succeeded");
    return bFailed ? EXIT_FAILURE : EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] netprov failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
