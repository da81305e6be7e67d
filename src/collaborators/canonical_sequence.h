#pragma once

#include <memory>
#include <vector>

#include "../common/configuration.h"
#include "../sequencer/step.h"
#include "process_runner.h"

namespace Bootstrap {

// Canonical step names, in required order.
constexpr char kInstallStep[] = "install";
constexpr char kCollectAssetsStep[] = "collect-assets";
constexpr char kMigrateStep[] = "migrate";
constexpr char kPlatformSettingsStep[] = "init-platform-settings";
constexpr char kReferralSettingsStep[] = "init-referral-settings";

/**
 * The five canonical steps built from the toolchain settings:
 * dependencies, static assets, schema, platform settings, referral settings.
 * Each later step relies on the side effects of all earlier ones.
 */
std::vector<StepConfig> CanonicalSteps(const BootstrapConfig& config);

/**
 * Explicit steps from the configuration when it lists any, otherwise the
 * canonical steps. Explicit steps are taken in file order.
 */
std::vector<StepConfig> ConfiguredSteps(const BootstrapConfig& config);

// One CommandAction per configured step, all sharing the given runner.
Sequence BuildSequence(const BootstrapConfig& config, std::shared_ptr<IProcessRunner> runner);

} // namespace Bootstrap
