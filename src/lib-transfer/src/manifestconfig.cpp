/**
 * @file manifestconfig.cpp
 * @date October 2026
 * @brief Настройка реестра адаптеров из Environment
 */

#include "lfs/manifestconfig.hpp"

namespace lfs {

void configureManifest(Manifest& manifest, const Environment& env) {
  manifest.setMaxRetries(env.getInt(kMaxRetriesKey, manifest.maxRetries()));
  manifest.setConcurrentTransfers(
      env.getInt(kConcurrentTransfersKey, manifest.concurrentTransfers()));
  manifest.setBasicTransfersOnly(
      env.getBool(kBasicTransfersOnlyKey, manifest.basicTransfersOnly()));
  manifest.setTusTransfersAllowed(
      env.getBool(kTusTransfersKey, manifest.tusTransfersAllowed()));
}

}  // namespace lfs
