#include "relay/cleanup_scheduler.h"

#include "utilities/logger.h"

#include <exception>
#include <set>

namespace quickshare::relay {

CleanupScheduler::~CleanupScheduler() { stop(); }

void CleanupScheduler::start() {
    if (running_) return;
    running_ = true;
    worker_ = std::thread(&CleanupScheduler::threadFunc, this);
    Logger::getInstance().log(LogLevel::INFO, "cleanup",
                              "Cleanup scheduler started, interval " +
                                  std::to_string(interval_.count()) + "ms");
}

void CleanupScheduler::stop() {
    if (!running_) return;
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        running_ = false;
    }
    wake_.notify_all();
    if (worker_.joinable()) worker_.join();
    Logger::getInstance().log(LogLevel::INFO, "cleanup", "Cleanup scheduler stopped");
}

void CleanupScheduler::threadFunc() {
    while (running_) {
        try {
            runOnce();
        } catch (const std::exception& e) {
            // A failed sweep is retried on the next tick.
            Logger::getInstance().log(LogLevel::ERROR, "cleanup",
                                      std::string("Sweep failed: ") + e.what());
        }
        std::unique_lock<std::mutex> lock(waitMutex_);
        wake_.wait_for(lock, interval_, [this] { return !running_; });
    }
}

CleanupStats CleanupScheduler::sweepOwner(const std::string& ownerId) {
    CleanupStats stats;
    stats.ownersSwept = 1;
    SweepReport report = registry_.sweepOwner(ownerId);
    stats.expiredCodes = report.expiredCodes;
    stats.evictedArtifacts += store_.evictCodesFor(ownerId, report.revokedKeyCodes,
                                                   ArtifactKind::WrappedKey);
    stats.evictedArtifacts += store_.evictCodesFor(ownerId, report.releasedStorageCodes);
    stats.evictedArtifacts += store_.evictExpiredFor(ownerId);
    if (stats.expiredCodes > 0 || stats.evictedArtifacts > 0) {
        Logger::getInstance().log(LogLevel::INFO, "cleanup",
                                  "Owner " + ownerId + ": expired " +
                                      std::to_string(stats.expiredCodes) +
                                      " codes, evicted " +
                                      std::to_string(stats.evictedArtifacts) +
                                      " artifacts");
    }
    return stats;
}

CleanupStats CleanupScheduler::runOnce() {
    std::set<std::string> owners = store_.owners();
    for (auto& owner : registry_.owners()) owners.insert(owner);

    CleanupStats total;
    for (const auto& owner : owners) {
        CleanupStats s = sweepOwner(owner);
        total.ownersSwept += s.ownersSwept;
        total.expiredCodes += s.expiredCodes;
        total.evictedArtifacts += s.evictedArtifacts;
    }
    Logger::getInstance().log(LogLevel::DEBUG, "cleanup",
                              "Sweep done: " + std::to_string(total.ownersSwept) +
                                  " owners, " +
                                  std::to_string(total.evictedArtifacts) +
                                  " artifacts evicted");
    return total;
}

} // namespace quickshare::relay
