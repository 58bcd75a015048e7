#pragma once
#include "relay/code_registry.hpp"
#include "relay/relay_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>

namespace quickshare::relay {

struct CleanupStats {
    std::size_t ownersSwept{0};
    std::size_t expiredCodes{0};
    std::size_t evictedArtifacts{0};
};

/**
 * Periodically expires due pickup codes and evicts the artifacts they no
 * longer need. Each owner is swept on its own; no lock spanning owners is
 * held while evicting.
 */
class CleanupScheduler {
public:
    /**
     * @brief Construct a CleanupScheduler.
     * @param registry Code registry deciding what is expired or released.
     * @param store    Artifact store to evict from.
     * @param interval Delay between background sweeps.
     */
    CleanupScheduler(PickupCodeRegistry& registry, RelayStore& store,
                     std::chrono::milliseconds interval = std::chrono::seconds(60))
        : registry_(registry), store_(store), interval_(interval) {}

    ~CleanupScheduler();

    /** Start the background sweep thread. */
    void start();
    /** Stop the background sweep thread, waking it if it is sleeping. */
    void stop();
    bool running() const { return running_; }

    /** Sweep every owner once. */
    CleanupStats runOnce();
    /** Sweep a single owner, e.g. right after they invalidated a file. */
    CleanupStats sweepOwner(const std::string& ownerId);

private:
    void threadFunc();

    PickupCodeRegistry& registry_;
    RelayStore& store_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex waitMutex_;
    std::condition_variable wake_;
};

} // namespace quickshare::relay
