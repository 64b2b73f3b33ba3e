#pragma once

/**
 * DownloadListener.hpp
 *
 * Observer interface for download events. Every callback has an empty
 * default body so listeners override only what they need.
 */

#include "../models/Models.hpp"

#include <cstdint>
#include <vector>

namespace downlink::engine {

class DownloadListener {
public:
    virtual ~DownloadListener() = default;

    virtual void onAdded(const models::Download&) {}

    /**
     * @param waitingOnNetwork true when the download cannot start for lack of network
     */
    virtual void onQueued(const models::Download&, bool /*waitingOnNetwork*/) {}

    virtual void onWaitingNetwork(const models::Download&) {}

    virtual void onStarted(const models::Download&,
                           const std::vector<models::DownloadBlock>& /*blocks*/,
                           int /*totalBlocks*/) {}

    /**
     * @param etaMillis Estimated time left, -1 if unknown
     * @param bytesPerSecond Current rate
     */
    virtual void onProgress(const models::Download&, int64_t /*etaMillis*/,
                            int64_t /*bytesPerSecond*/) {}

    virtual void onBlockUpdated(const models::Download&, const models::DownloadBlock&,
                                int /*totalBlocks*/) {}

    virtual void onPaused(const models::Download&) {}
    virtual void onResumed(const models::Download&) {}
    virtual void onCompleted(const models::Download&) {}
    virtual void onError(const models::Download&, models::DownloadError) {}
    virtual void onCancelled(const models::Download&) {}
    virtual void onRemoved(const models::Download&) {}
    virtual void onDeleted(const models::Download&) {}
};

} // namespace downlink::engine
