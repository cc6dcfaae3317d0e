#pragma once

#include "exampack/types.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace exampack {

// ============================================================================
// Pack Download (libcurl)
// ============================================================================

struct DownloadRequest {
    std::string pack_id;
    std::string url;        // https:// or file:// (http:// only when allowed)
    std::string dest_path;  // final location; data streams to a sibling .part file
    long timeout_seconds = 300;
    long connect_timeout_seconds = 30;
    bool allow_insecure_http = false;
};

// Shared between the transfer and whoever may cancel it
using CancelFlag = std::shared_ptr<std::atomic<bool>>;

// Empty string when the scheme is acceptable, otherwise the reason
std::string check_download_url(const std::string& url, bool allow_insecure_http);

/**
 * Blocking transfer of request.url into request.dest_path.
 *
 * Data is written to "<dest_path>.<uuid>.part" and renamed over dest_path
 * only after a complete, uncanceled transfer. A failed or canceled transfer
 * leaves the .part file behind for cleanup_temp_files(). Progress snapshots
 * are delivered on the calling thread while the size is known.
 */
DownloadResult download_to_file(const DownloadRequest& request,
                                const CancelFlag& cancel,
                                const ProgressCallback& on_progress);

} // namespace exampack
