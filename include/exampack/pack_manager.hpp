#pragma once

#include "exampack/config.hpp"
#include "exampack/downloader.hpp"
#include "exampack/manifest.hpp"
#include "exampack/metadata_store.hpp"
#include "exampack/platform.hpp"
#include "exampack/types.hpp"
#include "exampack/verifier.hpp"

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace exampack {

struct InstalledPack {
    std::string id;
    std::string version;  // "unknown" when manifest.json is unreadable
    std::optional<PackMetadataRecord> record;
};

/**
 * Pack lifecycle: compatibility check, download, verify, install with
 * rollback, uninstall and storage accounting.
 *
 * On-disk layout:
 *   <packs_dir>/<id>/manifest.json + content   installed pack
 *   <packs_dir>/<id>_backup_<ms>/               previous version during install
 *                                               (never listed or counted as a pack)
 *   <packs_dir>/.staging-<uuid>/                extracted archive during install
 *   <temp_dir>/<id>.zip                         completed download
 *
 * Install and uninstall calls for the same pack id must be serialized by
 * the caller. Calls for distinct ids touch disjoint directories. Downloads
 * run on worker threads that share only the download registry with the
 * manager, so a transfer may outlive it.
 */
class PackManager {
public:
    PackManager(PackManagerConfig config, const PackVerifier& verifier, MetadataStore& store);
    virtual ~PackManager() = default;

    PackManager(const PackManager&) = delete;
    PackManager& operator=(const PackManager&) = delete;

    const PackManagerConfig& config() const { return config_; }

    std::string pack_directory(const std::string& pack_id) const;
    std::string download_path(const std::string& pack_id) const;

    CompatibilityResult check_compatibility(const PackManifest& manifest,
                                            const std::string& app_version) const;

    // Uses config().app_version
    CompatibilityResult check_compatibility(const PackManifest& manifest) const;

    // Starts a transfer to download_path(pack_id). A second call for the
    // same id cancels the first.
    std::future<DownloadResult> download_pack(const std::string& pack_id,
                                              const std::string& url,
                                              ProgressCallback on_progress = {});

    // No-op when nothing is in flight for pack_id
    void cancel_download(const std::string& pack_id);

    bool is_downloading(const std::string& pack_id) const;

    // Verify-before-mutate: the active directory for pack_id is only touched
    // after checksum, signature and content validation all pass. Any failure
    // after that restores the previous directory.
    PackInstallationResult install_pack(const std::string& pack_id,
                                        const std::string& temp_path,
                                        const PackManifest& manifest,
                                        const ProgressCallback& on_progress = {});

    // True when the pack is gone afterwards, including when it never existed
    bool uninstall_pack(const std::string& pack_id);

    bool is_pack_installed(const std::string& pack_id,
                           const std::optional<std::string>& version = std::nullopt) const;

    std::optional<std::string> get_installed_version(const std::string& pack_id) const;

    StorageUsage get_storage_usage() const;

    // Deletes temp files and stale staging directories older than
    // config().temp_max_age_hours. Never fails; errors are logged.
    size_t cleanup_temp_files();

    std::vector<InstalledPack> list_installed() const;

    // Cross-check the installed manifest against the metadata record
    IntegrityResult verify_installed(const std::string& pack_id) const;

protected:
    // Every directory move of an install (backup, swap in, restore) goes
    // through here
    virtual AtomicWriteResult move_directory(const std::string& from, const std::string& to);

private:
    struct DownloadRegistry;

    bool is_pack_dir_name(const std::string& name) const;

    PackManagerConfig config_;
    const PackVerifier& verifier_;
    MetadataStore& store_;
    std::shared_ptr<DownloadRegistry> downloads_;
};

} // namespace exampack
