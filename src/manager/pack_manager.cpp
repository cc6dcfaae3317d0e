#include "exampack/pack_manager.hpp"
#include "exampack/archive.hpp"
#include "exampack/content.hpp"
#include "exampack/platform.hpp"
#include "exampack/validator.hpp"
#include "exampack/version.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <stdexcept>

namespace fs = std::filesystem;

namespace exampack {

// In-flight transfers by pack id. Shared with download threads.
struct PackManager::DownloadRegistry {
    mutable std::mutex mutex;
    std::map<std::string, CancelFlag> active;
};

namespace {

constexpr const char* STAGING_PREFIX = ".staging-";
constexpr const char* BACKUP_MARKER = "_backup_";

void report(const ProgressCallback& on_progress, const std::string& pack_id,
            DownloadStatus status, int percentage,
            std::optional<std::string> error = std::nullopt) {
    if (!on_progress) return;

    DownloadProgress progress;
    progress.pack_id = pack_id;
    progress.downloaded = 0;
    progress.total = 0;
    progress.percentage = percentage;
    progress.status = status;
    progress.error = std::move(error);
    on_progress(progress);
}

// Splits "<id>_backup_<digits>" into <id>. Anything else yields nullopt.
std::optional<std::string> backup_owner(const std::string& name) {
    auto pos = name.rfind(BACKUP_MARKER);
    if (pos == std::string::npos || pos == 0) return std::nullopt;

    std::string stamp = name.substr(pos + std::char_traits<char>::length(BACKUP_MARKER));
    if (stamp.empty()) return std::nullopt;
    for (char c : stamp) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }

    std::string owner = name.substr(0, pos);
    if (!is_valid_pack_id(owner)) return std::nullopt;
    return owner;
}

std::optional<std::string> read_installed_version(const std::string& pack_dir) {
    auto text = read_text_file(join_path(pack_dir, MANIFEST_FILE));
    if (!text) return std::nullopt;

    auto j = nlohmann::json::parse(*text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::warn("failed to read manifest for pack: {}", get_filename(pack_dir));
        return std::nullopt;
    }
    auto it = j.find("version");
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::vector<std::string> issue_strings(const std::vector<ValidationIssue>& issues) {
    std::vector<std::string> out;
    out.reserve(issues.size());
    for (const auto& issue : issues) {
        out.push_back(format_issue(issue));
    }
    return out;
}

struct StepResult {
    bool ok = false;
    std::string error;
};

} // namespace

PackManager::PackManager(PackManagerConfig config, const PackVerifier& verifier, MetadataStore& store)
    : config_(std::move(config)),
      verifier_(verifier),
      store_(store),
      downloads_(std::make_shared<DownloadRegistry>()) {}

std::string PackManager::pack_directory(const std::string& pack_id) const {
    return join_path(config_.packs_dir, pack_id);
}

std::string PackManager::download_path(const std::string& pack_id) const {
    return join_path(config_.temp_dir, pack_id + ".zip");
}

AtomicWriteResult PackManager::move_directory(const std::string& from, const std::string& to) {
    return atomic_rename(from, to);
}

// Installed pack directories only. Staging dirs are dot-prefixed. A backup is
// "<id>_backup_<ms>" with no record of its own whose owner is still known,
// either as a sibling directory or by its metadata record. A pack whose id
// merely looks like a backup keeps its own record and is listed.
bool PackManager::is_pack_dir_name(const std::string& name) const {
    if (name.empty() || name[0] == '.') return false;

    auto owner = backup_owner(name);
    if (!owner) return true;
    if (store_.get(name)) return true;

    return !is_directory(pack_directory(*owner)) && !store_.get(*owner);
}

// ============================================================================
// Compatibility
// ============================================================================

CompatibilityResult PackManager::check_compatibility(const PackManifest& manifest,
                                                     const std::string& app_version) const {
    return exampack::check_compatibility(manifest, app_version);
}

CompatibilityResult PackManager::check_compatibility(const PackManifest& manifest) const {
    return exampack::check_compatibility(manifest, config_.app_version);
}

// ============================================================================
// Download
// ============================================================================

std::future<DownloadResult> PackManager::download_pack(const std::string& pack_id,
                                                       const std::string& url,
                                                       ProgressCallback on_progress) {
    if (!is_valid_pack_id(pack_id)) {
        std::promise<DownloadResult> failed;
        DownloadResult result;
        result.kind = PackError::BusinessRule;
        result.error = "invalid pack id: " + pack_id;
        failed.set_value(result);
        return failed.get_future();
    }

    DownloadRequest request;
    request.pack_id = pack_id;
    request.url = url;
    request.dest_path = download_path(pack_id);
    request.timeout_seconds = config_.download_timeout_seconds;
    request.connect_timeout_seconds = config_.connect_timeout_seconds;
    request.allow_insecure_http = config_.allow_insecure_http;

    auto cancel = std::make_shared<std::atomic<bool>>(false);
    {
        std::lock_guard<std::mutex> lock(downloads_->mutex);
        auto& slot = downloads_->active[pack_id];
        if (slot) {
            spdlog::info("superseding in-flight download of {}", pack_id);
            slot->store(true);
        }
        slot = cancel;
    }

    auto registry = downloads_;
    return std::async(std::launch::async,
                      [registry, request, cancel, on_progress = std::move(on_progress)]() {
        auto result = download_to_file(request, cancel, on_progress);

        {
            std::lock_guard<std::mutex> lock(registry->mutex);
            auto it = registry->active.find(request.pack_id);
            if (it != registry->active.end() && it->second == cancel) {
                registry->active.erase(it);
            }
        }

        if (!result.ok && on_progress) {
            DownloadProgress progress;
            progress.pack_id = request.pack_id;
            progress.downloaded = result.bytes;
            progress.status = DownloadStatus::Error;
            progress.error = result.error;
            on_progress(progress);
        }
        return result;
    });
}

void PackManager::cancel_download(const std::string& pack_id) {
    std::lock_guard<std::mutex> lock(downloads_->mutex);
    auto it = downloads_->active.find(pack_id);
    if (it == downloads_->active.end()) return;

    it->second->store(true);
    downloads_->active.erase(it);
    spdlog::info("canceled download of {}", pack_id);
}

bool PackManager::is_downloading(const std::string& pack_id) const {
    std::lock_guard<std::mutex> lock(downloads_->mutex);
    return downloads_->active.count(pack_id) != 0;
}

// ============================================================================
// Install
// ============================================================================

PackInstallationResult PackManager::install_pack(const std::string& pack_id,
                                                 const std::string& temp_path,
                                                 const PackManifest& manifest,
                                                 const ProgressCallback& on_progress) {
    PackInstallationResult result;
    result.pack_id = manifest.id;
    result.version = manifest.version;

    auto fail = [&](PackError kind, const std::string& error) {
        result.success = false;
        result.kind = kind;
        result.errors.insert(result.errors.begin(), error);
        report(on_progress, pack_id, DownloadStatus::Error, 0, error);
        spdlog::error("install of {} failed: {}", pack_id, error);
        return result;
    };

    report(on_progress, pack_id, DownloadStatus::Verifying, 0);

    if (!is_valid_pack_id(pack_id)) {
        return fail(PackError::BusinessRule, "Invalid pack id: " + pack_id);
    }

    // 1. Verify the downloaded bytes before anything else happens
    auto data = read_file_bytes(temp_path);
    if (!data.ok) {
        return fail(PackError::Filesystem, "Installation failed: " + data.error);
    }

    auto integrity = verifier_.verify_pack_integrity(data.data, manifest);
    result.warnings = integrity.warnings;
    if (!integrity.is_valid) {
        result.errors = integrity.errors;
        return fail(PackError::Integrity, "Pack verification failed");
    }

    if (manifest.id != pack_id) {
        return fail(PackError::BusinessRule,
                    "Manifest id " + manifest.id + " does not match pack id " + pack_id);
    }

    // 2. Unpack into a staging directory and validate the content
    if (!create_directories(config_.packs_dir)) {
        return fail(PackError::Filesystem,
                    "Installation failed: cannot create " + config_.packs_dir);
    }

    std::string staging_dir = join_path(config_.packs_dir, STAGING_PREFIX + generate_uuid());
    auto extracted = extract_pack_archive(data.data, staging_dir);
    if (!extracted.ok) {
        return fail(PackError::Schema, "Pack archive is invalid: " + extracted.error);
    }

    auto content = load_pack_content(staging_dir, manifest);
    auto validation = validate_entire_pack(manifest,
                                           content.content.questions,
                                           content.content.exam_templates,
                                           content.content.tips);
    auto media = validate_media_references(manifest, staging_dir);

    auto warnings = issue_strings(validation.warnings);
    auto media_warnings = issue_strings(media.warnings);
    result.warnings.insert(result.warnings.end(), warnings.begin(), warnings.end());
    result.warnings.insert(result.warnings.end(), media_warnings.begin(), media_warnings.end());

    if (!content.ok || !validation.is_valid || !media.is_valid) {
        auto load_errors = issue_strings(content.errors);
        auto content_errors = issue_strings(validation.errors);
        auto media_errors = issue_strings(media.errors);
        result.errors.insert(result.errors.end(), load_errors.begin(), load_errors.end());
        result.errors.insert(result.errors.end(), content_errors.begin(), content_errors.end());
        result.errors.insert(result.errors.end(), media_errors.begin(), media_errors.end());
        remove_directory(staging_dir);
        return fail(PackError::Schema, "Pack content validation failed");
    }

    report(on_progress, pack_id, DownloadStatus::Installing, 50);

    std::string pack_dir = pack_directory(pack_id);
    auto installed_version = read_installed_version(pack_dir);
    if (installed_version && is_downgrade(*installed_version, manifest.version)) {
        result.warnings.push_back("Installing version " + manifest.version +
                                  " over newer installed version " + *installed_version);
    }

    // 3-5. Backup, swap in the new directory, record metadata
    std::string backup_dir = pack_dir + BACKUP_MARKER + std::to_string(current_time_ms());
    bool has_backup = false;
    bool swapped = false;

    StepResult step;
    try {
        if (is_directory(pack_dir)) {
            auto moved = move_directory(pack_dir, backup_dir);
            if (!moved.ok) {
                throw std::runtime_error("failed to back up existing pack: " + moved.error);
            }
            has_backup = true;
        }

        auto moved_in = move_directory(staging_dir, pack_dir);
        if (!moved_in.ok) {
            throw std::runtime_error("failed to move pack into place: " + moved_in.error);
        }
        swapped = true;

        auto written = atomic_write_file(join_path(pack_dir, MANIFEST_FILE),
                                         serialize_manifest(manifest));
        if (!written.ok) {
            throw std::runtime_error("failed to write manifest: " + written.error);
        }

        PackMetadataRecord record;
        record.install_time = current_time_ms();
        record.checksum = manifest.checksum;
        record.signature = manifest.signature;
        record.verified = true;

        auto stored = store_.put(pack_id, record);
        if (!stored.ok) {
            throw std::runtime_error("failed to store pack metadata: " + stored.error);
        }
        step.ok = true;
    } catch (const std::exception& e) {
        step.error = e.what();
    }

    if (!step.ok) {
        // Rollback. pack_dir is only ours to delete once the new version
        // was moved into it; before that it still holds the old version.
        if (path_exists(staging_dir) && !remove_directory(staging_dir)) {
            spdlog::warn("rollback of {}: failed to remove {}", pack_id, staging_dir);
        }
        if (swapped && path_exists(pack_dir) && !remove_directory(pack_dir)) {
            spdlog::error("rollback of {}: failed to remove partial install", pack_id);
        }
        if (has_backup) {
            auto restored = move_directory(backup_dir, pack_dir);
            if (!restored.ok) {
                spdlog::error("rollback of {} failed, previous version left at {}: {}",
                              pack_id, backup_dir, restored.error);
                result.errors.push_back("Rollback failed, previous version left at " + backup_dir);
            } else {
                spdlog::info("rolled back {} to previous version", pack_id);
            }
        }
        return fail(PackError::Filesystem, "Installation failed: " + step.error);
    }

    // 6. Cleanup only after every step succeeded
    if (!remove_file(temp_path)) {
        spdlog::warn("failed to remove downloaded file {}", temp_path);
    }
    if (has_backup && !remove_directory(backup_dir)) {
        spdlog::warn("failed to remove backup {}", backup_dir);
    }

    report(on_progress, pack_id, DownloadStatus::Complete, 100);
    spdlog::info("installed pack {}@{}", pack_id, manifest.version);

    result.success = true;
    result.kind = PackError::None;
    return result;
}

// ============================================================================
// Uninstall and Queries
// ============================================================================

bool PackManager::uninstall_pack(const std::string& pack_id) {
    if (!is_valid_pack_id(pack_id)) {
        spdlog::error("failed to uninstall pack: invalid pack id {}", pack_id);
        return false;
    }

    std::string pack_dir = pack_directory(pack_id);
    if (path_exists(pack_dir) && !remove_directory(pack_dir)) {
        spdlog::error("failed to uninstall pack {}: cannot remove {}", pack_id, pack_dir);
        return false;
    }

    auto removed = store_.remove(pack_id);
    if (!removed.ok) {
        spdlog::error("failed to uninstall pack {}: {}", pack_id, removed.error);
        return false;
    }

    spdlog::info("uninstalled pack {}", pack_id);
    return true;
}

bool PackManager::is_pack_installed(const std::string& pack_id,
                                    const std::optional<std::string>& version) const {
    if (!is_valid_pack_id(pack_id)) return false;

    std::string pack_dir = pack_directory(pack_id);
    if (!is_regular_file(join_path(pack_dir, MANIFEST_FILE))) return false;
    if (!version) return true;

    auto installed = read_installed_version(pack_dir);
    return installed && *installed == *version;
}

std::optional<std::string> PackManager::get_installed_version(const std::string& pack_id) const {
    if (!is_valid_pack_id(pack_id)) return std::nullopt;
    return read_installed_version(pack_directory(pack_id));
}

StorageUsage PackManager::get_storage_usage() const {
    StorageUsage usage;

    for (const auto& name : list_directory(config_.packs_dir)) {
        if (!is_pack_dir_name(name)) continue;
        std::string dir = join_path(config_.packs_dir, name);
        if (!is_directory(dir)) continue;

        InstalledPackUsage pack;
        pack.id = name;
        pack.size = directory_size(dir);
        pack.version = read_installed_version(dir).value_or("unknown");
        usage.packs_size += pack.size;
        usage.packs.push_back(std::move(pack));
    }

    usage.temp_size = directory_size(config_.temp_dir);
    usage.total_size = usage.packs_size + usage.temp_size;
    return usage;
}

size_t PackManager::cleanup_temp_files() {
    size_t removed = 0;
    const auto max_age = std::chrono::hours(config_.temp_max_age_hours);

    auto sweep = [&](const std::string& dir, bool staging_only) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) return;

        const auto now = fs::file_time_type::clock::now();
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            const auto& entry = *it;
            std::string name = entry.path().filename().string();
            if (staging_only && name.rfind(STAGING_PREFIX, 0) != 0) continue;

            std::error_code entry_ec;
            auto mtime = fs::last_write_time(entry.path(), entry_ec);
            if (entry_ec) {
                spdlog::warn("cleanup: cannot stat {}: {}", entry.path().string(), entry_ec.message());
                continue;
            }
            if (now - mtime <= max_age) continue;

            if (staging_only) {
                fs::remove_all(entry.path(), entry_ec);
            } else if (entry.is_regular_file(entry_ec)) {
                fs::remove(entry.path(), entry_ec);
            } else {
                continue;
            }

            if (entry_ec) {
                spdlog::warn("cleanup: failed to remove {}: {}", entry.path().string(), entry_ec.message());
            } else {
                spdlog::debug("cleanup: removed {}", entry.path().string());
                ++removed;
            }
        }
        if (ec) {
            spdlog::error("failed to cleanup temp files in {}: {}", dir, ec.message());
        }
    };

    sweep(config_.temp_dir, false);
    sweep(config_.packs_dir, true);
    return removed;
}

std::vector<InstalledPack> PackManager::list_installed() const {
    std::vector<InstalledPack> packs;

    for (const auto& name : list_directory(config_.packs_dir)) {
        if (!is_pack_dir_name(name)) continue;
        std::string dir = join_path(config_.packs_dir, name);
        if (!is_regular_file(join_path(dir, MANIFEST_FILE))) continue;

        InstalledPack pack;
        pack.id = name;
        pack.version = read_installed_version(dir).value_or("unknown");
        pack.record = store_.get(name);
        packs.push_back(std::move(pack));
    }
    return packs;
}

IntegrityResult PackManager::verify_installed(const std::string& pack_id) const {
    IntegrityResult result;

    if (!is_valid_pack_id(pack_id)) {
        result.errors.push_back("invalid pack id: " + pack_id);
        return result;
    }

    auto parsed = read_manifest_file(join_path(pack_directory(pack_id), MANIFEST_FILE));
    if (!parsed.ok) {
        result.errors.push_back("installed manifest unreadable: " + parsed.error);
        return result;
    }

    auto record = store_.get(pack_id);
    if (!record) {
        result.errors.push_back("no metadata record for " + pack_id);
        return result;
    }

    if (!record->verified) {
        result.errors.push_back("metadata record is not marked verified");
    }
    if (parsed.manifest.checksum.size() != record->checksum.size() ||
        !std::equal(parsed.manifest.checksum.begin(), parsed.manifest.checksum.end(),
                    record->checksum.begin(),
                    [](char a, char b) { return std::tolower(static_cast<unsigned char>(a)) ==
                                                std::tolower(static_cast<unsigned char>(b)); })) {
        result.errors.push_back("installed manifest checksum differs from metadata record");
    }
    if (parsed.manifest.signature != record->signature) {
        result.errors.push_back("installed manifest signature differs from metadata record");
    }

    auto signature = verifier_.verify_signature(parsed.manifest);
    if (!signature.is_valid) {
        result.errors.push_back(signature.error);
    }

    result.is_valid = result.errors.empty();
    return result;
}

} // namespace exampack
