#include "exampack/metadata_store.hpp"
#include "exampack/manifest.hpp"
#include "exampack/platform.hpp"

#include <spdlog/spdlog.h>

namespace exampack {

namespace {

constexpr const char* RECORD_SUFFIX = ".json";

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

nlohmann::json metadata_record_to_json(const PackMetadataRecord& record) {
    nlohmann::json j;
    j["installTime"] = record.install_time;
    j["checksum"] = record.checksum;
    j["signature"] = record.signature;
    j["verified"] = record.verified;
    return j;
}

std::optional<PackMetadataRecord> parse_metadata_record(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;

    auto install_time = j.find("installTime");
    auto checksum = j.find("checksum");
    auto signature = j.find("signature");
    auto verified = j.find("verified");

    if (install_time == j.end() || !install_time->is_number_integer() ||
        checksum == j.end() || !checksum->is_string() ||
        signature == j.end() || !signature->is_string() ||
        verified == j.end() || !verified->is_boolean()) {
        return std::nullopt;
    }

    PackMetadataRecord record;
    record.install_time = install_time->get<int64_t>();
    record.checksum = checksum->get<std::string>();
    record.signature = signature->get<std::string>();
    record.verified = verified->get<bool>();
    return record;
}

// ============================================================================
// FileMetadataStore
// ============================================================================

FileMetadataStore::FileMetadataStore(std::string registry_dir)
    : registry_dir_(std::move(registry_dir)) {}

std::string FileMetadataStore::record_path(const std::string& pack_id) const {
    return join_path(registry_dir_, pack_id + RECORD_SUFFIX);
}

StoreResult FileMetadataStore::put(const std::string& pack_id, const PackMetadataRecord& record) {
    StoreResult result;

    if (!is_valid_pack_id(pack_id)) {
        result.error = "invalid pack id: " + pack_id;
        return result;
    }

    if (!create_directories(registry_dir_)) {
        result.error = "failed to create registry directory: " + registry_dir_;
        return result;
    }

    auto write = atomic_write_file(record_path(pack_id),
                                   metadata_record_to_json(record).dump(2) + "\n");
    if (!write.ok) {
        result.error = "failed to write metadata record: " + write.error;
        return result;
    }

    spdlog::debug("stored metadata record for {}", pack_id);
    result.ok = true;
    return result;
}

std::optional<PackMetadataRecord> FileMetadataStore::get(const std::string& pack_id) const {
    if (!is_valid_pack_id(pack_id)) return std::nullopt;

    auto text = read_text_file(record_path(pack_id));
    if (!text) return std::nullopt;

    auto j = nlohmann::json::parse(*text, nullptr, false);
    if (j.is_discarded()) {
        spdlog::warn("metadata record for {} is not valid JSON", pack_id);
        return std::nullopt;
    }

    auto record = parse_metadata_record(j);
    if (!record) {
        spdlog::warn("metadata record for {} is malformed", pack_id);
    }
    return record;
}

StoreResult FileMetadataStore::remove(const std::string& pack_id) {
    StoreResult result;

    if (!is_valid_pack_id(pack_id)) {
        result.error = "invalid pack id: " + pack_id;
        return result;
    }

    std::string path = record_path(pack_id);
    if (path_exists(path) && !remove_file(path)) {
        result.error = "failed to remove metadata record: " + path;
        return result;
    }

    result.ok = true;
    return result;
}

std::vector<std::string> FileMetadataStore::list() const {
    std::vector<std::string> ids;
    for (const auto& name : list_directory(registry_dir_)) {
        if (!ends_with(name, RECORD_SUFFIX)) continue;
        std::string id = name.substr(0, name.size() - std::string(RECORD_SUFFIX).size());
        if (is_valid_pack_id(id)) {
            ids.push_back(id);
        }
    }
    return ids;
}

} // namespace exampack
