#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace exampack {

// ============================================================================
// Pack Metadata Records
// ============================================================================
//
// One record per installed pack, kept apart from the pack directory so that
// an installed manifest.json can be cross-checked against what was verified
// at install time.

struct PackMetadataRecord {
    int64_t install_time = 0;  // epoch milliseconds
    std::string checksum;
    std::string signature;
    bool verified = false;
};

nlohmann::json metadata_record_to_json(const PackMetadataRecord& record);

// nullopt when a required field is missing or has the wrong type
std::optional<PackMetadataRecord> parse_metadata_record(const nlohmann::json& j);

struct StoreResult {
    bool ok = false;
    std::string error;
};

class MetadataStore {
public:
    virtual ~MetadataStore() = default;

    virtual StoreResult put(const std::string& pack_id, const PackMetadataRecord& record) = 0;
    virtual std::optional<PackMetadataRecord> get(const std::string& pack_id) const = 0;

    // Removing an absent record succeeds
    virtual StoreResult remove(const std::string& pack_id) = 0;

    // Pack ids with a stored record, sorted
    virtual std::vector<std::string> list() const = 0;
};

// Stores <registry_dir>/<pack_id>.json, written with atomic_write_file
class FileMetadataStore : public MetadataStore {
public:
    explicit FileMetadataStore(std::string registry_dir);

    StoreResult put(const std::string& pack_id, const PackMetadataRecord& record) override;
    std::optional<PackMetadataRecord> get(const std::string& pack_id) const override;
    StoreResult remove(const std::string& pack_id) override;
    std::vector<std::string> list() const override;

    const std::string& registry_dir() const { return registry_dir_; }

private:
    std::string record_path(const std::string& pack_id) const;

    std::string registry_dir_;
};

} // namespace exampack
