#include <doctest/doctest.h>
#include <exampack/downloader.hpp>
#include <exampack/pack_manager.hpp>
#include <exampack/platform.hpp>

#include "test_helpers.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>

using namespace exampack;
using namespace exampack::test;

namespace {

// Store whose writes can be made to fail on demand
class FlakyStore : public FileMetadataStore {
public:
    using FileMetadataStore::FileMetadataStore;

    StoreResult put(const std::string& pack_id, const PackMetadataRecord& record) override {
        if (fail_puts) {
            StoreResult result;
            result.error = "disk full";
            return result;
        }
        return FileMetadataStore::put(pack_id, record);
    }

    bool fail_puts = false;
};

// Manager whose directory moves can be made to fail on demand
class FlakyMoveManager : public PackManager {
public:
    using PackManager::PackManager;

    std::function<bool(const std::string& from, const std::string& to)> fail_move;

protected:
    AtomicWriteResult move_directory(const std::string& from, const std::string& to) override {
        if (fail_move && fail_move(from, to)) {
            AtomicWriteResult result;
            result.error = "permission denied: " + to;
            return result;
        }
        return PackManager::move_directory(from, to);
    }
};

bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

struct ManagerFixture {
    TempDir root;
    SigningKey key = generate_signing_key();
    PackManagerConfig config;
    PackVerifier verifier;
    FlakyStore store;
    FlakyMoveManager manager;

    ManagerFixture()
        : config(default_config(root.path())),
          verifier(std::vector<std::string>{key.public_key_hex}),
          store(config.registry_dir),
          manager(config, verifier, store) {
        REQUIRE(key.ok);
    }

    // Place archive bytes where a completed download would leave them
    std::string stage(const BuiltPack& pack) {
        REQUIRE(create_directories(config.temp_dir));
        std::string path = manager.download_path(pack.manifest.id);
        REQUIRE(atomic_write_file(path, pack.archive).ok);
        return path;
    }

    PackInstallationResult install(const BuiltPack& pack, const ProgressCallback& on_progress = {}) {
        return manager.install_pack(pack.manifest.id, stage(pack), pack.manifest, on_progress);
    }
};

std::map<std::string, std::string> snapshot(const std::string& dir) {
    std::map<std::string, std::string> files;
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file()) {
            auto rel = fs::relative(entry.path(), dir).generic_string();
            files[rel] = read_text_file(entry.path().string()).value_or("");
        }
    }
    return files;
}

size_t count_entries_with(const std::string& dir, const std::string& needle) {
    auto names = list_directory(dir);
    return static_cast<size_t>(std::count_if(names.begin(), names.end(), [&](const std::string& n) {
        return n.find(needle) != std::string::npos;
    }));
}

void age_path(const std::string& path, std::chrono::hours age) {
    fs::last_write_time(path, fs::file_time_type::clock::now() - age);
}

} // namespace

// ============================================================================
// Install
// ============================================================================

TEST_CASE("install places the pack and records metadata") {
    ManagerFixture f;
    auto pack = build_signed_pack("networking-basics", "1.0.0", f.key);

    std::vector<DownloadStatus> statuses;
    auto result = f.install(pack, [&](const DownloadProgress& p) { statuses.push_back(p.status); });

    REQUIRE(result.success);
    CHECK(result.kind == PackError::None);
    CHECK(result.pack_id == "networking-basics");
    CHECK(result.version == "1.0.0");
    CHECK(result.errors.empty());

    CHECK(f.manager.is_pack_installed("networking-basics"));
    CHECK(f.manager.is_pack_installed("networking-basics", std::string("1.0.0")));
    CHECK_FALSE(f.manager.is_pack_installed("networking-basics", std::string("2.0.0")));
    CHECK(f.manager.get_installed_version("networking-basics") == std::optional<std::string>("1.0.0"));

    std::string dir = f.manager.pack_directory("networking-basics");
    CHECK(is_regular_file(join_path(dir, "manifest.json")));
    CHECK(is_regular_file(join_path(dir, "questions.jsonl")));

    auto record = f.store.get("networking-basics");
    REQUIRE(record.has_value());
    CHECK(record->verified);
    CHECK(record->checksum == pack.manifest.checksum);

    // temp artifact removed, nothing transient left behind
    CHECK_FALSE(path_exists(f.manager.download_path("networking-basics")));
    CHECK(count_entries_with(f.config.packs_dir, "_backup_") == 0);
    CHECK(count_entries_with(f.config.packs_dir, ".staging-") == 0);

    REQUIRE(statuses.size() == 3);
    CHECK(statuses[0] == DownloadStatus::Verifying);
    CHECK(statuses[1] == DownloadStatus::Installing);
    CHECK(statuses[2] == DownloadStatus::Complete);
}

TEST_CASE("install progress carries percentages without byte counts") {
    ManagerFixture f;
    std::vector<DownloadProgress> events;
    auto result = f.install(build_signed_pack("networking-basics", "1.0.0", f.key),
                            [&](const DownloadProgress& p) { events.push_back(p); });

    REQUIRE(result.success);
    REQUIRE(events.size() == 3);
    CHECK(events[1].percentage == 50);
    CHECK(events[2].percentage == 100);
    for (const auto& e : events) {
        CHECK(e.pack_id == "networking-basics");
        CHECK(e.downloaded == 0);
        CHECK(e.total == 0);
    }
}

TEST_CASE("upgrade replaces the previous version") {
    ManagerFixture f;
    REQUIRE(f.install(build_signed_pack("networking-basics", "1.0.0", f.key, 2)).success);
    REQUIRE(f.install(build_signed_pack("networking-basics", "1.1.0", f.key, 5)).success);

    CHECK(f.manager.get_installed_version("networking-basics") == std::optional<std::string>("1.1.0"));
    CHECK(count_entries_with(f.config.packs_dir, "_backup_") == 0);
}

TEST_CASE("downgrade installs with a warning") {
    ManagerFixture f;
    REQUIRE(f.install(build_signed_pack("networking-basics", "2.0.0", f.key)).success);

    auto result = f.install(build_signed_pack("networking-basics", "1.0.0", f.key));
    REQUIRE(result.success);
    CHECK(std::any_of(result.warnings.begin(), result.warnings.end(), [](const std::string& w) {
        return w.find("over newer installed version 2.0.0") != std::string::npos;
    }));
}

TEST_CASE("integrity failure leaves the installed pack byte-identical") {
    ManagerFixture f;
    REQUIRE(f.install(build_signed_pack("networking-basics", "1.0.0", f.key)).success);
    std::string dir = f.manager.pack_directory("networking-basics");
    auto before = snapshot(dir);

    auto update = build_signed_pack("networking-basics", "2.0.0", f.key);
    update.archive.back() ^= 0xFF;

    std::vector<DownloadProgress> events;
    auto result = f.install(update, [&](const DownloadProgress& p) { events.push_back(p); });

    CHECK_FALSE(result.success);
    CHECK(result.kind == PackError::Integrity);
    REQUIRE(result.errors.size() >= 2);
    CHECK(result.errors[0] == "Pack verification failed");
    CHECK(result.errors[1].find("Checksum mismatch") == 0);

    CHECK(snapshot(dir) == before);
    CHECK(f.manager.get_installed_version("networking-basics") == std::optional<std::string>("1.0.0"));
    CHECK(count_entries_with(f.config.packs_dir, ".staging-") == 0);

    REQUIRE_FALSE(events.empty());
    CHECK(events.back().status == DownloadStatus::Error);
    CHECK(events.back().error == std::optional<std::string>("Pack verification failed"));
}

TEST_CASE("untrusted signer is rejected") {
    ManagerFixture f;
    auto other = generate_signing_key();
    REQUIRE(other.ok);

    auto result = f.install(build_signed_pack("networking-basics", "1.0.0", other));
    CHECK_FALSE(result.success);
    CHECK(result.kind == PackError::Integrity);
    CHECK_FALSE(f.manager.is_pack_installed("networking-basics"));
    CHECK_FALSE(path_exists(f.manager.pack_directory("networking-basics")));
}

TEST_CASE("manifest id must match the requested pack id") {
    ManagerFixture f;
    auto pack = build_signed_pack("other-pack", "1.0.0", f.key);

    auto result = f.manager.install_pack("networking-basics", f.stage(pack), pack.manifest);
    CHECK_FALSE(result.success);
    CHECK(result.kind == PackError::BusinessRule);
    CHECK_FALSE(f.manager.is_pack_installed("networking-basics"));
}

TEST_CASE("invalid content is rejected before the pack directory is touched") {
    ManagerFixture f;
    REQUIRE(f.install(build_signed_pack("networking-basics", "1.0.0", f.key)).success);
    auto before = snapshot(f.manager.pack_directory("networking-basics"));

    auto questions = sample_questions(2);
    questions.push_back(sample_question("q1"));
    auto pack = sign_pack(sample_manifest("networking-basics", "2.0.0"), pack_entries(questions), f.key);

    auto result = f.install(pack);
    CHECK_FALSE(result.success);
    CHECK(result.kind == PackError::Schema);
    REQUIRE(result.errors.size() >= 2);
    CHECK(result.errors[0] == "Pack content validation failed");
    CHECK(result.errors[1].find("Duplicate question ID: q1") != std::string::npos);

    CHECK(snapshot(f.manager.pack_directory("networking-basics")) == before);
    CHECK(count_entries_with(f.config.packs_dir, ".staging-") == 0);
}

TEST_CASE("archive that is not a pack is rejected") {
    ManagerFixture f;
    BuiltPack pack;
    pack.archive = to_bytes(std::string(2048, 'z'));
    auto manifest = sample_manifest();
    manifest.checksum = compute_sha256(pack.archive).hex_digest;
    manifest.signature = sign_manifest(manifest, f.key.private_key_hex).signature_hex;
    pack.manifest = manifest;

    auto result = f.install(pack);
    CHECK_FALSE(result.success);
    CHECK(result.kind == PackError::Schema);
    CHECK(result.errors[0].find("Pack archive is invalid") == 0);
}

TEST_CASE("missing temp artifact is a filesystem error") {
    ManagerFixture f;
    auto pack = build_signed_pack("networking-basics", "1.0.0", f.key);
    auto result = f.manager.install_pack("networking-basics", f.root.file("nope.zip"), pack.manifest);
    CHECK_FALSE(result.success);
    CHECK(result.kind == PackError::Filesystem);
}

// ============================================================================
// Rollback
// ============================================================================

TEST_CASE("failure after the swap restores the previous version") {
    ManagerFixture f;
    REQUIRE(f.install(build_signed_pack("networking-basics", "1.0.0", f.key)).success);
    std::string dir = f.manager.pack_directory("networking-basics");
    auto before = snapshot(dir);
    auto record_before = f.store.get("networking-basics");

    f.store.fail_puts = true;
    auto result = f.install(build_signed_pack("networking-basics", "2.0.0", f.key, 4));

    CHECK_FALSE(result.success);
    CHECK(result.kind == PackError::Filesystem);
    REQUIRE_FALSE(result.errors.empty());
    CHECK(result.errors[0].find("Installation failed") == 0);
    CHECK(result.errors[0].find("disk full") != std::string::npos);

    CHECK(snapshot(dir) == before);
    CHECK(f.manager.get_installed_version("networking-basics") == std::optional<std::string>("1.0.0"));
    CHECK(count_entries_with(f.config.packs_dir, "_backup_") == 0);
    CHECK(count_entries_with(f.config.packs_dir, ".staging-") == 0);

    auto record_after = f.store.get("networking-basics");
    REQUIRE(record_after.has_value());
    CHECK(record_after->install_time == record_before->install_time);
}

TEST_CASE("failure on a fresh install leaves the pack absent") {
    ManagerFixture f;
    f.store.fail_puts = true;

    auto result = f.install(build_signed_pack("networking-basics", "1.0.0", f.key));
    CHECK_FALSE(result.success);
    CHECK_FALSE(f.manager.is_pack_installed("networking-basics"));
    CHECK_FALSE(path_exists(f.manager.pack_directory("networking-basics")));
    CHECK(list_directory(f.config.packs_dir).empty());
}

TEST_CASE("failed backup rename leaves the installed version untouched") {
    ManagerFixture f;
    REQUIRE(f.install(build_signed_pack("networking-basics", "1.0.0", f.key)).success);
    std::string dir = f.manager.pack_directory("networking-basics");
    auto before = snapshot(dir);
    auto record_before = f.store.get("networking-basics");

    f.manager.fail_move = [](const std::string&, const std::string& to) {
        return contains(to, "_backup_");
    };
    auto result = f.install(build_signed_pack("networking-basics", "2.0.0", f.key, 4));

    CHECK_FALSE(result.success);
    CHECK(result.kind == PackError::Filesystem);
    REQUIRE_FALSE(result.errors.empty());
    CHECK(contains(result.errors[0], "failed to back up existing pack"));

    REQUIRE(is_directory(dir));
    CHECK(snapshot(dir) == before);
    CHECK(f.manager.get_installed_version("networking-basics") == std::optional<std::string>("1.0.0"));
    CHECK(f.manager.verify_installed("networking-basics").is_valid);
    CHECK(count_entries_with(f.config.packs_dir, "_backup_") == 0);
    CHECK(count_entries_with(f.config.packs_dir, ".staging-") == 0);

    auto record_after = f.store.get("networking-basics");
    REQUIRE(record_after.has_value());
    CHECK(record_after->install_time == record_before->install_time);
}

TEST_CASE("failed swap restores the previous version from backup") {
    ManagerFixture f;
    REQUIRE(f.install(build_signed_pack("networking-basics", "1.0.0", f.key)).success);
    std::string dir = f.manager.pack_directory("networking-basics");
    auto before = snapshot(dir);

    f.manager.fail_move = [](const std::string& from, const std::string&) {
        return contains(from, ".staging-");
    };
    auto result = f.install(build_signed_pack("networking-basics", "2.0.0", f.key, 4));

    CHECK_FALSE(result.success);
    REQUIRE_FALSE(result.errors.empty());
    CHECK(contains(result.errors[0], "failed to move pack into place"));

    CHECK(snapshot(dir) == before);
    CHECK(f.manager.get_installed_version("networking-basics") == std::optional<std::string>("1.0.0"));
    CHECK(count_entries_with(f.config.packs_dir, "_backup_") == 0);
    CHECK(count_entries_with(f.config.packs_dir, ".staging-") == 0);
}

TEST_CASE("failed swap on a fresh install leaves the pack absent") {
    ManagerFixture f;
    f.manager.fail_move = [](const std::string& from, const std::string&) {
        return contains(from, ".staging-");
    };

    auto result = f.install(build_signed_pack("networking-basics", "1.0.0", f.key));
    CHECK_FALSE(result.success);
    CHECK_FALSE(f.manager.is_pack_installed("networking-basics"));
    CHECK(list_directory(f.config.packs_dir).empty());
    CHECK_FALSE(f.store.get("networking-basics").has_value());
}

TEST_CASE("failed restore reports where the previous version was left") {
    ManagerFixture f;
    REQUIRE(f.install(build_signed_pack("networking-basics", "1.0.0", f.key)).success);

    f.store.fail_puts = true;
    f.manager.fail_move = [](const std::string& from, const std::string&) {
        return contains(from, "_backup_");
    };
    auto result = f.install(build_signed_pack("networking-basics", "2.0.0", f.key, 4));

    CHECK_FALSE(result.success);
    CHECK(std::any_of(result.errors.begin(), result.errors.end(), [](const std::string& e) {
        return contains(e, "Rollback failed, previous version left at");
    }));
    CHECK(count_entries_with(f.config.packs_dir, "_backup_") == 1);
    CHECK(f.manager.list_installed().empty());
}

// ============================================================================
// Uninstall and Queries
// ============================================================================

TEST_CASE("uninstall is idempotent") {
    ManagerFixture f;
    REQUIRE(f.install(build_signed_pack("networking-basics", "1.0.0", f.key)).success);

    CHECK(f.manager.uninstall_pack("networking-basics"));
    CHECK_FALSE(f.manager.is_pack_installed("networking-basics"));
    CHECK_FALSE(f.store.get("networking-basics").has_value());

    CHECK(f.manager.uninstall_pack("networking-basics"));
    CHECK(f.manager.uninstall_pack("never-installed"));
    CHECK_FALSE(f.manager.uninstall_pack("../escape"));
}

TEST_CASE("list_installed reports versions and records") {
    ManagerFixture f;
    REQUIRE(f.install(build_signed_pack("alpha", "1.0.0", f.key)).success);
    REQUIRE(f.install(build_signed_pack("beta", "3.2.1", f.key)).success);
    fs::create_directories(f.config.packs_dir + "/.staging-leftover");

    auto packs = f.manager.list_installed();
    REQUIRE(packs.size() == 2);
    CHECK(packs[0].id == "alpha");
    CHECK(packs[1].id == "beta");
    CHECK(packs[1].version == "3.2.1");
    CHECK(packs[1].record.has_value());
}

TEST_CASE("storage usage sums installed packs and temp files") {
    ManagerFixture f;
    REQUIRE(f.install(build_signed_pack("alpha", "1.0.0", f.key, 3)).success);
    REQUIRE(f.install(build_signed_pack("beta", "1.0.0", f.key, 8)).success);
    write_text(join_path(f.config.temp_dir, "pending.zip"), std::string(500, 'x'));
    write_text(join_path(f.config.packs_dir, "alpha_backup_123/questions.jsonl"), "stale");

    auto usage = f.manager.get_storage_usage();
    uint64_t alpha = directory_size(f.manager.pack_directory("alpha"));
    uint64_t beta = directory_size(f.manager.pack_directory("beta"));

    CHECK(usage.packs_size == alpha + beta);
    CHECK(usage.temp_size == 500);
    CHECK(usage.total_size == alpha + beta + 500);
    REQUIRE(usage.packs.size() == 2);
    CHECK(usage.packs[0].id == "alpha");
    CHECK(usage.packs[0].version == "1.0.0");
    CHECK(usage.packs[1].size == beta);
}

TEST_CASE("a pack id that looks like a backup is still a pack") {
    ManagerFixture f;
    REQUIRE(f.install(build_signed_pack("exam_backup_2024", "1.0.0", f.key)).success);

    auto usage = f.manager.get_storage_usage();
    REQUIRE(usage.packs.size() == 1);
    CHECK(usage.packs[0].id == "exam_backup_2024");
    CHECK(usage.packs_size == directory_size(f.manager.pack_directory("exam_backup_2024")));
    CHECK(usage.packs_size > 0);

    auto packs = f.manager.list_installed();
    REQUIRE(packs.size() == 1);
    CHECK(packs[0].id == "exam_backup_2024");
}

TEST_CASE("storage usage reports unknown version for unreadable manifests") {
    ManagerFixture f;
    write_text(join_path(f.config.packs_dir, "broken/manifest.json"), "{oops");

    auto usage = f.manager.get_storage_usage();
    REQUIRE(usage.packs.size() == 1);
    CHECK(usage.packs[0].version == "unknown");
}

TEST_CASE("verify_installed cross-checks manifest and record") {
    ManagerFixture f;
    auto pack = build_signed_pack("networking-basics", "1.0.0", f.key);
    REQUIRE(f.install(pack).success);

    CHECK(f.manager.verify_installed("networking-basics").is_valid);

    SUBCASE("edited manifest") {
        auto edited = pack.manifest;
        edited.checksum = std::string(64, 'f');
        REQUIRE(atomic_write_file(join_path(f.manager.pack_directory("networking-basics"), "manifest.json"),
                                  serialize_manifest(edited)).ok);
        auto result = f.manager.verify_installed("networking-basics");
        CHECK_FALSE(result.is_valid);
        CHECK(std::find(result.errors.begin(), result.errors.end(),
                        "installed manifest checksum differs from metadata record") != result.errors.end());
    }

    SUBCASE("missing record") {
        REQUIRE(f.store.remove("networking-basics").ok);
        CHECK_FALSE(f.manager.verify_installed("networking-basics").is_valid);
    }
}

TEST_CASE("compatibility uses the configured app version") {
    ManagerFixture f;
    auto manifest = sample_manifest();
    manifest.min_app_version = "2.0.0";

    CHECK_FALSE(f.manager.check_compatibility(manifest).compatible);
    CHECK(f.manager.check_compatibility(manifest, "2.0.0").compatible);
}

// ============================================================================
// Download
// ============================================================================

TEST_CASE("download from a file url then install") {
    ManagerFixture f;
    auto pack = build_signed_pack("networking-basics", "1.0.0", f.key);
    TempDir source;
    std::string archive_path = write_archive(source, "networking-basics.pack", pack.archive);

    std::mutex mutex;
    std::vector<DownloadProgress> events;
    auto future = f.manager.download_pack("networking-basics", "file://" + archive_path,
                                          [&](const DownloadProgress& p) {
                                              std::lock_guard<std::mutex> lock(mutex);
                                              events.push_back(p);
                                          });
    auto result = future.get();

    REQUIRE(result.ok);
    CHECK(result.kind == PackError::None);
    CHECK(result.temp_path == f.manager.download_path("networking-basics"));
    CHECK(result.bytes == pack.archive.size());
    CHECK_FALSE(f.manager.is_downloading("networking-basics"));
    for (const auto& e : events) {
        CHECK(e.status == DownloadStatus::Downloading);
        CHECK(e.pack_id == "networking-basics");
    }

    auto installed = f.manager.install_pack("networking-basics", result.temp_path, pack.manifest);
    CHECK(installed.success);
}

TEST_CASE("download failures are reported through the future") {
    ManagerFixture f;

    SUBCASE("invalid id") {
        auto result = f.manager.download_pack("../x", "https://example.invalid/p.pack").get();
        CHECK_FALSE(result.ok);
        CHECK(result.kind == PackError::BusinessRule);
    }

    SUBCASE("missing source file") {
        std::optional<DownloadProgress> last;
        auto result = f.manager.download_pack("networking-basics",
                                              "file://" + f.root.file("missing.pack"),
                                              [&](const DownloadProgress& p) { last = p; }).get();
        CHECK_FALSE(result.ok);
        CHECK(result.kind == PackError::Network);
        REQUIRE(last.has_value());
        CHECK(last->status == DownloadStatus::Error);
        CHECK_FALSE(path_exists(f.manager.download_path("networking-basics")));
    }

    SUBCASE("plain http is refused by default") {
        auto result = f.manager.download_pack("networking-basics", "http://example.invalid/p.pack").get();
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("plain http") == 0);
    }
}

TEST_CASE("cancel of an unknown download is a no-op") {
    ManagerFixture f;
    f.manager.cancel_download("nothing-in-flight");
    CHECK_FALSE(f.manager.is_downloading("nothing-in-flight"));
}

TEST_CASE("a canceled transfer never produces the destination file") {
    TempDir dir;
    auto source = write_archive(dir, "source.pack", to_bytes(std::string(4096, 'p')));

    DownloadRequest request;
    request.pack_id = "networking-basics";
    request.url = "file://" + source;
    request.dest_path = dir.file("tmp/networking-basics.zip");

    auto cancel = std::make_shared<std::atomic<bool>>(true);
    auto result = download_to_file(request, cancel, {});

    CHECK_FALSE(result.ok);
    CHECK(result.kind == PackError::Canceled);
    CHECK(result.error == "Download canceled");
    CHECK_FALSE(path_exists(request.dest_path));
}

TEST_CASE("check_download_url scheme policy") {
    CHECK(check_download_url("https://packs.example.com/a.pack", false).empty());
    CHECK(check_download_url("file:///tmp/a.pack", false).empty());
    CHECK_FALSE(check_download_url("http://packs.example.com/a.pack", false).empty());
    CHECK(check_download_url("http://packs.example.com/a.pack", true).empty());
    CHECK_FALSE(check_download_url("ftp://packs.example.com/a.pack", true).empty());
}

// ============================================================================
// Temp Cleanup
// ============================================================================

TEST_CASE("cleanup removes only stale temp files and staging dirs") {
    ManagerFixture f;
    std::string fresh = join_path(f.config.temp_dir, "fresh.zip");
    std::string stale = join_path(f.config.temp_dir, "stale.zip.abc.part");
    std::string stale_staging = join_path(f.config.packs_dir, ".staging-old");
    std::string fresh_staging = join_path(f.config.packs_dir, ".staging-new");
    write_text(fresh, "fresh");
    write_text(stale, "stale");
    fs::create_directories(stale_staging);
    fs::create_directories(fresh_staging);
    age_path(stale, std::chrono::hours(48));
    age_path(stale_staging, std::chrono::hours(48));

    CHECK(f.manager.cleanup_temp_files() == 2);
    CHECK(path_exists(fresh));
    CHECK(path_exists(fresh_staging));
    CHECK_FALSE(path_exists(stale));
    CHECK_FALSE(path_exists(stale_staging));
}

TEST_CASE("cleanup with nothing to do") {
    ManagerFixture f;
    CHECK(f.manager.cleanup_temp_files() == 0);
    write_text(join_path(f.config.temp_dir, "fresh.zip"), "fresh");
    CHECK(f.manager.cleanup_temp_files() == 0);
}
