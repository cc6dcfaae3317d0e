#include "exampack/archive.hpp"
#include "exampack/platform.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <zlib.h>

namespace fs = std::filesystem;

namespace exampack {

// ============================================================================
// Tar Format Constants (POSIX ustar)
// ============================================================================

static constexpr size_t TAR_BLOCK_SIZE = 512;
static constexpr size_t TAR_NAME_SIZE = 100;
static constexpr size_t TAR_PREFIX_SIZE = 155;

static constexpr char TAR_REGTYPE = '0';
static constexpr char TAR_AREGTYPE = '\0';
static constexpr char TAR_LNKTYPE = '1';
static constexpr char TAR_SYMTYPE = '2';
static constexpr char TAR_DIRTYPE = '5';

// Upper bound on the inflated size of a pack; guards against gzip bombs
static constexpr size_t MAX_INFLATED_SIZE = size_t(1) << 31;

#pragma pack(push, 1)
struct TarHeader {
    char name[TAR_NAME_SIZE];       // 0
    char mode[8];                   // 100
    char uid[8];                    // 108
    char gid[8];                    // 116
    char size[12];                  // 124
    char mtime[12];                 // 136
    char chksum[8];                 // 148
    char typeflag;                  // 156
    char linkname[100];             // 157
    char magic[6];                  // 257
    char version[2];                // 263
    char uname[32];                 // 265
    char gname[32];                 // 297
    char devmajor[8];               // 329
    char devminor[8];               // 337
    char prefix[TAR_PREFIX_SIZE];   // 345
    char padding[12];               // 500
};
#pragma pack(pop)

static_assert(sizeof(TarHeader) == TAR_BLOCK_SIZE, "TarHeader must be 512 bytes");

// ============================================================================
// Header Helpers
// ============================================================================

static void write_octal(char* dest, size_t size, uint64_t value) {
    size_t digits = size - 1;
    dest[digits] = '\0';
    for (size_t i = digits; i > 0; --i) {
        dest[i - 1] = static_cast<char>('0' + (value & 7));
        value >>= 3;
    }
}

static uint64_t parse_octal(const char* data, size_t size) {
    uint64_t result = 0;
    size_t i = 0;
    while (i < size && data[i] == ' ') ++i;
    for (; i < size && data[i] >= '0' && data[i] <= '7'; ++i) {
        result = (result << 3) | static_cast<uint64_t>(data[i] - '0');
    }
    return result;
}

static uint32_t header_checksum(const TarHeader& header) {
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&header);
    uint32_t sum = 0;
    for (size_t i = 0; i < sizeof(TarHeader); ++i) {
        // chksum field counts as spaces
        sum += (i >= 148 && i < 156) ? static_cast<uint32_t>(' ') : bytes[i];
    }
    return sum;
}

static bool split_ustar_path(const std::string& path, TarHeader& header) {
    if (path.size() < TAR_NAME_SIZE) {
        std::memcpy(header.name, path.data(), path.size());
        return true;
    }

    size_t split = path.rfind('/', path.size() - 2);
    while (split != std::string::npos) {
        std::string prefix = path.substr(0, split);
        std::string name = path.substr(split + 1);
        if (prefix.size() < TAR_PREFIX_SIZE && name.size() < TAR_NAME_SIZE) {
            std::memcpy(header.prefix, prefix.data(), prefix.size());
            std::memcpy(header.name, name.data(), name.size());
            return true;
        }
        if (split == 0) break;
        split = path.rfind('/', split - 1);
    }
    return false;
}

static bool make_tar_header(const ArchiveEntry& entry, TarHeader& header, std::string& error) {
    std::memset(&header, 0, sizeof(header));

    std::string path = entry.path;
    if (entry.type == ArchiveEntryType::Directory && !path.empty() && path.back() != '/') {
        path += '/';
    }

    if (!split_ustar_path(path, header)) {
        error = "path too long for ustar: " + entry.path;
        return false;
    }

    bool is_dir = entry.type == ArchiveEntryType::Directory;
    write_octal(header.mode, sizeof(header.mode), is_dir ? 0755 : 0644);
    write_octal(header.uid, sizeof(header.uid), 0);
    write_octal(header.gid, sizeof(header.gid), 0);
    write_octal(header.size, sizeof(header.size), is_dir ? 0 : entry.data.size());
    write_octal(header.mtime, sizeof(header.mtime), 0);
    header.typeflag = is_dir ? TAR_DIRTYPE : TAR_REGTYPE;

    std::memcpy(header.magic, "ustar", 6);
    header.version[0] = '0';
    header.version[1] = '0';

    // 6 octal digits + NUL + space
    char chksum_str[8];
    std::snprintf(chksum_str, sizeof(chksum_str), "%06o", header_checksum(header));
    std::memcpy(header.chksum, chksum_str, 6);
    header.chksum[6] = '\0';
    header.chksum[7] = ' ';
    return true;
}

// ============================================================================
// Gzip
// ============================================================================

// Deterministic gzip: mtime=0, no original filename, OS=255
static std::vector<uint8_t> gzip_compress(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> result = {
        0x1f, 0x8b,             // magic
        0x08,                   // deflate
        0x00,                   // flags
        0x00, 0x00, 0x00, 0x00, // mtime
        0x00,                   // extra flags
        0xff                    // OS unknown
    };

    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    // Raw deflate; header and trailer are written by hand
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return {};
    }

    std::vector<uint8_t> compressed(deflateBound(&strm, static_cast<uLong>(data.size())));
    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = compressed.data();
    strm.avail_out = static_cast<uInt>(compressed.size());

    int ret = deflate(&strm, Z_FINISH);
    uLong produced = strm.total_out;
    deflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        return {};
    }

    result.insert(result.end(), compressed.begin(), compressed.begin() + static_cast<long>(produced));

    uint32_t crc = static_cast<uint32_t>(crc32(0, data.data(), static_cast<uInt>(data.size())));
    uint32_t size = static_cast<uint32_t>(data.size());
    for (int shift = 0; shift < 32; shift += 8) result.push_back(static_cast<uint8_t>((crc >> shift) & 0xff));
    for (int shift = 0; shift < 32; shift += 8) result.push_back(static_cast<uint8_t>((size >> shift) & 0xff));

    return result;
}

static bool gzip_decompress(const std::vector<uint8_t>& data,
                            std::vector<uint8_t>& out,
                            std::string& error) {
    if (data.size() < 18 || data[0] != 0x1f || data[1] != 0x8b) {
        error = "not a gzip stream";
        return false;
    }

    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    // 16 + MAX_WBITS: let zlib parse and check the gzip header and trailer
    if (inflateInit2(&strm, 16 + MAX_WBITS) != Z_OK) {
        error = "inflateInit2 failed";
        return false;
    }

    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());

    out.clear();
    uint8_t chunk[64 * 1024];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        strm.next_out = chunk;
        strm.avail_out = sizeof(chunk);
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            error = std::string("corrupt gzip stream: ") + (strm.msg ? strm.msg : "inflate failed");
            inflateEnd(&strm);
            return false;
        }
        size_t produced = sizeof(chunk) - strm.avail_out;
        if (out.size() + produced > MAX_INFLATED_SIZE) {
            error = "archive exceeds maximum inflated size";
            inflateEnd(&strm);
            return false;
        }
        out.insert(out.end(), chunk, chunk + produced);
        if (ret == Z_OK && strm.avail_in == 0 && produced == 0) {
            error = "truncated gzip stream";
            inflateEnd(&strm);
            return false;
        }
    }

    inflateEnd(&strm);
    return true;
}

// ============================================================================
// Archive Creation
// ============================================================================

// Lexicographic by path; directories sort before files sharing their parent
static bool entry_less(const ArchiveEntry& a, const ArchiveEntry& b) {
    std::string path_a = a.path;
    std::string path_b = b.path;
    if (a.type == ArchiveEntryType::Directory && !path_a.empty() && path_a.back() != '/') path_a += '/';
    if (b.type == ArchiveEntryType::Directory && !path_b.empty() && path_b.back() != '/') path_b += '/';

    size_t slash_a = path_a.rfind('/', path_a.size() >= 2 ? path_a.size() - 2 : 0);
    size_t slash_b = path_b.rfind('/', path_b.size() >= 2 ? path_b.size() - 2 : 0);
    std::string parent_a = slash_a != std::string::npos ? path_a.substr(0, slash_a + 1) : "";
    std::string parent_b = slash_b != std::string::npos ? path_b.substr(0, slash_b + 1) : "";

    if (parent_a == parent_b) {
        bool dir_a = a.type == ArchiveEntryType::Directory;
        bool dir_b = b.type == ArchiveEntryType::Directory;
        if (dir_a != dir_b) return dir_a;
    }
    return path_a < path_b;
}

ArchiveResult create_pack_archive(const std::vector<ArchiveEntry>& entries) {
    ArchiveResult result;

    for (const auto& entry : entries) {
        if (entry.type == ArchiveEntryType::Symlink) {
            result.error = "symlinks are not permitted: " + entry.path;
            return result;
        }
        if (entry.type == ArchiveEntryType::Hardlink) {
            result.error = "hardlinks are not permitted: " + entry.path;
            return result;
        }
        if (entry.type == ArchiveEntryType::Other) {
            result.error = "unsupported entry type: " + entry.path;
            return result;
        }
    }

    std::vector<ArchiveEntry> sorted = entries;
    std::sort(sorted.begin(), sorted.end(), entry_less);

    std::vector<uint8_t> tar_data;
    for (const auto& entry : sorted) {
        TarHeader header;
        if (!make_tar_header(entry, header, result.error)) {
            return result;
        }
        const uint8_t* header_bytes = reinterpret_cast<const uint8_t*>(&header);
        tar_data.insert(tar_data.end(), header_bytes, header_bytes + TAR_BLOCK_SIZE);

        if (entry.type == ArchiveEntryType::RegularFile && !entry.data.empty()) {
            tar_data.insert(tar_data.end(), entry.data.begin(), entry.data.end());
            size_t padding = (TAR_BLOCK_SIZE - (entry.data.size() % TAR_BLOCK_SIZE)) % TAR_BLOCK_SIZE;
            tar_data.insert(tar_data.end(), padding, 0);
        }
    }

    // End-of-archive marker
    tar_data.insert(tar_data.end(), TAR_BLOCK_SIZE * 2, 0);

    result.archive_data = gzip_compress(tar_data);
    if (result.archive_data.empty()) {
        result.error = "gzip compression failed";
        return result;
    }

    result.ok = true;
    return result;
}

CollectResult collect_directory_entries(const std::string& dir_path) {
    CollectResult result;

    if (!is_directory(dir_path)) {
        result.error = "directory not found: " + dir_path;
        return result;
    }

    fs::path base_path(dir_path);

    try {
        for (const auto& entry : fs::recursive_directory_iterator(dir_path)) {
            std::string rel = to_portable_path(fs::relative(entry.path(), base_path).string());

            ArchiveEntry archive_entry;
            archive_entry.path = rel;

            if (entry.is_symlink()) {
                result.error = "symlinks are not permitted: " + rel;
                return result;
            }

            if (entry.is_directory()) {
                archive_entry.type = ArchiveEntryType::Directory;
            } else if (entry.is_regular_file()) {
                auto read = read_file_bytes(entry.path().string());
                if (!read.ok) {
                    result.error = read.error;
                    return result;
                }
                archive_entry.data = std::move(read.data);
            } else {
                result.error = "unsupported file type: " + rel;
                return result;
            }

            result.entries.push_back(std::move(archive_entry));
        }
    } catch (const fs::filesystem_error& e) {
        result.error = std::string("filesystem error: ") + e.what();
        return result;
    }

    result.ok = true;
    return result;
}

ArchiveResult pack_directory(const std::string& dir_path) {
    auto collected = collect_directory_entries(dir_path);
    if (!collected.ok) {
        ArchiveResult result;
        result.error = collected.error;
        return result;
    }
    return create_pack_archive(collected.entries);
}

// ============================================================================
// Extraction
// ============================================================================

PathValidation validate_extraction_path(const std::string& entry_path,
                                        const std::string& extraction_root) {
    PathValidation result;

    if (entry_path.empty()) {
        result.error = "empty path";
        return result;
    }

    if (entry_path[0] == '/' || entry_path[0] == '\\' ||
        (entry_path.size() > 1 && entry_path[1] == ':')) {
        result.error = "absolute path not allowed: " + entry_path;
        return result;
    }

    fs::path normalized;
    for (const auto& component : fs::path(entry_path)) {
        std::string comp = component.string();
        if (comp == "..") {
            result.error = "path traversal not allowed: " + entry_path;
            return result;
        }
        if (comp != "." && !comp.empty()) {
            normalized /= comp;
        }
    }

    if (normalized.empty()) {
        result.error = "empty path after normalization: " + entry_path;
        return result;
    }

    std::error_code ec;
    fs::path canonical_root = fs::weakly_canonical(extraction_root, ec);
    fs::path canonical_full = fs::weakly_canonical(fs::path(extraction_root) / normalized, ec);
    if (ec) {
        result.error = "cannot resolve path: " + entry_path;
        return result;
    }

    auto root_str = canonical_root.string();
    auto full_str = canonical_full.string();
    if (full_str.rfind(root_str, 0) != 0) {
        result.error = "path escapes extraction root: " + entry_path;
        return result;
    }

    result.safe = true;
    result.normalized_path = to_portable_path(normalized.string());
    return result;
}

ExtractResult extract_pack_archive(const std::vector<uint8_t>& archive_data,
                                   const std::string& staging_dir) {
    ExtractResult result;

    std::vector<uint8_t> tar_data;
    if (!gzip_decompress(archive_data, tar_data, result.error)) {
        result.error = "failed to decompress archive: " + result.error;
        return result;
    }

    if (!create_directories(staging_dir)) {
        result.error = "failed to create staging directory: " + staging_dir;
        return result;
    }

    auto fail = [&](const std::string& message) {
        remove_directory(staging_dir);
        result.entries.clear();
        result.error = message;
        return result;
    };

    size_t offset = 0;
    while (offset + TAR_BLOCK_SIZE <= tar_data.size()) {
        const TarHeader* header = reinterpret_cast<const TarHeader*>(tar_data.data() + offset);

        bool empty = std::all_of(tar_data.begin() + static_cast<long>(offset),
                                 tar_data.begin() + static_cast<long>(offset + TAR_BLOCK_SIZE),
                                 [](uint8_t b) { return b == 0; });
        if (empty) break;

        std::string path;
        if (header->prefix[0] != '\0') {
            path = std::string(header->prefix, strnlen(header->prefix, TAR_PREFIX_SIZE));
            path += '/';
        }
        path += std::string(header->name, strnlen(header->name, TAR_NAME_SIZE));

        while (!path.empty() && path.back() == '/') path.pop_back();
        if (path.rfind("./", 0) == 0) path = path.substr(2);

        uint64_t size = parse_octal(header->size, sizeof(header->size));
        char typeflag = header->typeflag;
        offset += TAR_BLOCK_SIZE;

        if (typeflag == TAR_SYMTYPE || typeflag == TAR_LNKTYPE) {
            return fail("symlinks and hardlinks not permitted: " + path);
        }
        if (typeflag != TAR_REGTYPE && typeflag != TAR_AREGTYPE && typeflag != TAR_DIRTYPE) {
            return fail("unsupported entry type: " + path);
        }

        if (path.empty() || path == ".") {
            continue;
        }

        auto validation = validate_extraction_path(path, staging_dir);
        if (!validation.safe) {
            return fail(validation.error);
        }

        std::string full_path = join_path(staging_dir, validation.normalized_path);

        if (typeflag == TAR_DIRTYPE) {
            if (!create_directories(full_path)) {
                return fail("failed to create directory: " + path);
            }
            result.entries.push_back(validation.normalized_path);
            continue;
        }

        if (size > tar_data.size() - offset) {
            return fail("truncated archive: " + path);
        }

        std::string parent = get_parent_directory(full_path);
        if (!parent.empty() && !create_directories(parent)) {
            return fail("failed to create parent directory for: " + path);
        }

        std::ofstream file(full_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return fail("failed to create file: " + path);
        }
        file.write(reinterpret_cast<const char*>(tar_data.data() + offset),
                   static_cast<std::streamsize>(size));
        file.close();
        if (!file) {
            return fail("failed to write file: " + path);
        }

        result.entries.push_back(validation.normalized_path);

        size_t blocks = static_cast<size_t>((size + TAR_BLOCK_SIZE - 1) / TAR_BLOCK_SIZE);
        offset += blocks * TAR_BLOCK_SIZE;
    }

    result.ok = true;
    return result;
}

} // namespace exampack
