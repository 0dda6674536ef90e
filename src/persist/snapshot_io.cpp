#include "vista/persist/snapshot_io.hpp"
#include "vista/core/log.hpp"

#include <array>
#include <bit>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <utility>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace vista::persist {

using core::error_code;

namespace {

// Fields are memcpy'd in host order, which only matches the on-disk format on
// little-endian targets.
static_assert(std::endian::native == std::endian::little,
              "snapshot encoding requires a little-endian host");

constexpr std::size_t kHeaderSize = 52;
constexpr std::uint8_t kKindFlat = 0;
constexpr std::uint8_t kKindPartitioned = 1;

enum : std::uint8_t { kTagString = 0, kTagDouble = 1, kTagInt64 = 2, kTagBool = 3 };

constexpr std::array<std::uint32_t, 256> kCrc32cTable = [] {
    std::array<std::uint32_t, 256> t{};
    const std::uint32_t poly = 0x82F63B78u;
    for (std::uint32_t i = 0; i < 256; ++i) {
        std::uint32_t c = i;
        for (int k = 0; k < 8; ++k) c = (c & 1u) ? (poly ^ (c >> 1)) : (c >> 1);
        t[i] = c;
    }
    return t;
}();

// Fixed-width little-endian writer (host is assumed little-endian, as in the WAL frames).
class ByteWriter {
public:
    template <typename T>
    void put(T v) {
        const auto at = out_.size();
        out_.resize(at + sizeof(T));
        std::memcpy(out_.data() + at, &v, sizeof(T));
    }
    void put_bytes(const void* p, std::size_t n) {
        const auto* b = static_cast<const std::uint8_t*>(p);
        out_.insert(out_.end(), b, b + n);
    }
    void put_string(const std::string& s) {
        put<std::uint32_t>(static_cast<std::uint32_t>(s.size()));
        put_bytes(s.data(), s.size());
    }
    void put_floats(std::span<const float> v) { put_bytes(v.data(), v.size() * sizeof(float)); }
    auto take() -> std::vector<std::uint8_t> { return std::move(out_); }
    auto bytes() const -> std::span<const std::uint8_t> { return out_; }

private:
    std::vector<std::uint8_t> out_;
};

// Bounds-checked reader; every get fails once the input is exhausted.
class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> in) : in_(in) {}

    template <typename T>
    bool get(T& v) {
        if (remaining() < sizeof(T)) return false;
        std::memcpy(&v, in_.data() + pos_, sizeof(T));
        pos_ += sizeof(T);
        return true;
    }
    bool get_string(std::string& s) {
        std::uint32_t len = 0;
        if (!get(len) || remaining() < len) return false;
        s.assign(reinterpret_cast<const char*>(in_.data() + pos_), len);
        pos_ += len;
        return true;
    }
    bool get_floats(std::vector<float>& v, std::size_t n) {
        if (remaining() / sizeof(float) < n) return false;
        v.resize(n);
        std::memcpy(v.data(), in_.data() + pos_, n * sizeof(float));
        pos_ += n * sizeof(float);
        return true;
    }
    [[nodiscard]] std::size_t remaining() const noexcept { return in_.size() - pos_; }

private:
    std::span<const std::uint8_t> in_;
    std::size_t pos_{0};
};

auto integrity(std::string message) -> std::unexpected<core::error> {
    return core::make_unexpected(error_code::data_integrity, std::move(message), "persist.snapshot");
}

void put_metadata(ByteWriter& w, const Metadata& md) {
    w.put<std::uint32_t>(static_cast<std::uint32_t>(md.size()));
    for (const auto& [key, value] : md) {
        w.put_string(key);
        if (const auto* s = std::get_if<std::string>(&value)) {
            w.put<std::uint8_t>(kTagString);
            w.put_string(*s);
        } else if (const auto* d = std::get_if<double>(&value)) {
            w.put<std::uint8_t>(kTagDouble);
            w.put<double>(*d);
        } else if (const auto* i = std::get_if<std::int64_t>(&value)) {
            w.put<std::uint8_t>(kTagInt64);
            w.put<std::int64_t>(*i);
        } else {
            w.put<std::uint8_t>(kTagBool);
            w.put<std::uint8_t>(std::get<bool>(value) ? 1 : 0);
        }
    }
}

bool get_metadata(ByteReader& r, Metadata& md) {
    std::uint32_t count = 0;
    if (!r.get(count)) return false;
    for (std::uint32_t i = 0; i < count; ++i) {
        std::string key;
        std::uint8_t tag = 0;
        if (!r.get_string(key) || !r.get(tag)) return false;
        switch (tag) {
            case kTagString: {
                std::string s;
                if (!r.get_string(s)) return false;
                md.emplace(std::move(key), std::move(s));
                break;
            }
            case kTagDouble: {
                double d = 0;
                if (!r.get(d)) return false;
                md.emplace(std::move(key), d);
                break;
            }
            case kTagInt64: {
                std::int64_t v = 0;
                if (!r.get(v)) return false;
                md.emplace(std::move(key), v);
                break;
            }
            case kTagBool: {
                std::uint8_t b = 0;
                if (!r.get(b) || b > 1) return false;
                md.emplace(std::move(key), b == 1);
                break;
            }
            default:
                return false;
        }
    }
    return true;
}

#if defined(__linux__) || defined(__APPLE__)
auto fsync_path(const std::filesystem::path& p, bool best_effort) -> std::expected<void, core::error> {
    const int fd = ::open(p.string().c_str(), O_RDONLY);
    if (fd < 0) {
        if (best_effort) return {};
        return core::make_unexpected(error_code::io_failed, "fsync open failed", "persist.snapshot");
    }
    const int rc = ::fsync(fd);
    (void)::close(fd);
    if (rc != 0 && !best_effort) {
        return core::make_unexpected(error_code::io_failed, "fsync failed", "persist.snapshot");
    }
    return {};
}
#endif

} // anonymous namespace

auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t {
    std::uint32_t c = ~0u;
    for (auto b : bytes) c = kCrc32cTable[(c ^ b) & 0xFFu] ^ (c >> 8);
    return ~c;
}

auto encode_snapshot(const index::IndexSnapshot& snapshot) -> std::vector<std::uint8_t> {
    const auto& cfg = snapshot.config();
    const auto dim = snapshot.dimension();

    ByteWriter w;
    w.put<std::uint32_t>(kSnapshotMagic);
    w.put<std::uint16_t>(kSnapshotMajor);
    w.put<std::uint16_t>(kSnapshotMinor);
    w.put<std::uint8_t>(static_cast<std::uint8_t>(cfg.strategy));
    w.put<std::uint8_t>(static_cast<std::uint8_t>(cfg.metric));
    w.put<std::uint16_t>(0);
    w.put<std::uint32_t>(static_cast<std::uint32_t>(dim));
    w.put<std::uint32_t>(cfg.num_partitions);
    w.put<std::uint32_t>(cfg.probe_count);
    w.put<std::uint32_t>(cfg.max_iter);
    w.put<std::uint32_t>(cfg.seed);
    w.put<float>(cfg.epsilon);
    w.put<std::uint64_t>(snapshot.store_version());
    w.put<std::uint64_t>(snapshot.size());

    for (const auto& e : snapshot.entries()) {
        w.put_string(e.record->id);
        w.put_floats(e.record->vector);
        put_metadata(w, e.record->metadata);
    }

    if (const auto* part = std::get_if<index::PartitionedIndex>(&snapshot.index())) {
        w.put<std::uint8_t>(kKindPartitioned);
        w.put<std::uint32_t>(part->num_partitions());
        for (const auto& c : part->centroids()) w.put_floats(c);
        for (const auto& list : part->lists()) {
            w.put<std::uint32_t>(static_cast<std::uint32_t>(list.entries.size()));
            w.put_bytes(list.entries.data(), list.entries.size() * sizeof(std::uint32_t));
        }
    } else {
        w.put<std::uint8_t>(kKindFlat);
    }

    w.put<std::uint32_t>(crc32c(w.bytes()));
    return w.take();
}

auto decode_snapshot(std::span<const std::uint8_t> bytes)
    -> std::expected<index::SnapshotPtr, core::error> {
    if (bytes.size() < kHeaderSize + sizeof(std::uint32_t)) return integrity("snapshot truncated");

    std::uint32_t stored_crc = 0;
    std::memcpy(&stored_crc, bytes.data() + bytes.size() - 4, 4);
    const auto body = bytes.first(bytes.size() - 4);
    if (crc32c(body) != stored_crc) return integrity("snapshot checksum mismatch");

    ByteReader r(body);
    std::uint32_t magic = 0, dim = 0;
    std::uint16_t major = 0, minor = 0, reserved = 0;
    std::uint8_t strategy = 0, metric = 0;
    std::uint64_t store_version = 0, entry_count = 0;
    index::IndexBuildConfig cfg;
    const bool header_ok = r.get(magic) && r.get(major) && r.get(minor) && r.get(strategy) &&
                           r.get(metric) && r.get(reserved) && r.get(dim) &&
                           r.get(cfg.num_partitions) && r.get(cfg.probe_count) &&
                           r.get(cfg.max_iter) && r.get(cfg.seed) && r.get(cfg.epsilon) &&
                           r.get(store_version) && r.get(entry_count);
    if (!header_ok) return integrity("snapshot header truncated");

    if (magic != kSnapshotMagic) return integrity("bad snapshot magic");
    if (major != kSnapshotMajor) {
        return integrity("unsupported snapshot version " + std::to_string(major) + "." +
                         std::to_string(minor));
    }
    if (strategy > static_cast<std::uint8_t>(index::IndexStrategy::Partitioned)) {
        return integrity("unknown index strategy");
    }
    if (!is_valid_metric(metric)) return integrity("unknown metric");
    if (dim == 0) return integrity("zero dimension");
    cfg.strategy = static_cast<index::IndexStrategy>(strategy);
    cfg.metric = static_cast<Metric>(metric);

    // Each entry needs at least its id length, vector and metadata count.
    const std::size_t min_entry = 8 + static_cast<std::size_t>(dim) * sizeof(float);
    if (entry_count > r.remaining() / min_entry) return integrity("entry count exceeds file size");

    std::vector<index::SnapshotEntry> entries;
    entries.reserve(static_cast<std::size_t>(entry_count));
    std::vector<float> rows;
    rows.reserve(static_cast<std::size_t>(entry_count) * dim);
    for (std::uint64_t i = 0; i < entry_count; ++i) {
        auto rec = std::make_shared<Record>();
        if (!r.get_string(rec->id) || !r.get_floats(rec->vector, dim) ||
            !get_metadata(r, rec->metadata)) {
            return integrity("entry " + std::to_string(i) + " truncated or malformed");
        }
        if (!entries.empty() && !(entries.back().record->id < rec->id)) {
            return integrity("entries not in ascending id order");
        }
        rows.insert(rows.end(), rec->vector.begin(), rec->vector.end());
        entries.push_back(index::SnapshotEntry{Handle{static_cast<std::uint32_t>(i), 0},
                                               std::move(rec)});
    }

    std::uint8_t kind = 0;
    if (!r.get(kind)) return integrity("missing index section");

    index::IndexVariant idx;
    if (kind == kKindFlat) {
        idx = index::FlatIndex(dim, std::move(rows));
    } else if (kind == kKindPartitioned) {
        std::uint32_t nlist = 0;
        if (!r.get(nlist) || nlist == 0) return integrity("bad partition count");
        if (nlist > r.remaining() / (static_cast<std::size_t>(dim) * sizeof(float))) {
            return integrity("partition count exceeds file size");
        }
        std::vector<std::vector<float>> centroids(nlist);
        for (auto& c : centroids) {
            if (!r.get_floats(c, dim)) return integrity("centroids truncated");
        }
        std::vector<std::vector<std::uint32_t>> lists(nlist);
        std::vector<bool> seen(static_cast<std::size_t>(entry_count), false);
        std::uint64_t listed = 0;
        for (auto& list : lists) {
            std::uint32_t size = 0;
            if (!r.get(size) || size > r.remaining() / sizeof(std::uint32_t)) {
                return integrity("inverted list truncated");
            }
            list.resize(size);
            for (auto& e : list) {
                if (!r.get(e) || e >= entry_count || seen[e]) return integrity("inverted list entry out of range");
                seen[e] = true;
            }
            listed += size;
        }
        if (listed != entry_count) return integrity("inverted lists do not cover every entry");
        idx = index::PartitionedIndex(dim, cfg.probe_count, std::move(centroids), lists, rows);
    } else {
        return integrity("unknown index kind");
    }
    if (r.remaining() != 0) return integrity("trailing bytes after index section");

    return std::make_shared<const index::IndexSnapshot>(cfg, dim, store_version,
                                                        std::move(entries), std::move(idx));
}

auto save_snapshot(const std::filesystem::path& path, const index::IndexSnapshot& snapshot)
    -> std::expected<void, core::error> {
    const auto bytes = encode_snapshot(snapshot);
    auto tmp = path;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.good()) {
            return core::make_unexpected(error_code::io_failed,
                                         "cannot open " + tmp.string() + " for writing",
                                         "persist.snapshot");
        }
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out.good()) {
            std::error_code rec;
            std::filesystem::remove(tmp, rec);
            return core::make_unexpected(error_code::io_failed, "snapshot tmp write failed",
                                         "persist.snapshot");
        }
    }

#if defined(__linux__) || defined(__APPLE__)
    if (auto ok = fsync_path(tmp, false); !ok) {
        std::error_code rec;
        std::filesystem::remove(tmp, rec);
        return std::unexpected(ok.error());
    }
#endif

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code rec;
        std::filesystem::remove(tmp, rec);
        return core::make_unexpected(error_code::io_failed, "snapshot rename failed: " + ec.message(),
                                     "persist.snapshot");
    }

#if defined(__linux__) || defined(__APPLE__)
    const auto dir = path.has_parent_path() ? path.parent_path() : std::filesystem::path(".");
    if (auto ok = fsync_path(dir, true); !ok) return std::unexpected(ok.error());
#endif

    core::log_fmt(core::log_level::info, "persist.snapshot", "saved ", path.string(), " entries=",
                  snapshot.size(), " version=", snapshot.store_version(), " bytes=", bytes.size());
    return {};
}

auto load_snapshot(const std::filesystem::path& path)
    -> std::expected<index::SnapshotPtr, core::error> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return core::make_unexpected(error_code::not_found, "no snapshot at " + path.string(),
                                     "persist.snapshot");
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.good()) {
        return core::make_unexpected(error_code::io_failed, "cannot open " + path.string(),
                                     "persist.snapshot");
    }
    const std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                                          std::istreambuf_iterator<char>());
    if (in.bad()) {
        return core::make_unexpected(error_code::io_failed, "read failed for " + path.string(),
                                     "persist.snapshot");
    }

    auto snapshot = decode_snapshot(bytes);
    if (!snapshot) {
        core::log_fmt(core::log_level::error, "persist.snapshot", "rejecting ", path.string(), ": ",
                      snapshot.error().message);
        return snapshot;
    }
    core::log_fmt(core::log_level::info, "persist.snapshot", "loaded ", path.string(), " entries=",
                  (*snapshot)->size(), " version=", (*snapshot)->store_version());
    return snapshot;
}

} // namespace vista::persist
