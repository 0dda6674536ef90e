#pragma once

/** \file snapshot_io.hpp
 *  \brief Binary snapshot files: save a committed IndexSnapshot, reload it without a rebuild.
 *
 * Layout (v1, little-endian):
 *   header   magic "VSNP" | u16 major | u16 minor | u8 strategy | u8 metric | u16 reserved |
 *            u32 dim | u32 num_partitions | u32 probe_count | u32 max_iter | u32 seed |
 *            f32 epsilon | u64 store_version | u64 entry_count
 *   entries  (ascending id) u32 id_len | id | dim x f32 | u32 n_meta |
 *            n_meta x (u32 key_len | key | u8 tag | payload)
 *   index    u8 kind (0 flat, 1 partitioned)
 *            partitioned: u32 nlist | nlist x dim x f32 centroids | nlist x (u32 size | u32[size])
 *   trailer  u32 CRC32C over all preceding bytes
 *
 * Metadata tags: 0 string (u32 len | bytes), 1 double (f64), 2 int64 (i64), 3 bool (u8).
 *
 * Saves are atomic: the file is written to `<path>.tmp`, fsynced, renamed over `path`,
 * and the parent directory is fsynced. Readers see either the old or the new file.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <vector>

#include "vista/error.hpp"
#include "vista/index/index_snapshot.hpp"

namespace vista::persist {

inline constexpr std::uint32_t kSnapshotMagic = 0x504E5356u;  // "VSNP" little-endian
inline constexpr std::uint16_t kSnapshotMajor = 1;
inline constexpr std::uint16_t kSnapshotMinor = 0;

/** \brief CRC-32C (Castagnoli, reflected polynomial 0x82F63B78). */
auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t;

/** \brief Serialize a snapshot into the v1 byte layout (trailer included). */
auto encode_snapshot(const index::IndexSnapshot& snapshot) -> std::vector<std::uint8_t>;

/**
 * \brief Parse v1 bytes back into a snapshot. Entry i gets handle {slot i, generation 0},
 * matching VectorStore::restore().
 * Errors: data_integrity on bad magic, unsupported version, truncation, CRC mismatch or
 * inconsistent index section.
 */
auto decode_snapshot(std::span<const std::uint8_t> bytes)
    -> std::expected<index::SnapshotPtr, core::error>;

/** \brief Atomically write `snapshot` to `path`. Errors: io_failed. */
auto save_snapshot(const std::filesystem::path& path, const index::IndexSnapshot& snapshot)
    -> std::expected<void, core::error>;

/** \brief Read and decode `path`. Errors: not_found, io_failed, data_integrity. */
auto load_snapshot(const std::filesystem::path& path)
    -> std::expected<index::SnapshotPtr, core::error>;

} // namespace vista::persist
