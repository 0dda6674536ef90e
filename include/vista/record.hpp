#pragma once

/** \file record.hpp
 *  \brief Records, metadata values and internal handles.
 *
 * Records are immutable once stored and shared between the store and index
 * snapshots through std::shared_ptr<const Record>. Updates are delete + reinsert.
 */

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace vista {

/** \brief Scalar metadata value (label, path, score, flag, ...). */
using MetadataValue = std::variant<std::string, double, std::int64_t, bool>;

/** \brief Ordered so that persistence and comparisons are deterministic. */
using Metadata = std::map<std::string, MetadataValue>;

/** \brief One stored embedding with its metadata. */
struct Record {
  std::string id;              /**< unique opaque identifier (e.g. image path or hash) */
  std::vector<float> vector;   /**< embedding, length == collection dimension */
  Metadata metadata;           /**< e.g. {"label": "cat", "path": "..."} */
};

using RecordPtr = std::shared_ptr<const Record>;

/** \brief Internal slot reference. The generation changes every time a slot is recycled. */
struct Handle {
  std::uint32_t slot{0};
  std::uint32_t generation{0};

  friend constexpr bool operator==(const Handle&, const Handle&) = default;
};

} // namespace vista
