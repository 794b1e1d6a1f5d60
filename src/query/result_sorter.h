/**
 * @file result_sorter.h
 * @brief Multi-key stable sorting of query results
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "query/record.h"

namespace monitorgate::query {

enum class SortOrder : uint8_t {
  ASC,  // Ascending
  DESC  // Descending
};

/**
 * @brief One key of a sort specification
 */
struct SortKey {
  std::string field;
  SortOrder order = SortOrder::ASC;
};

/**
 * @brief Sort records by one or more fields
 *
 * - Lexicographic over the key list: later keys only break ties
 * - Stable: records equal on every key keep their input order
 * - Missing and null values sort first in ascending order, last in descending
 *   order (see ValueComparator::CompareForSort for the full order)
 */
class ResultSorter {
 public:
  /**
   * @brief Parse "field1,-field2" into sort keys
   *
   * A leading '-' marks descending. Whitespace around keys is trimmed and
   * empty keys are skipped.
   */
  static std::vector<SortKey> ParseSortKeys(const std::string& sort_param);

  /**
   * @brief Return a stably sorted copy of the records
   *
   * Sort values are looked up once per record and key (Schwartzian
   * transform), then the precomputed entries are sorted.
   *
   * @param records Input records (not modified)
   * @param keys Sort keys; an empty list returns the input unchanged
   */
  static RecordList Sort(const RecordList& records, const std::vector<SortKey>& keys);

 private:
  /**
   * @brief Entry for Schwartzian Transform (pre-computed sort values)
   */
  struct SortEntry {
    size_t index;
    std::vector<const nlohmann::json*> values;  // nullptr = missing/null
  };

  /**
   * @brief Compare function for sorting
   */
  struct SortComparator {
    const std::vector<SortKey>& keys_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)

    explicit SortComparator(const std::vector<SortKey>& keys) : keys_(keys) {}

    bool operator()(const SortEntry& lhs, const SortEntry& rhs) const;
  };
};

}  // namespace monitorgate::query
