/**
 * @file result_sorter.cpp
 * @brief Result sorting implementation
 */

#include "query/result_sorter.h"

#include <algorithm>

#include "query/value_comparator.h"
#include "utils/string_utils.h"

namespace monitorgate::query {

std::vector<SortKey> ResultSorter::ParseSortKeys(const std::string& sort_param) {
  std::vector<SortKey> keys;
  for (const auto& part : utils::Split(sort_param, ',')) {
    std::string trimmed = utils::Trim(part);
    SortKey key;
    if (!trimmed.empty() && trimmed.front() == '-') {
      key.order = SortOrder::DESC;
      trimmed = utils::Trim(std::string_view(trimmed).substr(1));
    }
    if (trimmed.empty()) {
      continue;
    }
    key.field = std::move(trimmed);
    keys.push_back(std::move(key));
  }
  return keys;
}

bool ResultSorter::SortComparator::operator()(const SortEntry& lhs, const SortEntry& rhs) const {
  for (size_t i = 0; i < keys_.size(); ++i) {
    int cmp = ValueComparator::CompareForSort(lhs.values[i], rhs.values[i]);
    if (cmp != 0) {
      return keys_[i].order == SortOrder::ASC ? cmp < 0 : cmp > 0;
    }
  }
  return false;
}

RecordList ResultSorter::Sort(const RecordList& records, const std::vector<SortKey>& keys) {
  if (keys.empty() || records.size() < 2) {
    return records;
  }

  std::vector<SortEntry> entries;
  entries.reserve(records.size());
  for (size_t i = 0; i < records.size(); ++i) {
    SortEntry entry{i, {}};
    entry.values.reserve(keys.size());
    for (const auto& key : keys) {
      entry.values.push_back(FindField(records[i], key.field));
    }
    entries.push_back(std::move(entry));
  }

  std::stable_sort(entries.begin(), entries.end(), SortComparator(keys));

  RecordList sorted;
  sorted.reserve(records.size());
  for (const auto& entry : entries) {
    sorted.push_back(records[entry.index]);
  }
  return sorted;
}

}  // namespace monitorgate::query
