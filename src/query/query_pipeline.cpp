/**
 * @file query_pipeline.cpp
 * @brief Query pipeline implementation
 */

#include "query/query_pipeline.h"

#include <algorithm>

#include "query/record_filter.h"
#include "query/result_sorter.h"
#include "utils/string_utils.h"

namespace monitorgate::query {

nlohmann::json PageMetadata::ToJson() const {
  return nlohmann::json{{"page", page},
                        {"limit", limit},
                        {"total", total},
                        {"totalPages", total_pages},
                        {"hasNextPage", has_next_page},
                        {"hasPrevPage", has_prev_page}};
}

QueryResult QueryPipeline::Execute(const RecordList& records, const QuerySpec& spec) const {
  RecordList filtered = Filter(records, spec);
  RecordList sorted = Sort(filtered, spec);
  RecordList projected = Project(sorted, spec);
  return Paginate(projected, spec);
}

RecordList QueryPipeline::Filter(const RecordList& records, const QuerySpec& spec) {
  return RecordFilter(spec).Apply(records);
}

RecordList QueryPipeline::Sort(const RecordList& records, const QuerySpec& spec) {
  auto sort_param = spec.GetFirst(QuerySpec::kSortKey);
  if (!sort_param) {
    return records;
  }
  return ResultSorter::Sort(records, ResultSorter::ParseSortKeys(*sort_param));
}

RecordList QueryPipeline::Project(const RecordList& records, const QuerySpec& spec) {
  auto fields_param = spec.GetFirst(QuerySpec::kFieldsKey);
  if (!fields_param) {
    return records;
  }

  std::vector<std::string> fields;
  for (const auto& part : utils::Split(*fields_param, ',')) {
    std::string trimmed = utils::Trim(part);
    if (!trimmed.empty() && std::find(fields.begin(), fields.end(), trimmed) == fields.end()) {
      fields.push_back(std::move(trimmed));
    }
  }
  if (fields.empty()) {
    return records;
  }

  RecordList projected;
  projected.reserve(records.size());
  for (const auto& record : records) {
    Record narrowed = nlohmann::json::object();
    for (const auto& field : fields) {
      if (HasField(record, field)) {
        narrowed[field] = record.at(field);
      }
    }
    projected.push_back(std::move(narrowed));
  }
  return projected;
}

int64_t QueryPipeline::ResolvePage(const QuerySpec& spec) {
  auto raw = spec.GetFirst(QuerySpec::kPageKey);
  if (!raw) {
    return defaults::kPage;
  }
  auto parsed = utils::ParseInt64(*raw);
  if (!parsed || *parsed == 0) {
    return defaults::kPage;
  }
  return std::max<int64_t>(1, *parsed);
}

int64_t QueryPipeline::ResolveLimit(const QuerySpec& spec) const {
  int64_t default_limit = std::max<int64_t>(1, options_.default_limit);
  int64_t limit = default_limit;

  auto raw = spec.GetFirst(QuerySpec::kLimitKey);
  if (raw) {
    auto parsed = utils::ParseInt64(*raw);
    if (parsed && *parsed != 0) {
      limit = std::max<int64_t>(1, *parsed);
    }
  }

  if (options_.max_limit > 0) {
    limit = std::min(limit, options_.max_limit);
  }
  return limit;
}

QueryResult QueryPipeline::Paginate(const RecordList& records, const QuerySpec& spec) const {
  QueryResult result;
  PageMetadata& meta = result.pagination;
  meta.page = ResolvePage(spec);
  meta.limit = ResolveLimit(spec);
  meta.total = records.size();

  auto limit = static_cast<size_t>(meta.limit);
  meta.total_pages = meta.total / limit + (meta.total % limit != 0 ? 1 : 0);
  meta.has_next_page = static_cast<uint64_t>(meta.page) < meta.total_pages;
  meta.has_prev_page = meta.page > 1;

  // (page - 1) * limit may overflow; compare page counts instead
  auto pages_before = static_cast<uint64_t>(meta.page - 1);
  if (pages_before >= meta.total_pages) {
    return result;
  }
  size_t skip = pages_before * limit;
  size_t end = skip + std::min(limit, meta.total - skip);
  result.data.assign(records.begin() + static_cast<std::ptrdiff_t>(skip),
                     records.begin() + static_cast<std::ptrdiff_t>(end));
  return result;
}

}  // namespace monitorgate::query
