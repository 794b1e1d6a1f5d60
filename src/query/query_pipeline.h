/**
 * @file query_pipeline.h
 * @brief Filter -> sort -> project -> paginate over in-memory records
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>

#include "query/query_spec.h"
#include "query/record.h"

namespace monitorgate::query {

namespace defaults {
constexpr int64_t kPage = 1;
constexpr int64_t kLimit = 100;
}  // namespace defaults

/**
 * @brief Page metadata, computed against the pre-pagination count
 */
struct PageMetadata {
  int64_t page = defaults::kPage;
  int64_t limit = defaults::kLimit;
  size_t total = 0;
  size_t total_pages = 0;
  bool has_next_page = false;
  bool has_prev_page = false;

  /**
   * @brief {page, limit, total, totalPages, hasNextPage, hasPrevPage}
   */
  nlohmann::json ToJson() const;
};

/**
 * @brief One page of records plus its metadata
 */
struct QueryResult {
  RecordList data;
  PageMetadata pagination;
};

/**
 * @brief Pipeline tuning
 */
struct PipelineOptions {
  int64_t default_limit = defaults::kLimit;  // used when limit is absent, zero or not an integer
  int64_t max_limit = 0;                     // cap applied to limit (0 = no cap)
};

/**
 * @brief Stateless query pipeline
 *
 * Execute() composes four stages, each reading a const sequence and returning
 * a new one. Malformed operands, unknown fields and out-of-range pages are
 * never errors. Safe to use from several threads at once.
 *
 * Example:
 * @code
 * QueryPipeline pipeline;
 * auto result = pipeline.Execute(rules, QuerySpec::Parse("severity=critical&sort=-duration&limit=10"));
 * // result.data: at most 10 records, result.pagination.total: all critical rules
 * @endcode
 */
class QueryPipeline {
 public:
  QueryPipeline() = default;
  explicit QueryPipeline(PipelineOptions options) : options_(options) {}

  QueryResult Execute(const RecordList& records, const QuerySpec& spec) const;

  /**
   * @brief Keep records satisfying every non-reserved key
   */
  static RecordList Filter(const RecordList& records, const QuerySpec& spec);

  /**
   * @brief Stable multi-key sort driven by the "sort" key (no-op when absent)
   */
  static RecordList Sort(const RecordList& records, const QuerySpec& spec);

  /**
   * @brief Narrow each record to the "fields" list (no-op when absent)
   *
   * Requested fields missing from a record are skipped; fields present with a
   * null value are kept.
   */
  static RecordList Project(const RecordList& records, const QuerySpec& spec);

  /**
   * @brief Slice one page and compute its metadata
   */
  QueryResult Paginate(const RecordList& records, const QuerySpec& spec) const;

  /**
   * @brief Effective page number (>= 1)
   */
  static int64_t ResolvePage(const QuerySpec& spec);

  /**
   * @brief Effective page size (>= 1, capped by max_limit when set)
   */
  int64_t ResolveLimit(const QuerySpec& spec) const;

  const PipelineOptions& options() const { return options_; }

 private:
  PipelineOptions options_;
};

}  // namespace monitorgate::query
