#pragma once

#include "core/json_dom.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace norma::agent {

// Well-known scratchpad keys written by the planner and the judge.
inline constexpr const char* kFactQueryDomain = "query_domain";
inline constexpr const char* kFactPriorityDocuments = "priority_documents";
inline constexpr const char* kFactRejectedSources = "rejected_sources";
inline constexpr const char* kFactSearchHypotheses = "search_hypotheses";
inline constexpr const char* kFactUsedHypotheses = "used_hypotheses";

using Fact = core::json::Value;

// True for the keys above. Tool output never writes them.
bool IsReservedFactKey(std::string_view key);

// Lowercase with runs of whitespace collapsed to one space and trimmed.
std::string FoldText(std::string_view text);

// Document-name match shared by the dispatcher, judge and replanner: the
// folded names are equal or one contains the other ("SP 63.13330" lists
// "sp 63.13330.2018").
bool ListsDocument(const std::vector<std::string>& documents, std::string_view name);

enum class ScratchpadOpKind {
  kSet,
  kAppend,
  kRemove,
};

const char* ToString(ScratchpadOpKind kind);

struct ScratchpadOp {
  ScratchpadOpKind kind = ScratchpadOpKind::kSet;
  std::string key;
  Fact value;
};

// Ordered list of mutations. Removal only ever happens through an explicit
// kRemove op; set and append never drop other keys.
struct ScratchpadUpdate {
  std::vector<ScratchpadOp> ops;

  bool Empty() const {
    return ops.empty();
  }

  void Set(std::string key, Fact value);
  void Append(std::string key, Fact value);
  void Remove(std::string key);
};

core::json::Value ToJsonValue(const ScratchpadUpdate& update);

// Durable fact store for one session.
class Scratchpad {
public:
  const Fact* Find(std::string_view key) const;
  bool Has(std::string_view key) const;

  // Empty string when absent or not a string.
  std::string GetString(std::string_view key) const;

  // A lone string counts as a one-item list.
  std::vector<std::string> GetStringList(std::string_view key) const;

  // Applies ops in order. Fails without partial effects when an op has an
  // empty key.
  bool Apply(const ScratchpadUpdate& update, std::string& error);

  const core::json::Value::Object& Entries() const {
    return entries_;
  }

  std::size_t Size() const {
    return entries_.size();
  }

private:
  core::json::Value::Object entries_;
};

} // namespace norma::agent
