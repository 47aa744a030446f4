#include "agent/scratchpad.hpp"

#include <cctype>
#include <utility>

namespace norma::agent {

namespace {

using core::json::Value;

void AppendUnique(Value& array, const Value& item) {
  for (const auto& existing : array.array_value) {
    if (core::json::Equals(existing, item)) {
      return;
    }
  }
  array.array_value.push_back(item);
}

void ApplyAppend(Value::Object& entries, const std::string& key, const Value& value) {
  auto it = entries.find(key);
  if (it == entries.end()) {
    it = entries.emplace(key, core::json::MakeArray()).first;
  } else if (!it->second.IsArray()) {
    Value promoted = core::json::MakeArray();
    promoted.array_value.push_back(std::move(it->second));
    it->second = std::move(promoted);
  }

  if (value.IsArray()) {
    for (const auto& item : value.array_value) {
      AppendUnique(it->second, item);
    }
  } else {
    AppendUnique(it->second, value);
  }
}

} // namespace

bool IsReservedFactKey(std::string_view key) {
  return key == kFactQueryDomain || key == kFactPriorityDocuments ||
         key == kFactRejectedSources || key == kFactSearchHypotheses ||
         key == kFactUsedHypotheses;
}

std::string FoldText(std::string_view text) {
  std::string folded;
  bool pending_space = false;
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      pending_space = !folded.empty();
      continue;
    }
    if (pending_space) {
      folded.push_back(' ');
      pending_space = false;
    }
    folded.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return folded;
}

bool ListsDocument(const std::vector<std::string>& documents, std::string_view name) {
  const std::string wanted = FoldText(name);
  if (wanted.empty()) {
    return false;
  }
  for (const auto& document : documents) {
    const std::string folded = FoldText(document);
    if (folded.empty()) {
      continue;
    }
    if (folded.find(wanted) != std::string::npos || wanted.find(folded) != std::string::npos) {
      return true;
    }
  }
  return false;
}

const char* ToString(ScratchpadOpKind kind) {
  switch (kind) {
  case ScratchpadOpKind::kSet:
    return "set";
  case ScratchpadOpKind::kAppend:
    return "append";
  case ScratchpadOpKind::kRemove:
    return "remove";
  }
  return "set";
}

void ScratchpadUpdate::Set(std::string key, Fact value) {
  ops.push_back(ScratchpadOp{ScratchpadOpKind::kSet, std::move(key), std::move(value)});
}

void ScratchpadUpdate::Append(std::string key, Fact value) {
  ops.push_back(ScratchpadOp{ScratchpadOpKind::kAppend, std::move(key), std::move(value)});
}

void ScratchpadUpdate::Remove(std::string key) {
  ops.push_back(ScratchpadOp{ScratchpadOpKind::kRemove, std::move(key), Fact{}});
}

core::json::Value ToJsonValue(const ScratchpadUpdate& update) {
  Value ops = core::json::MakeArray();
  for (const auto& op : update.ops) {
    Value item = core::json::MakeObject();
    item.object_value["op"] = core::json::MakeString(ToString(op.kind));
    item.object_value["key"] = core::json::MakeString(op.key);
    if (op.kind != ScratchpadOpKind::kRemove) {
      item.object_value["value"] = op.value;
    }
    ops.array_value.push_back(std::move(item));
  }
  return ops;
}

const Fact* Scratchpad::Find(std::string_view key) const {
  const auto it = entries_.find(std::string(key));
  return it == entries_.end() ? nullptr : &it->second;
}

bool Scratchpad::Has(std::string_view key) const {
  const Fact* fact = Find(key);
  if (fact == nullptr || fact->IsNull()) {
    return false;
  }
  if (fact->IsString()) {
    return !fact->string_value.empty();
  }
  if (fact->IsArray()) {
    return !fact->array_value.empty();
  }
  return true;
}

std::string Scratchpad::GetString(std::string_view key) const {
  const Fact* fact = Find(key);
  if (fact == nullptr || !fact->IsString()) {
    return "";
  }
  return fact->string_value;
}

std::vector<std::string> Scratchpad::GetStringList(std::string_view key) const {
  const Fact* fact = Find(key);
  if (fact == nullptr) {
    return {};
  }
  if (fact->IsString()) {
    return {fact->string_value};
  }
  return core::json::StringItems(*fact);
}

bool Scratchpad::Apply(const ScratchpadUpdate& update, std::string& error) {
  for (const auto& op : update.ops) {
    if (op.key.empty()) {
      error = "scratchpad update contains an empty key";
      return false;
    }
  }

  for (const auto& op : update.ops) {
    switch (op.kind) {
    case ScratchpadOpKind::kSet:
      entries_[op.key] = op.value;
      break;
    case ScratchpadOpKind::kAppend:
      ApplyAppend(entries_, op.key, op.value);
      break;
    case ScratchpadOpKind::kRemove:
      entries_.erase(op.key);
      break;
    }
  }
  return true;
}

} // namespace norma::agent
