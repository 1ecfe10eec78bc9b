#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/util/time.hpp"

namespace epicflow::branch {

enum class ReasoningKind : std::uint8_t {
  kThinking         = 0,
  kDraft            = 1,
  kCritique         = 2,
  kFinal            = 3,
  kDocumentRevision = 4,
};

constexpr std::string_view ToString(ReasoningKind kind) {
  switch (kind) {
    case ReasoningKind::kThinking:
      return "thinking";
    case ReasoningKind::kDraft:
      return "draft";
    case ReasoningKind::kCritique:
      return "critique";
    case ReasoningKind::kFinal:
      return "final";
    case ReasoningKind::kDocumentRevision:
      return "document_revision";
  }
  return "unknown";
}

struct ReasoningState {
  ReasoningKind kind = ReasoningKind::kThinking;
  std::string   text;

  bool operator==(const ReasoningState&) const = default;
};

struct ToolExecution {
  std::string     tool_name;
  std::string     arguments;
  std::string     output;
  util::TimePoint timestamp;

  bool operator==(const ToolExecution&) const = default;
};

struct ReasoningStep {
  std::string                id;
  ReasoningState             state;
  std::string                prompt;
  std::vector<ToolExecution> tool_calls;
  util::TimePoint            timestamp;

  bool operator==(const ReasoningStep&) const = default;
};

struct IngestBatch {
  std::string              id;
  std::string              source;
  std::vector<std::string> ids;
  util::TimePoint          timestamp;

  bool operator==(const IngestBatch&) const = default;
};

/*
  Closed set of branch events. Visitors over it are exhaustive.
*/
using BranchEvent = std::variant<ReasoningStep, IngestBatch>;

// Visitor built from one lambda per alternative.
template <typename... Fs>
struct Overloaded : Fs... {
  using Fs::operator()...;
};

template <typename... Fs>
Overloaded(Fs...) -> Overloaded<Fs...>;

inline const std::string& EventId(const BranchEvent& event) {
  return std::visit([](const auto& e) -> const std::string& { return e.id; }, event);
}

inline util::TimePoint EventTimestamp(const BranchEvent& event) {
  return std::visit([](const auto& e) { return e.timestamp; }, event);
}

} // namespace epicflow::branch
