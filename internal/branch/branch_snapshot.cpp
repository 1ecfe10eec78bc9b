#include "branch_snapshot.hpp"

#include <google/protobuf/util/json_util.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace epicflow::branch {

namespace {

epicflow::v1::ReasoningKind ToProto(ReasoningKind kind) {
  switch (kind) {
    case ReasoningKind::kThinking:
      return epicflow::v1::REASONING_KIND_THINKING;
    case ReasoningKind::kDraft:
      return epicflow::v1::REASONING_KIND_DRAFT;
    case ReasoningKind::kCritique:
      return epicflow::v1::REASONING_KIND_CRITIQUE;
    case ReasoningKind::kFinal:
      return epicflow::v1::REASONING_KIND_FINAL;
    case ReasoningKind::kDocumentRevision:
      return epicflow::v1::REASONING_KIND_DOCUMENT_REVISION;
  }
  return epicflow::v1::REASONING_KIND_UNSPECIFIED;
}

std::optional<ReasoningKind> FromProto(epicflow::v1::ReasoningKind kind) {
  switch (kind) {
    case epicflow::v1::REASONING_KIND_THINKING:
      return ReasoningKind::kThinking;
    case epicflow::v1::REASONING_KIND_DRAFT:
      return ReasoningKind::kDraft;
    case epicflow::v1::REASONING_KIND_CRITIQUE:
      return ReasoningKind::kCritique;
    case epicflow::v1::REASONING_KIND_FINAL:
      return ReasoningKind::kFinal;
    case epicflow::v1::REASONING_KIND_DOCUMENT_REVISION:
      return ReasoningKind::kDocumentRevision;
    default:
      return std::nullopt;
  }
}

void Encode(const ReasoningStep& step, epicflow::v1::ReasoningStep* out) {
  out->set_id(step.id);
  out->set_kind(ToProto(step.state.kind));
  out->set_state_text(step.state.text);
  out->set_prompt(step.prompt);
  *out->mutable_timestamp() = util::ToProto(step.timestamp);
  for (const auto& call : step.tool_calls) {
    auto* tool = out->add_tool_calls();
    tool->set_tool_name(call.tool_name);
    tool->set_arguments(call.arguments);
    tool->set_output(call.output);
    *tool->mutable_timestamp() = util::ToProto(call.timestamp);
  }
}

void Encode(const IngestBatch& batch, epicflow::v1::IngestBatch* out) {
  out->set_id(batch.id);
  out->set_source(batch.source);
  for (const auto& id : batch.ids) {
    out->add_ids(id);
  }
  *out->mutable_timestamp() = util::ToProto(batch.timestamp);
}

util::Result<util::TimePoint> DecodeTime(const google::protobuf::Timestamp& ts, const std::string& where) {
  if (!util::IsRepresentable(ts)) {
    return util::Result<util::TimePoint>::Err(util::ErrorCode::kInvalidSnapshot,
                                              where + ": timestamp " + std::to_string(ts.seconds()) + "s out of range");
  }
  return util::Result<util::TimePoint>::Ok(util::FromProto(ts));
}

util::Result<BranchEvent> Decode(const epicflow::v1::BranchEvent& event, int index) {
  const auto where = "event " + std::to_string(index);

  switch (event.event_case()) {
    case epicflow::v1::BranchEvent::kReasoning: {
      const auto& in = event.reasoning();
      if (!util::IsCanonicalUUID(in.id())) {
        return util::Result<BranchEvent>::Err(util::ErrorCode::kInvalidSnapshot, where + ": malformed id '" + in.id() + "'");
      }
      auto kind = FromProto(in.kind());
      if (!kind) {
        return util::Result<BranchEvent>::Err(util::ErrorCode::kInvalidSnapshot, where + ": unknown reasoning kind");
      }

      ReasoningStep step;
      step.id         = in.id();
      step.state.kind = *kind;
      step.state.text = in.state_text();
      step.prompt     = in.prompt();

      auto at = DecodeTime(in.timestamp(), where);
      if (!at) return util::Result<BranchEvent>::Err(at.error());
      step.timestamp = at.value();

      for (const auto& tool : in.tool_calls()) {
        auto called = DecodeTime(tool.timestamp(), where + " tool '" + tool.tool_name() + "'");
        if (!called) return util::Result<BranchEvent>::Err(called.error());
        step.tool_calls.push_back(ToolExecution{tool.tool_name(), tool.arguments(), tool.output(), called.value()});
      }
      return util::Result<BranchEvent>::Ok(std::move(step));
    }

    case epicflow::v1::BranchEvent::kIngest: {
      const auto& in = event.ingest();
      if (!util::IsCanonicalUUID(in.id())) {
        return util::Result<BranchEvent>::Err(util::ErrorCode::kInvalidSnapshot, where + ": malformed id '" + in.id() + "'");
      }

      IngestBatch batch;
      batch.id        = in.id();
      batch.source    = in.source();
      batch.ids       = std::vector<std::string>(in.ids().begin(), in.ids().end());

      auto at = DecodeTime(in.timestamp(), where);
      if (!at) return util::Result<BranchEvent>::Err(at.error());
      batch.timestamp = at.value();
      return util::Result<BranchEvent>::Ok(std::move(batch));
    }

    case epicflow::v1::BranchEvent::EVENT_NOT_SET:
      break;
  }
  return util::Result<BranchEvent>::Err(util::ErrorCode::kInvalidSnapshot, where + ": no event payload");
}

} // namespace

// ------------------------------------------------------------
// Capture / Restore
// ------------------------------------------------------------

epicflow::v1::BranchSnapshot BranchSnapshot::Capture(const ExecutionBranch& branch) {
  epicflow::v1::BranchSnapshot snapshot;
  snapshot.set_name(branch.Name());
  snapshot.set_data_source(branch.Source().location);

  for (const auto& event : branch.Events()) {
    auto* out = snapshot.add_events();
    std::visit(Overloaded{
                   [out](const ReasoningStep& step) { Encode(step, out->mutable_reasoning()); },
                   [out](const IngestBatch& batch) { Encode(batch, out->mutable_ingest()); },
               },
               event);
  }
  return snapshot;
}

util::Result<ExecutionBranch> BranchSnapshot::Restore(const epicflow::v1::BranchSnapshot& snapshot, std::weak_ptr<RetrievalStore> store) {
  if (snapshot.name().empty()) {
    return util::Result<ExecutionBranch>::Err(util::ErrorCode::kInvalidSnapshot, "snapshot has no branch name");
  }

  std::vector<BranchEvent> events;
  events.reserve(snapshot.events_size());
  for (int i = 0; i < snapshot.events_size(); ++i) {
    auto decoded = Decode(snapshot.events(i), i);
    if (!decoded) {
      return util::Result<ExecutionBranch>::Err(decoded.error());
    }
    events.push_back(std::move(decoded).value());
  }

  return util::Result<ExecutionBranch>::Ok(
      ExecutionBranch::FromEvents(snapshot.name(), DataSource{snapshot.data_source()}, std::move(store), events));
}

// ------------------------------------------------------------
// JSON
// ------------------------------------------------------------

util::Result<std::string> BranchSnapshot::ToJson(const epicflow::v1::BranchSnapshot& snapshot) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(snapshot, &json, options);
  if (!status.ok()) {
    return util::Result<std::string>::Err(util::ErrorCode::kInvalidSnapshot, "failed to encode snapshot: " + std::string(status.message()));
  }
  return util::Result<std::string>::Ok(std::move(json));
}

util::Result<epicflow::v1::BranchSnapshot> BranchSnapshot::FromJson(std::string_view json) {
  epicflow::v1::BranchSnapshot snapshot;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &snapshot, options);
  if (!status.ok()) {
    return util::Result<epicflow::v1::BranchSnapshot>::Err(util::ErrorCode::kInvalidSnapshot,
                                                           "failed to parse snapshot: " + std::string(status.message()));
  }
  return util::Result<epicflow::v1::BranchSnapshot>::Ok(std::move(snapshot));
}

} // namespace epicflow::branch
