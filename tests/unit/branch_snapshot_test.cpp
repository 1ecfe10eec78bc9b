#include "internal/branch/branch_snapshot.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

namespace {

using epicflow::branch::BranchSnapshot;
using epicflow::branch::DataSource;
using epicflow::branch::ExecutionBranch;
using epicflow::branch::ReasoningKind;
using epicflow::branch::ReasoningState;
using epicflow::branch::RetrievalStore;
using epicflow::branch::ToolExecution;
using epicflow::util::ErrorCode;

class FixedStore : public RetrievalStore {
 public:
  std::string Name() const override {
    return "fixed";
  }
};

ExecutionBranch SampleBranch() {
  return ExecutionBranch::New("epic-E1/sub-task-A", DataSource{"/repo"})
      .WithIngestEvent("docs", {"d1", "d2"})
      .WithReasoningStep(ReasoningState{ReasoningKind::kCritique, "too long"}, "review the draft",
                         {ToolExecution{"lint", "--all", "2 warnings", epicflow::util::Now()}})
      .WithReasoningStep(ReasoningState{ReasoningKind::kDocumentRevision, "shorter"}, "revise");
}

void TestCaptureRestorePreservesEvents() {
  const auto branch   = SampleBranch();
  const auto snapshot = BranchSnapshot::Capture(branch);

  assert(snapshot.name() == "epic-E1/sub-task-A");
  assert(snapshot.data_source() == "/repo");
  assert(snapshot.events_size() == 3);
  assert(snapshot.events(0).has_ingest());
  assert(snapshot.events(1).reasoning().kind() == epicflow::v1::REASONING_KIND_CRITIQUE);

  auto store    = std::make_shared<FixedStore>();
  auto restored = BranchSnapshot::Restore(snapshot, store);
  assert(restored);
  assert(restored.value().Name() == branch.Name());
  assert(restored.value().Source() == branch.Source());
  assert(restored.value().Events() == branch.Events());
  assert(restored.value().Store()->Name() == "fixed");
}

void TestJsonCycle() {
  const auto branch = SampleBranch();

  auto json = BranchSnapshot::ToJson(BranchSnapshot::Capture(branch));
  assert(json);
  assert(json.value().find("\"state_text\"") != std::string::npos);

  auto parsed = BranchSnapshot::FromJson(json.value());
  assert(parsed);

  auto restored = BranchSnapshot::Restore(parsed.value());
  assert(restored);
  assert(restored.value().Events() == branch.Events());
  assert(restored.value().Replay().reasoning_steps == 2);
}

void TestMalformedJsonRejected() {
  assert(BranchSnapshot::FromJson("{not json").code() == ErrorCode::kInvalidSnapshot);
  assert(BranchSnapshot::FromJson(R"({"name":"b","unexpected":1})").code() == ErrorCode::kInvalidSnapshot);
}

void TestMalformedEventsRejected() {
  epicflow::v1::BranchSnapshot bad_id;
  bad_id.set_name("b");
  bad_id.add_events()->mutable_ingest()->set_id("not-a-uuid");
  assert(BranchSnapshot::Restore(bad_id).code() == ErrorCode::kInvalidSnapshot);

  epicflow::v1::BranchSnapshot empty_event;
  empty_event.set_name("b");
  empty_event.add_events();
  assert(BranchSnapshot::Restore(empty_event).code() == ErrorCode::kInvalidSnapshot);

  auto no_kind = BranchSnapshot::Capture(ExecutionBranch::New("b").WithReasoningStep(ReasoningState{}, "p"));
  no_kind.mutable_events(0)->mutable_reasoning()->set_kind(epicflow::v1::REASONING_KIND_UNSPECIFIED);
  assert(BranchSnapshot::Restore(no_kind).code() == ErrorCode::kInvalidSnapshot);

  epicflow::v1::BranchSnapshot unnamed;
  assert(BranchSnapshot::Restore(unnamed).code() == ErrorCode::kInvalidSnapshot);
}

void TestOutOfRangeTimestampsRejected() {
  // 3000-01-01 is a valid protobuf Timestamp but beyond a nanosecond clock.
  constexpr std::int64_t kYear3000 = 32503680000;

  auto far_event = BranchSnapshot::Capture(SampleBranch());
  far_event.mutable_events(0)->mutable_ingest()->mutable_timestamp()->set_seconds(kYear3000);
  auto restored = BranchSnapshot::Restore(far_event);
  assert(restored.code() == ErrorCode::kInvalidSnapshot);
  assert(restored.error().message.find("out of range") != std::string::npos);

  auto far_tool = BranchSnapshot::Capture(SampleBranch());
  far_tool.mutable_events(1)->mutable_reasoning()->mutable_tool_calls(0)->mutable_timestamp()->set_seconds(kYear3000);
  assert(BranchSnapshot::Restore(far_tool).code() == ErrorCode::kInvalidSnapshot);

  auto early = BranchSnapshot::Capture(SampleBranch());
  early.mutable_events(2)->mutable_reasoning()->mutable_timestamp()->set_seconds(-kYear3000);
  assert(BranchSnapshot::Restore(early).code() == ErrorCode::kInvalidSnapshot);

  google::protobuf::Timestamp now = epicflow::util::ToProto(epicflow::util::Now());
  assert(epicflow::util::IsRepresentable(now));
  now.set_seconds(kYear3000);
  assert(!epicflow::util::IsRepresentable(now));
}

void TestEmptyBranchSnapshot() {
  auto restored = BranchSnapshot::Restore(BranchSnapshot::Capture(ExecutionBranch::New("empty")));
  assert(restored);
  assert(restored.value().Empty());
}

} // namespace

int main() {
  TestCaptureRestorePreservesEvents();
  TestJsonCycle();
  TestMalformedJsonRejected();
  TestMalformedEventsRejected();
  TestOutOfRangeTimestampsRejected();
  TestEmptyBranchSnapshot();

  std::cout << "epicflow_unit_branch_snapshot: pass\n";
  return 0;
}
