#include "execution_branch.hpp"

#include <algorithm>
#include <utility>

#include "internal/util/uuid.hpp"

namespace epicflow::branch {

// Unlink iteratively; a long history would otherwise recurse once per node.
ExecutionBranch::Node::~Node() {
  auto next = std::move(prev);
  while (next && next.use_count() == 1) {
    next = std::move(next->prev);
  }
}

ExecutionBranch::ExecutionBranch(std::string name, DataSource source, std::weak_ptr<RetrievalStore> store, std::shared_ptr<const Node> head)
    : name_(std::move(name)), source_(std::move(source)), store_(std::move(store)), head_(std::move(head)) {
}

ExecutionBranch ExecutionBranch::New(std::string name, DataSource source, std::weak_ptr<RetrievalStore> store) {
  return ExecutionBranch(std::move(name), std::move(source), std::move(store), nullptr);
}

ExecutionBranch ExecutionBranch::FromEvents(std::string name, DataSource source, std::weak_ptr<RetrievalStore> store,
                                            const std::vector<BranchEvent>& events) {
  auto branch = New(std::move(name), std::move(source), std::move(store));
  for (const auto& event : events) {
    branch = branch.WithEvent(event);
  }
  return branch;
}

// ------------------------------------------------------------
// Functional updates
// ------------------------------------------------------------

ExecutionBranch ExecutionBranch::WithEvent(BranchEvent event) const {
  auto node   = std::make_shared<Node>();
  node->event = std::move(event);
  node->prev  = head_;
  node->depth = head_ ? head_->depth + 1 : 1;
  return ExecutionBranch(name_, source_, store_, std::move(node));
}

ExecutionBranch ExecutionBranch::WithReasoningStep(ReasoningState state, std::string prompt, std::vector<ToolExecution> tool_calls) const {
  ReasoningStep step;
  step.id         = util::NewEventId();
  step.state      = std::move(state);
  step.prompt     = std::move(prompt);
  step.tool_calls = std::move(tool_calls);
  step.timestamp  = util::Now();
  return WithEvent(std::move(step));
}

ExecutionBranch ExecutionBranch::WithIngestEvent(std::string source, std::vector<std::string> ids) const {
  IngestBatch batch;
  batch.id        = util::NewEventId();
  batch.source    = std::move(source);
  batch.ids       = std::move(ids);
  batch.timestamp = util::Now();
  return WithEvent(std::move(batch));
}

ExecutionBranch ExecutionBranch::WithSource(DataSource source) const {
  return ExecutionBranch(name_, std::move(source), store_, head_);
}

ExecutionBranch ExecutionBranch::Fork(std::string new_name, std::weak_ptr<RetrievalStore> new_store) const {
  return ExecutionBranch(std::move(new_name), source_, std::move(new_store), head_);
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

std::vector<BranchEvent> ExecutionBranch::Events() const {
  std::vector<BranchEvent> events;
  events.reserve(Size());
  for (const Node* node = head_.get(); node; node = node->prev.get()) {
    events.push_back(node->event);
  }
  std::reverse(events.begin(), events.end());
  return events;
}

std::size_t ExecutionBranch::Size() const {
  return head_ ? head_->depth : 0;
}

BranchState ExecutionBranch::Replay() const {
  BranchState state;

  for (const auto& event : Events()) {
    std::visit(Overloaded{
                   [&state](const ReasoningStep& step) {
                     state.latest_state = step.state;
                     state.reasoning_steps++;
                     state.tool_calls += step.tool_calls.size();
                     state.last_prompt = step.prompt;
                   },
                   [&state](const IngestBatch& batch) {
                     state.ingested_ids.insert(state.ingested_ids.end(), batch.ids.begin(), batch.ids.end());
                     state.ingest_batches_by_source[batch.source]++;
                   },
               },
               event);
    state.last_event_at = EventTimestamp(event);
  }

  return state;
}

} // namespace epicflow::branch
