#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/branch/branch_event.hpp"

namespace epicflow::branch {

/*
  Location the branch reads its inputs from. Opaque here.
*/
struct DataSource {
  std::string location;

  bool operator==(const DataSource&) const = default;
};

/*
  Externally owned retrieval / vector store. Branches only hold a
  non-owning reference and never call into it.
*/
class RetrievalStore {
 public:
  virtual ~RetrievalStore() = default;

  virtual std::string Name() const = 0;
};

/*
  Materialized view produced by folding a branch's events in order.
*/
struct BranchState {
  std::optional<ReasoningState> latest_state;
  std::size_t                   reasoning_steps = 0;
  std::size_t                   tool_calls      = 0;

  std::vector<std::string>           ingested_ids;
  std::map<std::string, std::size_t> ingest_batches_by_source;

  std::string                    last_prompt;
  std::optional<util::TimePoint> last_event_at;
};

/*
  Immutable, append-only execution record of one sub-task.

  Events live in a persistent singly linked list: each value holds the
  newest node and every node points at its predecessor. Appending
  allocates one node and shares the whole prefix, so forks are two
  values pointing into the same history. Copies are cheap.
*/
class ExecutionBranch {
 public:
  ExecutionBranch() = default;

  static ExecutionBranch New(std::string name, DataSource source = {}, std::weak_ptr<RetrievalStore> store = {});

  // Rebuilds a branch from an already ordered event list (snapshot restore).
  static ExecutionBranch FromEvents(std::string name, DataSource source, std::weak_ptr<RetrievalStore> store,
                                    const std::vector<BranchEvent>& events);

  ExecutionBranch WithEvent(BranchEvent event) const;

  ExecutionBranch WithReasoningStep(ReasoningState state, std::string prompt, std::vector<ToolExecution> tool_calls = {}) const;

  ExecutionBranch WithIngestEvent(std::string source, std::vector<std::string> ids) const;

  ExecutionBranch WithSource(DataSource source) const;

  // Same history under a new name; later appends on either side stay private.
  ExecutionBranch Fork(std::string new_name, std::weak_ptr<RetrievalStore> new_store) const;

  // Oldest first.
  std::vector<BranchEvent> Events() const;

  BranchState Replay() const;

  std::size_t Size() const;

  bool Empty() const {
    return Size() == 0;
  }

  const std::string& Name() const {
    return name_;
  }

  const DataSource& Source() const {
    return source_;
  }

  // Null once the owner has released the store.
  std::shared_ptr<RetrievalStore> Store() const {
    return store_.lock();
  }

 private:
  struct Node {
    BranchEvent                         event;
    mutable std::shared_ptr<const Node> prev;
    std::size_t                         depth = 1;

    ~Node();
  };

  ExecutionBranch(std::string name, DataSource source, std::weak_ptr<RetrievalStore> store, std::shared_ptr<const Node> head);

  std::string                   name_;
  DataSource                    source_;
  std::weak_ptr<RetrievalStore> store_;
  std::shared_ptr<const Node>   head_;
};

} // namespace epicflow::branch
