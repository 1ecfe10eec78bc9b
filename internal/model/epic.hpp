#pragma once

#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace epicflow::model {

/*
  Registered unit of work. Immutable once registered.
*/
struct Epic {
  std::string epic_id;
  std::string title;
  std::string description;

  // Registration order; also the order GetAssignments reports in.
  std::vector<std::string> sub_task_ids;

  util::TimePoint created_at;
};

} // namespace epicflow::model
