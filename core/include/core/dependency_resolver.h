#pragma once

#include "core/work_item.h"

#include <string>
#include <unordered_set>
#include <vector>

namespace convoy::core {

/// Items whose status is PENDING and whose every dependency id is in
/// `completed`. Input order is preserved, which the scheduler uses as its
/// start preference; callers must not rely on it for correctness.
///
/// No cycle detection and no existence check is performed: an item that
/// depends on an id that never completes (cycle, forward reference to an
/// item that was never created) is simply never ready.
std::vector<WorkItem>
ready_items(const std::vector<WorkItem> &items,
            const std::unordered_set<std::string> &completed);

/// Dependency ids that name neither an item in `items` nor an id in
/// `completed`. Diagnostic only, used when reporting a stalled milestone.
std::vector<std::string>
dangling_dependencies(const std::vector<WorkItem> &items,
                      const std::unordered_set<std::string> &completed);

} // namespace convoy::core
