#include "core/dependency_resolver.h"

#include <algorithm>

namespace convoy::core {

std::vector<WorkItem>
ready_items(const std::vector<WorkItem> &items,
            const std::unordered_set<std::string> &completed) {
  std::vector<WorkItem> ready;
  for (const auto &item : items) {
    if (item.status != WorkItemStatus::Pending) {
      continue;
    }
    const bool deps_met =
        std::all_of(item.dependencies.begin(), item.dependencies.end(),
                    [&completed](const std::string &dep) {
                      return completed.count(dep) > 0;
                    });
    if (deps_met) {
      ready.push_back(item);
    }
  }
  return ready;
}

std::vector<std::string>
dangling_dependencies(const std::vector<WorkItem> &items,
                      const std::unordered_set<std::string> &completed) {
  std::unordered_set<std::string> known;
  for (const auto &item : items) {
    known.insert(item.id);
  }

  std::vector<std::string> dangling;
  std::unordered_set<std::string> seen;
  for (const auto &item : items) {
    for (const auto &dep : item.dependencies) {
      if (known.count(dep) || completed.count(dep)) {
        continue;
      }
      if (seen.insert(dep).second) {
        dangling.push_back(dep);
      }
    }
  }
  return dangling;
}

} // namespace convoy::core
