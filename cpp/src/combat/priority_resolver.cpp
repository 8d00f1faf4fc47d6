#include "priority_resolver.h"

namespace skirmish {

PriorityTable default_priority_table() {
  return {
      {ACTION_SPECIAL_ABILITY, 100},
      {ACTION_CHAIN, 75},
      {ACTION_BASIC_ATTACK, 50},
      {ACTION_CONTEXTUAL, 10},
  };
}

PriorityResolver::PriorityResolver() : table_(default_priority_table()) {}

PriorityResolver::PriorityResolver(PriorityTable table)
    : table_(std::move(table)) {}

int PriorityResolver::priority_of(const ActionRequest &request,
                                  const flecs::world & /*state*/) const {
  auto it = table_.find(request.kind());
  return it != table_.end() ? it->second : 0;
}

ActionRequestPtr
PriorityResolver::resolve(const std::vector<ActionRequestPtr> &requests,
                          const flecs::world &state) const {
  ActionRequestPtr best;
  int best_priority = 0;

  for (const auto &candidate : requests) {
    if (!candidate)
      continue;
    int p = priority_of(*candidate, state);
    // Strict '>' keeps the first-encountered request among equals.
    if (!best || p > best_priority) {
      best = candidate;
      best_priority = p;
    }
  }
  return best;
}

std::vector<ActionRequestPtr>
PriorityResolver::resolve_per_source(const std::vector<ActionRequestPtr> &frame,
                                     const flecs::world &state) const {
  std::vector<std::string> order;
  std::unordered_map<std::string, std::vector<ActionRequestPtr>> by_source;
  for (const auto &request : frame) {
    if (!request || request->is_cancelled())
      continue;
    auto &bucket = by_source[request->source()];
    if (bucket.empty())
      order.push_back(request->source());
    bucket.push_back(request);
  }

  std::vector<ActionRequestPtr> winners;
  winners.reserve(order.size());
  for (const auto &source : order)
    winners.push_back(resolve(by_source[source], state));
  return winners;
}

void PriorityResolver::set_priority(const std::string &kind, int priority) {
  table_[kind] = priority;
}

} // namespace skirmish
