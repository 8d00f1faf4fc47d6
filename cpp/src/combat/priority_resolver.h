#ifndef SKIRMISH_PRIORITY_RESOLVER_H
#define SKIRMISH_PRIORITY_RESOLVER_H

#include "action_request.h"
#include <flecs.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace skirmish {

using PriorityTable = std::unordered_map<std::string, int>;

// special_ability=100, chain_action=75, basic_attack=50,
// contextual_action=10. Anything else resolves to 0.
PriorityTable default_priority_table();

/**
 * Picks one winner among requests offered in the same tick.
 *
 * Tie-break: a later candidate only wins on a STRICTLY greater
 * priority, so among equals the first one in the input wins.
 * Callers rely on this ordering; keep it.
 */
class PriorityResolver {
public:
  PriorityResolver();
  explicit PriorityResolver(PriorityTable table);

  // `state` is unused by the table lookup; it's there for contextual
  // rules layered on top.
  int priority_of(const ActionRequest &request,
                  const flecs::world &state) const;

  // nullptr for an empty set. Null entries are skipped.
  ActionRequestPtr resolve(const std::vector<ActionRequestPtr> &requests,
                           const flecs::world &state) const;

  // One winner per source, in order of each source's first request.
  // Cancelled and null requests never take part.
  std::vector<ActionRequestPtr>
  resolve_per_source(const std::vector<ActionRequestPtr> &frame,
                     const flecs::world &state) const;

  void set_priority(const std::string &kind, int priority);
  const PriorityTable &table() const { return table_; }

private:
  PriorityTable table_;
};

} // namespace skirmish

#endif // SKIRMISH_PRIORITY_RESOLVER_H
