#include "validation_gate.h"
#include "combat_components.h"

namespace skirmish {

bool EcsValidationGate::is_valid(const ActionRequest &request,
                                 flecs::world &state) const {
  if (request.source().empty())
    return false;

  flecs::entity actor = state.lookup(request.source().c_str());
  if (actor.id() == 0 || !actor.is_alive())
    return false;
  if (!actor.has<IsAlive>() || actor.has<Stunned>())
    return false;
  if (actor.has<ActionCooldown>() &&
      actor.get<ActionCooldown>().remaining > 0.0f)
    return false;
  return true;
}

} // namespace skirmish
