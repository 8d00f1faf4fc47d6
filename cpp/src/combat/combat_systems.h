#ifndef SKIRMISH_COMBAT_SYSTEMS_H
#define SKIRMISH_COMBAT_SYSTEMS_H

#include <flecs.h>

namespace skirmish {

// Components in combat_components.h, named for the flecs explorer.
void register_combat_components(flecs::world &ecs);

// ActionCooldownTick: counts ActionCooldown down on every progress().
void register_cooldown_systems(flecs::world &ecs);

} // namespace skirmish

#endif // SKIRMISH_COMBAT_SYSTEMS_H
