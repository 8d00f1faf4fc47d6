#include "combat_systems.h"
#include "combat_components.h"

namespace skirmish {

void register_combat_components(flecs::world &ecs) {
  ecs.component<IsAlive>("IsAlive");
  ecs.component<Stunned>("Stunned");
  ecs.component<ActionCooldown>("ActionCooldown");
}

void register_cooldown_systems(flecs::world &ecs) {
  // ── Action Cooldown Tick ────────────────────────────────────
  // Same shape as a reload timer: count down, clamp at zero.
  // Dead combatants keep ticking so a revive doesn't inherit a
  // frozen cooldown.
  ecs.system<ActionCooldown>("ActionCooldownTick")
      .each([](flecs::entity e, ActionCooldown &cd) {
        float dt = e.world().delta_time();
        if (dt <= 0.0f)
          return;
        if (cd.remaining > 0.0f) {
          cd.remaining -= dt;
          if (cd.remaining < 0.0f)
            cd.remaining = 0.0f;
        }
      });
}

} // namespace skirmish
