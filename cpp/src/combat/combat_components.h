#ifndef SKIRMISH_COMBAT_COMPONENTS_H
#define SKIRMISH_COMBAT_COMPONENTS_H

#include <cstdint>

/**
 * Skirmish Engine: ECS components read by the default pipeline stages.
 *
 * POD only. Actors are named flecs entities; ActionRequest::source()
 * is the entity name. Custom strategies are free to use any other
 * components in the world.
 */

// ─── Combatant state ──────────────────────────────────────
struct IsAlive {}; // Tag: may act
struct Stunned {}; // Tag: may not act

struct ActionCooldown {
  float remaining; // Seconds until the combatant may act again
}; // 4 bytes

#endif // SKIRMISH_COMBAT_COMPONENTS_H
