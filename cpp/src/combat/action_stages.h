#ifndef SKIRMISH_ACTION_STAGES_H
#define SKIRMISH_ACTION_STAGES_H

#include "combat_config.h"
#include "pipeline_interfaces.h"
#include <functional>

namespace skirmish {

class CombatEventBus;

// ═════════════════════════════════════════════════════════════
// PIPELINE STAGES
//
// Three small strategies composed at pipeline construction:
//   pre_check  → gate only, must not mutate the world
//   execute    → all world mutation + event announcements
//   post_react → cooldowns, follow-up scheduling
// Any of them may be a plain lambda; the factories below build
// the stock variants.
// ═════════════════════════════════════════════════════════════
using PreCheckStage = std::function<bool(const ActionRequest &, flecs::world &)>;
using ExecuteStage = std::function<void(const ActionRequest &, flecs::world &)>;
using PostReactStage =
    std::function<void(const ActionRequest &, flecs::world &)>;

struct ActionStages {
  PreCheckStage pre_check;
  ExecuteStage execute;
  PostReactStage post_react;
};

// Rejects cancelled requests, then defers to the gate.
// `gate` must outlive the returned stage.
PreCheckStage make_default_pre_check(const ValidationGate &gate);

// action_started → systems trigger → action_completed (queued).
ExecuteStage make_default_execute(CombatEventBus &bus,
                                  SystemsTrigger &trigger);

// Pulls a ChainDefinition out of the request context and hands it to
// the chain system. A context of any other type is logged and nothing
// is touched.
ExecuteStage make_chain_execute(CombatEventBus &bus, ChainExecutor &chains);

// Arms the source's ActionCooldown from `cooldowns`.
PostReactStage make_cooldown_post_react(CooldownTable cooldowns);

ActionStages make_default_stages(const ValidationGate &gate,
                                 CombatEventBus &bus, SystemsTrigger &trigger,
                                 CooldownTable cooldowns);

ActionStages make_chain_stages(const ValidationGate &gate, CombatEventBus &bus,
                               ChainExecutor &chains, CooldownTable cooldowns);

} // namespace skirmish

#endif // SKIRMISH_ACTION_STAGES_H
