#include "action_stages.h"
#include "combat_components.h"
#include "combat_event_bus.h"
#include "combat_log.h"

namespace skirmish {

static ActionPayload action_payload(const ActionRequest &request) {
  return ActionPayload{request.id(), request.kind()};
}

PreCheckStage make_default_pre_check(const ValidationGate &gate) {
  return [&gate](const ActionRequest &request, flecs::world &state) {
    if (request.is_cancelled())
      return false;
    return gate.is_valid(request, state);
  };
}

ExecuteStage make_default_execute(CombatEventBus &bus,
                                  SystemsTrigger &trigger) {
  return [&bus, &trigger](const ActionRequest &request, flecs::world &state) {
    // Last safe point before effects are committed.
    if (request.is_cancelled()) {
      log_info("Action ", request.kind(), " #", request.id(),
               " cancelled before execute, skipping");
      return;
    }
    bus.raise(EVENT_ACTION_STARTED, request.source(), "",
              action_payload(request));
    trigger.trigger(request, state);
    bus.raise(EVENT_ACTION_COMPLETED, request.source(), "",
              action_payload(request));
  };
}

ExecuteStage make_chain_execute(CombatEventBus &bus, ChainExecutor &chains) {
  return [&bus, &chains](const ActionRequest &request, flecs::world &) {
    const ChainDefinition *chain = request.context_as<ChainDefinition>();
    if (!chain) {
      log_error("Chain action #", request.id(), " from '", request.source(),
                "' has no ChainDefinition context, nothing executed");
      return;
    }
    if (request.is_cancelled()) {
      log_info("Chain '", chain->chain_id, "' #", request.id(),
               " cancelled before execute, skipping");
      return;
    }
    bus.raise(EVENT_ACTION_STARTED, request.source(), chain->target,
              action_payload(request));
    chains.start_chain(*chain, request.source());
    bus.raise(EVENT_ACTION_COMPLETED, request.source(), chain->target,
              action_payload(request));
  };
}

PostReactStage make_cooldown_post_react(CooldownTable cooldowns) {
  return [cooldowns = std::move(cooldowns)](const ActionRequest &request,
                                            flecs::world &state) {
    auto it = cooldowns.find(request.kind());
    if (it == cooldowns.end() || it->second <= 0.0f)
      return;

    flecs::entity actor = state.lookup(request.source().c_str());
    if (actor.id() == 0 || !actor.is_alive())
      return;
    actor.set<ActionCooldown>({it->second});
  };
}

ActionStages make_default_stages(const ValidationGate &gate,
                                 CombatEventBus &bus, SystemsTrigger &trigger,
                                 CooldownTable cooldowns) {
  return {make_default_pre_check(gate), make_default_execute(bus, trigger),
          make_cooldown_post_react(std::move(cooldowns))};
}

ActionStages make_chain_stages(const ValidationGate &gate, CombatEventBus &bus,
                               ChainExecutor &chains,
                               CooldownTable cooldowns) {
  return {make_default_pre_check(gate), make_chain_execute(bus, chains),
          make_cooldown_post_react(std::move(cooldowns))};
}

} // namespace skirmish
