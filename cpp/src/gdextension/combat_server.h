#ifndef SKIRMISH_COMBAT_SERVER_H
#define SKIRMISH_COMBAT_SERVER_H

#include "../combat/action_pipeline.h"
#include "../combat/combat_event_bus.h"
#include "../combat/error_reporter.h"
#include "../combat/pipeline_profiler.h"
#include "../combat/priority_resolver.h"
#include "../combat/validation_gate.h"
#include <flecs.h>
#include <godot_cpp/classes/node.hpp>
#include <godot_cpp/variant/array.hpp>
#include <godot_cpp/variant/dictionary.hpp>
#include <godot_cpp/variant/packed_string_array.hpp>
#include <memory>
#include <mutex>
#include <vector>

namespace godot {

/**
 * Scene-tree owner of the combat core. Requests submitted during a
 * frame are arbitrated per source in _process, the winners run through
 * the pipeline, then the event bus flushes and every delivered event is
 * re-emitted as the `combat_event` signal.
 */
class CombatServer : public Node {
  GDCLASS(CombatServer, Node)

private:
  flecs::world ecs;
  skirmish::CombatConfig config;

  std::unique_ptr<skirmish::CombatEventBus> bus;
  std::unique_ptr<skirmish::PipelineProfiler> profiler;
  std::unique_ptr<skirmish::LoggingErrorReporter> reporter;
  std::unique_ptr<skirmish::EcsValidationGate> gate;
  std::unique_ptr<skirmish::PriorityResolver> resolver;
  std::unique_ptr<skirmish::SystemsTrigger> trigger;
  std::unique_ptr<skirmish::ChainExecutor> chains;
  std::unique_ptr<skirmish::CombatEventListener> signal_bridge;
  std::unique_ptr<skirmish::ActionPipeline> default_pipeline;
  std::unique_ptr<skirmish::ActionPipeline> chain_pipeline;

  // Requests may arrive from worker threads (netcode, background AI).
  std::mutex pending_mutex;
  std::vector<skirmish::ActionRequestPtr> pending;

protected:
  static void _bind_methods();

public:
  CombatServer();
  ~CombatServer();

  void _ready() override;
  void _process(double delta) override;

  void init_combat();

  // --- GDScript API ---
  void spawn_combatant(const String &name);
  void kill_combatant(const String &name);
  void set_stunned(const String &name, bool stunned);
  float get_cooldown(const String &name);

  int64_t submit_action(const String &kind, const String &source);
  int64_t submit_chain(const String &source, const String &chain_id,
                       const PackedStringArray &steps, const String &target);
  bool cancel_action(int64_t request_id);
  int get_pending_count();

  void raise_custom(const String &name, const String &actor,
                    const String &target, const Dictionary &data,
                    bool immediate);
  Array get_recent_events(const String &kind, int count) const;
  Dictionary get_bus_stats() const;
  String get_pipeline_stats() const;

  // Used by the signal bridge.
  void emit_combat_event(const skirmish::CombatEvent &event);
};

} // namespace godot

#endif // SKIRMISH_COMBAT_SERVER_H
