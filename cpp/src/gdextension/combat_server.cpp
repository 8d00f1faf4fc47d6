#include "combat_server.h"
#include "../combat/combat_components.h"
#include "../combat/combat_log.h"
#include "../combat/combat_systems.h"
#include "../combat/event_codec.h"
#include <godot_cpp/classes/engine.hpp>
#include <godot_cpp/classes/file_access.hpp>
#include <godot_cpp/classes/json.hpp>
#include <godot_cpp/core/class_db.hpp>
#include <godot_cpp/variant/utility_functions.hpp>

namespace {

const char *CONFIG_PATH = "res://res/data/combat.json";

std::string to_std(const godot::String &s) { return s.utf8().get_data(); }
godot::String to_godot(const std::string &s) {
  return godot::String::utf8(s.c_str());
}

// ── Collaborators that surface as Godot signals ───────────────
class SignalSystemsTrigger final : public skirmish::SystemsTrigger {
public:
  explicit SignalSystemsTrigger(godot::Node *owner) : owner_(owner) {}
  void trigger(const skirmish::ActionRequest &request,
               flecs::world &) override {
    owner_->emit_signal("action_triggered", to_godot(request.kind()),
                        to_godot(request.source()), (int64_t)request.id());
  }

private:
  godot::Node *owner_;
};

class SignalChainExecutor final : public skirmish::ChainExecutor {
public:
  explicit SignalChainExecutor(godot::Node *owner) : owner_(owner) {}
  void start_chain(const skirmish::ChainDefinition &definition,
                   const std::string &owner) override {
    godot::PackedStringArray steps;
    for (const auto &step : definition.steps)
      steps.push_back(to_godot(step));
    owner_->emit_signal("chain_started", to_godot(definition.chain_id),
                        to_godot(owner), steps, to_godot(definition.target));
  }

private:
  godot::Node *owner_;
};

class SignalBridge final : public skirmish::CombatEventListener {
public:
  explicit SignalBridge(godot::CombatServer *server) : server_(server) {}
  void on_combat_event(const skirmish::CombatEvent &event) override {
    server_->emit_combat_event(event);
  }

private:
  godot::CombatServer *server_;
};

godot::Dictionary event_to_dictionary(const skirmish::CombatEvent &event) {
  nlohmann::json j = skirmish::event_to_json(event);
  godot::Dictionary d;
  d["kind"] = godot::String(skirmish::kind_name(event.kind));
  d["actor"] = to_godot(event.actor);
  d["target"] = to_godot(event.target);
  d["timestamp_us"] = j["ts_us"].get<int64_t>();
  d["payload"] = godot::JSON::parse_string(to_godot(j["payload"].dump()));
  return d;
}

} // namespace

namespace godot {

CombatServer::CombatServer() {}

CombatServer::~CombatServer() {
  if (bus && signal_bridge)
    bus->unsubscribe(signal_bridge.get());
  skirmish::set_log_sink({});
}

void CombatServer::_bind_methods() {
  ClassDB::bind_method(D_METHOD("spawn_combatant", "name"),
                       &CombatServer::spawn_combatant);
  ClassDB::bind_method(D_METHOD("kill_combatant", "name"),
                       &CombatServer::kill_combatant);
  ClassDB::bind_method(D_METHOD("set_stunned", "name", "stunned"),
                       &CombatServer::set_stunned);
  ClassDB::bind_method(D_METHOD("get_cooldown", "name"),
                       &CombatServer::get_cooldown);

  ClassDB::bind_method(D_METHOD("submit_action", "kind", "source"),
                       &CombatServer::submit_action);
  ClassDB::bind_method(
      D_METHOD("submit_chain", "source", "chain_id", "steps", "target"),
      &CombatServer::submit_chain);
  ClassDB::bind_method(D_METHOD("cancel_action", "request_id"),
                       &CombatServer::cancel_action);
  ClassDB::bind_method(D_METHOD("get_pending_count"),
                       &CombatServer::get_pending_count);

  ClassDB::bind_method(D_METHOD("raise_custom", "name", "actor", "target",
                                "data", "immediate"),
                       &CombatServer::raise_custom);
  ClassDB::bind_method(D_METHOD("get_recent_events", "kind", "count"),
                       &CombatServer::get_recent_events);
  ClassDB::bind_method(D_METHOD("get_bus_stats"),
                       &CombatServer::get_bus_stats);
  ClassDB::bind_method(D_METHOD("get_pipeline_stats"),
                       &CombatServer::get_pipeline_stats);

  ADD_SIGNAL(MethodInfo("combat_event",
                        PropertyInfo(Variant::DICTIONARY, "event")));
  ADD_SIGNAL(MethodInfo("action_triggered",
                        PropertyInfo(Variant::STRING, "kind"),
                        PropertyInfo(Variant::STRING, "source"),
                        PropertyInfo(Variant::INT, "request_id")));
  ADD_SIGNAL(MethodInfo("chain_started",
                        PropertyInfo(Variant::STRING, "chain_id"),
                        PropertyInfo(Variant::STRING, "owner"),
                        PropertyInfo(Variant::PACKED_STRING_ARRAY, "steps"),
                        PropertyInfo(Variant::STRING, "target")));
}

void CombatServer::_ready() {
  if (Engine::get_singleton()->is_editor_hint()) {
    return;
  }
  init_combat();
}

void CombatServer::init_combat() {
  skirmish::set_log_sink(
      [](skirmish::LogLevel level, const std::string &message) {
        String line = String("[SkirmishEngine] ") + to_godot(message);
        if (level == skirmish::LOG_INFO)
          UtilityFunctions::print(line);
        else
          UtilityFunctions::printerr(line);
      });

  skirmish::log_info("Initializing combat core...");

  // 1. Config (defaults survive a missing or broken file)
  if (FileAccess::file_exists(CONFIG_PATH)) {
    config = skirmish::parse_combat_config(
        to_std(FileAccess::get_file_as_string(CONFIG_PATH)));
  } else {
    skirmish::log_error("Failed to find ", CONFIG_PATH,
                        ", using default combat config");
    config = skirmish::default_combat_config();
  }

  // 2. ECS
  skirmish::register_combat_components(ecs);
  skirmish::register_cooldown_systems(ecs);

  // 3. Bus + collaborators
  bus = std::make_unique<skirmish::CombatEventBus>(config.event_bus);
  profiler = std::make_unique<skirmish::PipelineProfiler>();
  reporter = std::make_unique<skirmish::LoggingErrorReporter>(bus.get());
  gate = std::make_unique<skirmish::EcsValidationGate>();
  resolver = std::make_unique<skirmish::PriorityResolver>(config.priorities);
  trigger = std::make_unique<SignalSystemsTrigger>(this);
  chains = std::make_unique<SignalChainExecutor>(this);

  // 4. Pipelines
  default_pipeline = std::make_unique<skirmish::ActionPipeline>(
      skirmish::make_default_stages(*gate, *bus, *trigger, config.cooldowns),
      *profiler, *reporter);
  chain_pipeline = std::make_unique<skirmish::ActionPipeline>(
      skirmish::make_chain_stages(*gate, *bus, *chains, config.cooldowns),
      *profiler, *reporter);

  // 5. Every event kind → combat_event signal
  signal_bridge = std::make_unique<SignalBridge>(this);
  std::vector<skirmish::CombatEventKind> all_kinds;
  for (int i = 0; i < skirmish::COMBAT_EVENT_KIND_COUNT; i++)
    all_kinds.push_back((skirmish::CombatEventKind)i);
  bus->subscribe(signal_bridge.get(), all_kinds);

  skirmish::log_info("Combat core ready (throttle ", config.event_bus.throttle_ms,
                     "ms, batch ", config.event_bus.batch_size, ", log ",
                     config.event_bus.log_capacity, ")");
}

void CombatServer::_process(double delta) {
  if (!bus)
    return;

  ecs.progress((float)delta);

  // Take this frame's requests; anything submitted during the run waits
  // for the next frame.
  std::vector<skirmish::ActionRequestPtr> frame;
  {
    std::lock_guard<std::mutex> lock(pending_mutex);
    frame.swap(pending);
  }

  for (const auto &winner : resolver->resolve_per_source(frame, ecs)) {
    skirmish::ActionPipeline &pipeline =
        winner->kind() == skirmish::ACTION_CHAIN ? *chain_pipeline
                                                 : *default_pipeline;
    try {
      pipeline.run(*winner, ecs);
    } catch (const std::exception &e) {
      // Already reported by the pipeline; keep the frame going for the
      // other sources.
      skirmish::log_error("Action #", winner->id(), " aborted: ", e.what());
    }
  }

  bus->dispatch_queued(delta);
}

// ── Combatants ────────────────────────────────────────────────
void CombatServer::spawn_combatant(const String &name) {
  std::string n = to_std(name);
  ecs.entity(n.c_str()).add<IsAlive>().set<ActionCooldown>({0.0f});
  skirmish::log_info("Spawned combatant '", n, "'");
}

void CombatServer::kill_combatant(const String &name) {
  flecs::entity e = ecs.lookup(to_std(name).c_str());
  if (e.id() == 0)
    return;
  e.remove<IsAlive>();
  if (bus)
    bus->raise(skirmish::EVENT_STATUS_CHANGED, to_std(name), "",
               skirmish::StatusPayload{"dead", true});
}

void CombatServer::set_stunned(const String &name, bool stunned) {
  flecs::entity e = ecs.lookup(to_std(name).c_str());
  if (e.id() == 0)
    return;
  if (stunned)
    e.add<Stunned>();
  else
    e.remove<Stunned>();
  if (bus)
    bus->raise(skirmish::EVENT_STATUS_CHANGED, to_std(name), "",
               skirmish::StatusPayload{"stunned", stunned});
}

float CombatServer::get_cooldown(const String &name) {
  flecs::entity e = ecs.lookup(to_std(name).c_str());
  if (e.id() == 0 || !e.has<ActionCooldown>())
    return 0.0f;
  return e.get<ActionCooldown>().remaining;
}

// ── Requests ──────────────────────────────────────────────────
int64_t CombatServer::submit_action(const String &kind, const String &source) {
  auto request = skirmish::make_request(to_std(kind), to_std(source));
  std::lock_guard<std::mutex> lock(pending_mutex);
  pending.push_back(request);
  return (int64_t)request->id();
}

int64_t CombatServer::submit_chain(const String &source,
                                   const String &chain_id,
                                   const PackedStringArray &steps,
                                   const String &target) {
  skirmish::ChainDefinition def;
  def.chain_id = to_std(chain_id);
  def.target = to_std(target);
  for (int64_t i = 0; i < steps.size(); i++)
    def.steps.push_back(to_std(steps[i]));

  auto request = skirmish::make_request(skirmish::ACTION_CHAIN,
                                        to_std(source), std::move(def));
  std::lock_guard<std::mutex> lock(pending_mutex);
  pending.push_back(request);
  return (int64_t)request->id();
}

bool CombatServer::cancel_action(int64_t request_id) {
  std::lock_guard<std::mutex> lock(pending_mutex);
  for (auto &request : pending) {
    if ((int64_t)request->id() == request_id)
      return request->cancel();
  }
  return false;
}

int CombatServer::get_pending_count() {
  std::lock_guard<std::mutex> lock(pending_mutex);
  return (int)pending.size();
}

// ── Events ────────────────────────────────────────────────────
void CombatServer::raise_custom(const String &name, const String &actor,
                                const String &target, const Dictionary &data,
                                bool immediate) {
  if (!bus)
    return;
  nlohmann::json payload_data;
  try {
    payload_data = nlohmann::json::parse(to_std(JSON::stringify(data)));
  } catch (nlohmann::json::parse_error &e) {
    skirmish::log_error("raise_custom: bad payload for '", to_std(name),
                        "': ", e.what());
    return;
  }
  bus->raise(skirmish::EVENT_CUSTOM, to_std(actor), to_std(target),
             skirmish::CustomPayload{to_std(name), std::move(payload_data)},
             immediate);
}

Array CombatServer::get_recent_events(const String &kind, int count) const {
  Array out;
  auto parsed = skirmish::parse_kind(to_std(kind));
  if (!bus || !parsed || count <= 0)
    return out;
  for (const auto &event : bus->recent(*parsed, (size_t)count))
    out.push_back(event_to_dictionary(event));
  return out;
}

Dictionary CombatServer::get_bus_stats() const {
  Dictionary d;
  if (!bus)
    return d;
  skirmish::EventBusStats s = bus->stats();
  d["raised"] = (int64_t)s.raised;
  d["dispatched"] = (int64_t)s.dispatched;
  d["evicted"] = (int64_t)s.evicted;
  d["listener_faults"] = (int64_t)s.listener_faults;
  d["pending"] = (int64_t)bus->pending_count();
  d["logged"] = (int64_t)bus->log_size();
  return d;
}

String CombatServer::get_pipeline_stats() const {
  if (!profiler)
    return String("{}");
  return to_godot(profiler->snapshot().dump());
}

void CombatServer::emit_combat_event(const skirmish::CombatEvent &event) {
  emit_signal("combat_event", event_to_dictionary(event));
}

} // namespace godot
