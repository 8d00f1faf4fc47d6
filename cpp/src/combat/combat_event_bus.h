#ifndef SKIRMISH_COMBAT_EVENT_BUS_H
#define SKIRMISH_COMBAT_EVENT_BUS_H

#include "combat_config.h"
#include "combat_event.h"
#include "ring_buffer.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

namespace skirmish {

class CombatEventListener {
public:
  virtual ~CombatEventListener() = default;
  virtual void on_combat_event(const CombatEvent &event) = 0;
};

// Adapter for lambdas (GDScript signal bridge, tests, one-off hooks).
class CallbackListener final : public CombatEventListener {
public:
  explicit CallbackListener(std::function<void(const CombatEvent &)> fn)
      : fn_(std::move(fn)) {}
  void on_combat_event(const CombatEvent &event) override { fn_(event); }

private:
  std::function<void(const CombatEvent &)> fn_;
};

struct EventBusStats {
  uint64_t raised = 0;
  uint64_t dispatched = 0;
  uint64_t evicted = 0;
  uint64_t listener_faults = 0;
};

/**
 * Publish/subscribe hub for combat consequences.
 *
 * Construct one at simulation start and hand it by reference to every
 * system that publishes or listens; there is no global instance.
 *
 * One coarse lock serializes every operation, reads included, so the
 * subscriber lists, the queue and the log are never seen half-updated.
 * The lock is recursive: a listener may raise() or unsubscribe() from
 * inside its own notification on the dispatching thread.
 *
 * Listeners are NOT owned. Unsubscribe before destroying one.
 */
class CombatEventBus {
public:
  explicit CombatEventBus(EventBusConfig config = {});

  CombatEventBus(const CombatEventBus &) = delete;
  CombatEventBus &operator=(const CombatEventBus &) = delete;

  // Idempotent per (listener, kind). Notification order = registration
  // order.
  void subscribe(CombatEventListener *listener,
                 const std::vector<CombatEventKind> &kinds);
  void unsubscribe(CombatEventListener *listener);

  // immediate: notify + log now. Otherwise queued for dispatch_queued().
  // Kinds outside CombatEventKind are logged and dropped.
  void raise(CombatEventKind kind, const std::string &actor,
             const std::string &target, EventPayload payload = {},
             bool immediate = false);

  // Leaky bucket: accumulates `delta_seconds` and flushes at most
  // batch_size queued events (FIFO) once throttle_ms has elapsed.
  // Returns the number of events dispatched. A listener exception not
  // derived from std::exception is rethrown after the event is logged.
  size_t dispatch_queued(double delta_seconds);

  // Up to `count` logged events of `kind`, most recent first.
  std::vector<CombatEvent> recent(CombatEventKind kind, size_t count) const;

  static std::vector<uint8_t> serialize(const CombatEvent &event);
  static CombatEvent deserialize(const std::vector<uint8_t> &bytes);

  size_t pending_count() const;
  size_t log_size() const;
  size_t subscriber_count(CombatEventKind kind) const;
  EventBusStats stats() const;
  const EventBusConfig &config() const { return config_; }

  // Drops queued events, the log and the throttle accumulator.
  // Subscriptions survive.
  void clear();

private:
  void dispatch_locked(const CombatEvent &event);
  void record_locked(const CombatEvent &event);

  const EventBusConfig config_;

  mutable std::recursive_mutex mutex_;
  std::array<std::vector<CombatEventListener *>, COMBAT_EVENT_KIND_COUNT>
      subscribers_;
  std::deque<CombatEvent> queue_;
  RingBuffer<CombatEvent> log_;
  double accumulator_ms_ = 0.0;
  EventBusStats stats_;
};

} // namespace skirmish

#endif // SKIRMISH_COMBAT_EVENT_BUS_H
