#include "combat_event_bus.h"
#include "combat_log.h"
#include "event_codec.h"
#include <algorithm>
#include <stdexcept>

namespace skirmish {

static const EventBusConfig &validated(const EventBusConfig &config) {
  if (config.log_capacity == 0)
    throw std::invalid_argument("event bus log_capacity must be > 0");
  if (config.batch_size == 0)
    throw std::invalid_argument("event bus batch_size must be > 0");
  if (config.throttle_ms < 0.0)
    throw std::invalid_argument("event bus throttle_ms must be >= 0");
  return config;
}

CombatEventBus::CombatEventBus(EventBusConfig config)
    : config_(validated(config)), log_(config.log_capacity) {}

void CombatEventBus::subscribe(CombatEventListener *listener,
                               const std::vector<CombatEventKind> &kinds) {
  if (!listener)
    return;
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  for (CombatEventKind kind : kinds) {
    if (kind >= COMBAT_EVENT_KIND_COUNT)
      continue;
    auto &list = subscribers_[kind];
    if (std::find(list.begin(), list.end(), listener) == list.end())
      list.push_back(listener);
  }
}

void CombatEventBus::unsubscribe(CombatEventListener *listener) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  for (auto &list : subscribers_)
    list.erase(std::remove(list.begin(), list.end(), listener), list.end());
}

void CombatEventBus::raise(CombatEventKind kind, const std::string &actor,
                           const std::string &target, EventPayload payload,
                           bool immediate) {
  if (kind >= COMBAT_EVENT_KIND_COUNT) {
    log_error("Dropped event with unknown kind ", (int)kind, " from '", actor,
              "'");
    return;
  }
  CombatEvent event{kind, actor, target, std::move(payload),
                    event_clock_now()};

  std::lock_guard<std::recursive_mutex> lock(mutex_);
  stats_.raised++;
  if (immediate)
    dispatch_locked(event);
  else
    queue_.push_back(std::move(event));
}

size_t CombatEventBus::dispatch_queued(double delta_seconds) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);

  if (delta_seconds > 0.0)
    accumulator_ms_ += delta_seconds * 1000.0;
  if (accumulator_ms_ < config_.throttle_ms)
    return 0;
  accumulator_ms_ = 0.0;

  size_t sent = 0;
  while (sent < config_.batch_size && !queue_.empty()) {
    CombatEvent event = std::move(queue_.front());
    queue_.pop_front();
    dispatch_locked(event);
    sent++;
  }
  return sent;
}

void CombatEventBus::dispatch_locked(const CombatEvent &event) {
  // Snapshot: a listener may (un)subscribe while we iterate.
  const std::vector<CombatEventListener *> listeners =
      subscribers_[event.kind];

  for (CombatEventListener *listener : listeners) {
    // Skip anyone removed by an earlier listener in this same pass.
    const auto &live = subscribers_[event.kind];
    if (std::find(live.begin(), live.end(), listener) == live.end())
      continue;

    try {
      listener->on_combat_event(event);
    } catch (const std::exception &e) {
      // One faulty subscriber must not starve the rest.
      stats_.listener_faults++;
      log_error("Listener fault on ", kind_name(event.kind), " from '",
                event.actor, "': ", e.what());
    } catch (...) {
      // Not ours to swallow. Record the event so the history stays whole,
      // then let it propagate to the caller.
      stats_.listener_faults++;
      log_error("Non-standard exception from listener on ",
                kind_name(event.kind), " from '", event.actor, "'");
      record_locked(event);
      throw;
    }
  }

  record_locked(event);
}

void CombatEventBus::record_locked(const CombatEvent &event) {
  if (log_.push(event))
    stats_.evicted++;
  stats_.dispatched++;
}

std::vector<CombatEvent> CombatEventBus::recent(CombatEventKind kind,
                                                size_t count) const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  std::vector<CombatEvent> out;
  for (size_t i = log_.size(); i > 0 && out.size() < count; i--) {
    const CombatEvent &event = log_.at(i - 1);
    if (event.kind == kind)
      out.push_back(event);
  }
  return out;
}

std::vector<uint8_t> CombatEventBus::serialize(const CombatEvent &event) {
  return encode_event(event);
}

CombatEvent CombatEventBus::deserialize(const std::vector<uint8_t> &bytes) {
  return decode_event(bytes);
}

size_t CombatEventBus::pending_count() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return queue_.size();
}

size_t CombatEventBus::log_size() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return log_.size();
}

size_t CombatEventBus::subscriber_count(CombatEventKind kind) const {
  if (kind >= COMBAT_EVENT_KIND_COUNT)
    return 0;
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return subscribers_[kind].size();
}

EventBusStats CombatEventBus::stats() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return stats_;
}

void CombatEventBus::clear() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  queue_.clear();
  log_.clear();
  accumulator_ms_ = 0.0;
}

} // namespace skirmish
