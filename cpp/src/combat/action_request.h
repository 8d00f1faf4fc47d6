#ifndef SKIRMISH_ACTION_REQUEST_H
#define SKIRMISH_ACTION_REQUEST_H

#include <any>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace skirmish {

// ─── Well-known action kinds ──────────────────────────────
// Kinds are open strings; these are the ones the default
// priority table and cooldown table know about.
inline constexpr const char *ACTION_SPECIAL_ABILITY = "special_ability";
inline constexpr const char *ACTION_CHAIN = "chain_action";
inline constexpr const char *ACTION_BASIC_ATTACK = "basic_attack";
inline constexpr const char *ACTION_CONTEXTUAL = "contextual_action";

using RequestId = uint64_t;
using Clock = std::chrono::system_clock;

/**
 * One requested action. Everything except the cancellation flag is
 * fixed at construction.
 *
 * Cancellation is one-shot and monotonic: false → true, never back.
 * The pipeline does NOT halt on cancel by itself. Stages doing
 * irreversible work must poll is_cancelled() before committing.
 */
class ActionRequest {
public:
  ActionRequest(std::string kind, std::string source,
                Clock::time_point created_at = Clock::now(),
                std::any context = {});

  ActionRequest(const ActionRequest &) = delete;
  ActionRequest &operator=(const ActionRequest &) = delete;

  RequestId id() const { return id_; }
  const std::string &kind() const { return kind_; }
  const std::string &source() const { return source_; }
  Clock::time_point created_at() const { return created_at_; }
  const std::any &context() const { return context_; }

  // Typed view of the context, nullptr when it holds something else.
  template <typename T> const T *context_as() const {
    return std::any_cast<T>(&context_);
  }

  // Returns true only for the call that performed the transition.
  bool cancel() noexcept;
  bool is_cancelled() const noexcept;

private:
  const RequestId id_;
  const std::string kind_;
  const std::string source_;
  const Clock::time_point created_at_;
  const std::any context_;
  std::atomic<bool> cancelled_{false};
};

using ActionRequestPtr = std::shared_ptr<ActionRequest>;

ActionRequestPtr make_request(std::string kind, std::string source,
                              std::any context = {});

} // namespace skirmish

#endif // SKIRMISH_ACTION_REQUEST_H
