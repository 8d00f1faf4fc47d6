#include "action_request.h"

namespace skirmish {

namespace {

// Starts at 1: a zero id never names a live request.
std::atomic<RequestId> g_next_request_id{1};

} // namespace

ActionRequest::ActionRequest(std::string kind, std::string source,
                             Clock::time_point created_at, std::any context)
    : id_(g_next_request_id.fetch_add(1, std::memory_order_relaxed)),
      kind_(std::move(kind)), source_(std::move(source)),
      created_at_(created_at), context_(std::move(context)) {}

bool ActionRequest::cancel() noexcept {
  bool expected = false;
  return cancelled_.compare_exchange_strong(expected, true,
                                            std::memory_order_acq_rel);
}

bool ActionRequest::is_cancelled() const noexcept {
  return cancelled_.load(std::memory_order_acquire);
}

ActionRequestPtr make_request(std::string kind, std::string source,
                              std::any context) {
  return std::make_shared<ActionRequest>(std::move(kind), std::move(source),
                                         Clock::now(), std::move(context));
}

} // namespace skirmish
