#include "tamma/events/event_sink.hpp"

#include "tamma/util/log.hpp"

namespace tamma {

auto LogEventSink::emit(const Event& event) -> Result<void> {
  nlohmann::json tags(event.tags);
  log::info("event {} tags={} payload={}", event.type, tags.dump(),
            event.payload.dump());
  return ok();
}

auto emit_event(EventSink& sink, Event event) -> Result<void> {
  auto r = sink.emit(event);
  if (r) {
    return ok();
  }
  if (event.delivery == Delivery::BestEffort) {
    log::warn("Dropped event {}: {}", event.type, r.error().message());
    return ok();
  }
  log::error("Critical event {} not recorded: {}", event.type,
             r.error().message());
  return fail(Error::AuditFailed);
}

}  // namespace tamma
