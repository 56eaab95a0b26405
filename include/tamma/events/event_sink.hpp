#pragma once

#include "tamma/core/error.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>

namespace tamma {

enum class Delivery : std::uint8_t {
  BestEffort,  // failures are logged and dropped
  Critical,    // failures reach the caller as Error::AuditFailed
};

struct Event {
  std::string type;
  std::map<std::string, std::string> tags;
  nlohmann::json payload = nlohmann::json::object();
  Delivery delivery{Delivery::BestEffort};
};

// Audit sink. Implementations are called synchronously from the component
// that owns the state transition, after that transition is durable.
class EventSink {
public:
  virtual ~EventSink() = default;
  [[nodiscard]] virtual auto emit(const Event& event) -> Result<void> = 0;
};

// Writes events to the process log.
class LogEventSink final : public EventSink {
public:
  [[nodiscard]] auto emit(const Event& event) -> Result<void> override;
};

// Applies the delivery policy of the event.
[[nodiscard]] auto emit_event(EventSink& sink, Event event) -> Result<void>;

}  // namespace tamma
