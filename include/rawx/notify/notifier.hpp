#ifndef RAWX_NOTIFY_NOTIFIER_HPP
#define RAWX_NOTIFY_NOTIFIER_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include "rawx/chunk/chunk_metadata.hpp"

namespace rawx {
namespace notify {

constexpr const char* EVENT_CHUNK_NEW = "storage.chunk.new";

class NotifyError : public std::runtime_error {
public:
  explicit NotifyError(const std::string& message)
    : std::runtime_error("Notification error: " + message) {}
};

// Identity of the emitting service, attached to every event
struct NotifyContext {
  std::string service_id;
  std::string ns;
};

// Sink of chunk lifecycle events. Delivery is best effort: callers log
// failures and carry on.
class Notifier {
public:
  virtual ~Notifier() = default;
  // An empty event name means EVENT_CHUNK_NEW
  virtual void notify_new(const std::string& event, const chunk::ChunkMetadata& meta,
                          const NotifyContext& context) = 0;
};

class NullNotifier : public Notifier {
public:
  void notify_new(const std::string&, const chunk::ChunkMetadata&,
                  const NotifyContext&) override {}
};

// Renders the JSON document describing a chunk event
std::string make_event(const std::string& event, const chunk::ChunkMetadata& meta,
                          const NotifyContext& context, std::int64_t when_us);

} // namespace notify
} // namespace rawx

#endif // RAWX_NOTIFY_NOTIFIER_HPP
