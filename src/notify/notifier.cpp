#include "rawx/notify/notifier.hpp"
#include <nlohmann/json.hpp>

namespace rawx {
namespace notify {

std::string make_event(const std::string& event, const chunk::ChunkMetadata& meta,
                          const NotifyContext& context, std::int64_t when_us) {
  nlohmann::json data = {
    {"volume_id", context.service_id},
    {"container_id", meta.container_id},
    {"content_id", meta.content_id},
    {"content_path", meta.content_path},
    {"content_version", meta.content_version},
    {"content_storage_policy", meta.content_storage_policy},
    {"content_chunk_method", meta.content_chunk_method},
    {"content_mime_type", meta.content_mime_type},
    {"chunk_id", meta.chunk_id},
    {"chunk_position", meta.chunk_position},
    {"chunk_hash", meta.chunk_hash},
    {"chunk_size", meta.chunk_size},
  };
  if (!meta.full_path.empty()) {
    data["full_path"] = meta.full_path;
  }

  nlohmann::json document = {
    {"event", event.empty() ? std::string(EVENT_CHUNK_NEW) : event},
    {"when", when_us},
    {"namespace", context.ns},
    {"data", data},
  };
  return document.dump();
}

} // namespace notify
} // namespace rawx
