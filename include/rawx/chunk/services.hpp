#ifndef RAWX_CHUNK_SERVICES_HPP
#define RAWX_CHUNK_SERVICES_HPP

#include <string>
#include "rawx/chunk/chunk_id.hpp"
#include "rawx/logger/logger.hpp"
#include "rawx/notify/notifier.hpp"
#include "rawx/stats/service_stats.hpp"
#include "rawx/store/repository.hpp"

namespace rawx {
namespace chunk {

// Read-only settings of the running service
struct ServerSettings {
  // Compress chunk bodies with zlib on upload
  bool compress = false;
  // "host:port" a COPY Destination must point to, empty to accept any host
  std::string service_url;
  notify::NotifyContext notify_context;
};

// Collaborators shared by every request
struct Services {
  store::Repository& repository;
  notify::Notifier& notifier;
  stats::StatsSink& stats;
  logger::RequestLogger& logger;
  ServerSettings settings;
};

// State of one request, passed along the pipeline steps
struct RequestContext {
  ChunkId chunk_id;
  stats::Verb verb;
  std::string request_id;
};

} // namespace chunk
} // namespace rawx

#endif // RAWX_CHUNK_SERVICES_HPP
