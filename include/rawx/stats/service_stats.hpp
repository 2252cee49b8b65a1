#ifndef RAWX_STATS_SERVICE_STATS_HPP
#define RAWX_STATS_SERVICE_STATS_HPP

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace rawx {
namespace stats {

// Chunk operations accounted separately
enum class Verb : std::size_t {
  PUT = 0,
  COPY,
  HEAD,
  GET,
  DELETE,
  OTHER
};

constexpr std::size_t VERB_COUNT = 6;

inline const char* verb_to_string(Verb verb) {
  switch (verb) {
    case Verb::PUT: return "put";
    case Verb::COPY: return "copy";
    case Verb::HEAD: return "head";
    case Verb::GET: return "get";
    case Verb::DELETE: return "del";
    default: return "other";
  }
}

// Receives one record per served request
class StatsSink {
public:
  virtual ~StatsSink() = default;
  virtual void record(Verb verb, unsigned status, std::chrono::microseconds elapsed,
                      std::uint64_t bytes_in, std::uint64_t bytes_out) = 0;
};

// Lock-free counters shared by every request thread
class ServiceStats : public StatsSink {
public:
  ServiceStats();

  void record(Verb verb, unsigned status, std::chrono::microseconds elapsed,
              std::uint64_t bytes_in, std::uint64_t bytes_out) override;

  std::uint64_t hits() const { return hits_.load(); }
  std::uint64_t hits(Verb verb) const;
  std::uint64_t hits_by_class(unsigned status_class) const;
  std::uint64_t bytes_in() const { return bytes_in_.load(); }
  std::uint64_t bytes_out() const { return bytes_out_.load(); }

  // One "counter <name> <value>" line per counter
  std::string render() const;

private:
  std::atomic<std::uint64_t> hits_{0};
  std::array<std::atomic<std::uint64_t>, VERB_COUNT> verb_hits_;
  std::array<std::atomic<std::uint64_t>, VERB_COUNT> verb_time_us_;
  // Indexed by status / 100, 2xx to 5xx
  std::array<std::atomic<std::uint64_t>, 6> class_hits_;
  std::atomic<std::uint64_t> bytes_in_{0};
  std::atomic<std::uint64_t> bytes_out_{0};
};

} // namespace stats
} // namespace rawx

#endif // RAWX_STATS_SERVICE_STATS_HPP
