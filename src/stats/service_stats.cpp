#include "rawx/stats/service_stats.hpp"
#include <sstream>

namespace rawx {
namespace stats {

ServiceStats::ServiceStats() {
  for (auto& counter : verb_hits_) counter = 0;
  for (auto& counter : verb_time_us_) counter = 0;
  for (auto& counter : class_hits_) counter = 0;
}

void ServiceStats::record(Verb verb, unsigned status, std::chrono::microseconds elapsed,
                          std::uint64_t bytes_in, std::uint64_t bytes_out) {
  auto index = static_cast<std::size_t>(verb);
  hits_++;
  verb_hits_[index]++;
  verb_time_us_[index] += static_cast<std::uint64_t>(elapsed.count());

  unsigned status_class = status / 100;
  if (status_class < class_hits_.size()) {
    class_hits_[status_class]++;
  }

  bytes_in_ += bytes_in;
  bytes_out_ += bytes_out;
}

std::uint64_t ServiceStats::hits(Verb verb) const {
  return verb_hits_[static_cast<std::size_t>(verb)].load();
}

std::uint64_t ServiceStats::hits_by_class(unsigned status_class) const {
  return status_class < class_hits_.size() ? class_hits_[status_class].load() : 0;
}

std::string ServiceStats::render() const {
  std::ostringstream out;
  out << "counter req.hits " << hits_.load() << "\n";

  for (std::size_t i = 0; i < VERB_COUNT; ++i) {
    const char* name = verb_to_string(static_cast<Verb>(i));
    out << "counter req.hits." << name << " " << verb_hits_[i].load() << "\n";
    out << "counter req.time." << name << " " << verb_time_us_[i].load() << "\n";
  }

  for (unsigned c = 2; c < class_hits_.size(); ++c) {
    out << "counter rep.hits." << c << "xx " << class_hits_[c].load() << "\n";
  }

  out << "counter rep.bread " << bytes_in_.load() << "\n";
  out << "counter rep.bwritten " << bytes_out_.load() << "\n";
  return out.str();
}

} // namespace stats
} // namespace rawx
