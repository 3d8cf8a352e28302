#include "source/common/common/assert.h"

#include <atomic>
#include <cstdlib>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"

namespace KernelTls {
namespace Assert {

namespace {

std::atomic<uint64_t>& bugCounter() {
  static std::atomic<uint64_t> counter{0};
  return counter;
}

class BugTracker {
public:
  // Returns true when this hit should be logged.
  bool record(const std::string& location) {
    absl::MutexLock lock(&mutex_);
    const uint64_t hits = ++hits_[location];
    // Log on the 1st, 2nd, 4th, 8th... hit.
    return (hits & (hits - 1)) == 0;
  }

private:
  absl::Mutex mutex_;
  absl::flat_hash_map<std::string, uint64_t> hits_ ABSL_GUARDED_BY(mutex_);
};

BugTracker& bugTracker() {
  static BugTracker* tracker = new BugTracker();
  return *tracker;
}

} // namespace

void invokeFatalHandler(const char* file, int line, absl::string_view details) {
  KTLS_LOG_MISC(critical, "{}:{} {}", file, line, details);
  Logger::Registry::getLog(Logger::Id::misc).flush();
  std::abort();
}

void invokeBugHandler(const char* file, int line, absl::string_view condition,
                      absl::string_view details) {
  bugCounter()++;
  if (bugTracker().record(absl::StrCat(file, ":", line))) {
    KTLS_LOG_MISC(error, "bug failure: {}. Details: {} ({}:{})", condition, details, file, line);
  }
}

uint64_t bugHitCount() { return bugCounter().load(); }

} // namespace Assert
} // namespace KernelTls
