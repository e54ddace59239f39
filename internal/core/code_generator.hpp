#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/model/link_record.hpp"

namespace shortener::db {
class Repository;
}
namespace shortener::counter {
class CounterAllocator;
}

namespace shortener::core {

inline constexpr uint32_t kDefaultMaxAllocationAttempts = 5;

// Recent links inspected when seeding the counter. Wider than the number of
// attempts that can be in flight between allocation and insert.
inline constexpr std::size_t kIssuedScanWindow = 64;

struct GeneratorOptions {
  uint32_t max_attempts = kDefaultMaxAllocationAttempts;
};

/*
  Issues short codes: counter value -> base62 code -> unique insert.

  The repository's unique index is the only uniqueness guarantee; a
  collision discards the code and retries with a fresh counter value, up to
  max_attempts. Counter values consumed by failed or abandoned attempts are
  never reused, leaving harmless gaps in the code sequence.

  Errors:
    util::InvalidArgument        url blank or not http(s); no counter consumed
    util::ResourceExhausted      retry ceiling hit, or counter left the
                                 6-symbol range
    util::InvalidState           counter not initialized
    util::DependencyUnavailable  cache tier or store failed
*/
class CodeGenerator {
 public:
  CodeGenerator(std::shared_ptr<db::Repository> repository, std::shared_ptr<counter::CounterAllocator> counter, GeneratorOptions options = {});

  db::model::LinkRecord CreateShortenedFor(const std::string& original_url);

 private:
  enum class AttemptOutcome { kPersisted, kCollision };

  struct Attempt {
    AttemptOutcome        outcome;
    db::model::LinkRecord link;
  };

  Attempt    TryAllocate(const std::string& original_url);
  db::Result Persist(db::model::LinkRecord& candidate);

  std::shared_ptr<db::Repository>            repository_;
  std::shared_ptr<counter::CounterAllocator> counter_;
  GeneratorOptions                           options_;
};

// Largest counter value behind the `window` most recently inserted links,
// 0 for an empty store. The counter is seeded from it so that a cleared or
// replaced cache tier resumes past every issued code.
// Throws util::DependencyUnavailable when the store cannot be read.
int64_t HighestIssuedValue(db::Repository& repository, std::size_t window = kIssuedScanWindow);

} // namespace shortener::core
