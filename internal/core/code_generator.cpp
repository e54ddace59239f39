#include "code_generator.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/codec/base62.hpp"
#include "internal/core/link_validation.hpp"
#include "internal/counter/counter_allocator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace shortener::core {

using shortener::observability::IntField;
using shortener::observability::StringField;

CodeGenerator::CodeGenerator(std::shared_ptr<db::Repository> repository, std::shared_ptr<counter::CounterAllocator> counter, GeneratorOptions options)
    : repository_(std::move(repository)), counter_(std::move(counter)), options_(options) {
  if (!repository_ || !counter_) {
    throw std::invalid_argument("CodeGenerator requires a repository and a counter");
  }
  if (options_.max_attempts == 0) {
    options_.max_attempts = kDefaultMaxAllocationAttempts;
  }
}

db::model::LinkRecord CodeGenerator::CreateShortenedFor(const std::string& original_url) {
  ValidateOriginalUrl(original_url);

  for (uint32_t attempt = 1; attempt <= options_.max_attempts; ++attempt) {
    auto result = TryAllocate(original_url);
    if (result.outcome == AttemptOutcome::kPersisted) {
      return std::move(result.link);
    }

    SHORTENER_LOG_WARN("Failed to create unique short code",
                       {StringField("short_code", result.link.short_code), IntField("attempt", attempt),
                        IntField("max_attempts", options_.max_attempts)});
  }

  SHORTENER_LOG_ERROR("short code allocation exhausted its retries", {IntField("max_attempts", options_.max_attempts)});
  throw util::ResourceExhausted("could not allocate a unique short code after " + std::to_string(options_.max_attempts) + " attempts");
}

CodeGenerator::Attempt CodeGenerator::TryAllocate(const std::string& original_url) {
  const int64_t value = counter_->IncrementAndGet();
  if (!codec::HasShortCodeLength(value)) {
    SHORTENER_LOG_ERROR("counter outside the short code range", {IntField("counter", value)});
    throw util::ResourceExhausted("counter value " + std::to_string(value) + " does not encode to " + std::to_string(codec::kShortCodeLength) +
                                  " symbols (valid range " + std::to_string(codec::kMinSixSymbolValue) + ".." +
                                  std::to_string(codec::kMaxSixSymbolValue) + ")");
  }

  Attempt attempt{AttemptOutcome::kPersisted, {}};
  attempt.link.original_url = original_url;
  attempt.link.short_code   = *codec::Encode(value);

  auto result = Persist(attempt.link);
  if (result.code == db::ErrorCode::ConstraintViolation) {
    attempt.outcome = AttemptOutcome::kCollision;
    return attempt;
  }
  if (!result) {
    throw util::DependencyUnavailable("persisting link failed: " + result.message);
  }
  return attempt;
}

db::Result CodeGenerator::Persist(db::model::LinkRecord& candidate) {
  try {
    auto tx     = repository_->Begin();
    auto result = repository_->InsertLink(*tx, candidate);
    if (!result) {
      tx->Rollback();
      return result;
    }
    tx->Commit();
    return result;
  } catch (const db::UniqueConflict& e) {
    return db::Result::Err(db::ErrorCode::ConstraintViolation, e.what());
  } catch (const std::exception& e) {
    return db::Result::Err(db::ErrorCode::InternalError, e.what());
  }
}

int64_t HighestIssuedValue(db::Repository& repository, std::size_t window) {
  std::vector<std::string> codes;
  try {
    auto tx = repository.Begin();
    codes   = repository.RecentShortCodes(*tx, window);
    tx->Commit();
  } catch (const std::exception& e) {
    throw util::DependencyUnavailable(std::string("reading issued short codes failed: ") + e.what());
  }

  int64_t highest = 0;
  for (const auto& code : codes) {
    if (auto value = codec::Decode(code)) highest = std::max(highest, *value);
  }
  return highest;
}

} // namespace shortener::core
