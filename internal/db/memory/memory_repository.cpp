#include "memory_repository.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include "memory_tx.hpp"

namespace shortener::db::memory {

namespace {

uint64_t NowMs() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertLink(Transaction& t, model::LinkRecord& r) {
  auto& tx     = TX(t);
  auto& writes = tx.Writes();
  if (writes.contains(r.short_code)) return Result::Err(ErrorCode::ConstraintViolation, "duplicate short_code " + r.short_code);

  std::scoped_lock lock(mutex_);
  if (committed_.contains(r.short_code)) return Result::Err(ErrorCode::ConstraintViolation, "duplicate short_code " + r.short_code);

  r.id = next_id_++;
  if (r.created_at_ms == 0) r.created_at_ms = NowMs();
  writes[r.short_code] = r;
  return Result::Ok();
}

std::optional<model::LinkRecord> MemoryRepository::FindLinkByShortCode(Transaction& t, const std::string& short_code) {
  auto& writes = TX(t).Writes();
  if (auto it = writes.find(short_code); it != writes.end()) return it->second;

  std::scoped_lock lock(mutex_);
  auto             it = committed_.find(short_code);
  if (it == committed_.end()) return std::nullopt;
  return it->second;
}

uint64_t MemoryRepository::CountLinks(Transaction& t) {
  auto&            writes = TX(t).Writes();
  std::scoped_lock lock(mutex_);
  return committed_.size() + writes.size();
}

std::vector<std::string> MemoryRepository::RecentShortCodes(Transaction& t, std::size_t limit) {
  std::vector<std::pair<int64_t, std::string>> by_id;
  for (const auto& [code, record] : TX(t).Writes()) by_id.emplace_back(record.id, code);
  {
    std::scoped_lock lock(mutex_);
    for (const auto& [code, record] : committed_) by_id.emplace_back(record.id, code);
  }

  std::sort(by_id.begin(), by_id.end(), [](const auto& a, const auto& b) { return a.first > b.first; });
  if (by_id.size() > limit) by_id.resize(limit);

  std::vector<std::string> codes;
  codes.reserve(by_id.size());
  for (auto& [_, code] : by_id) codes.push_back(std::move(code));
  return codes;
}

} // namespace shortener::db::memory
