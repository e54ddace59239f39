#include "link_mapping.hpp"

#include "internal/util/time.hpp"

namespace shortener::core {

shortener::v1::Link ToProto(const db::model::LinkRecord& record) {
  shortener::v1::Link link;
  link.set_id(record.id);
  link.set_original_url(record.original_url);
  link.set_short_code(record.short_code);
  *link.mutable_created_at() = util::ToProto(util::FromUnixMillis(record.created_at_ms));
  return link;
}

db::model::LinkRecord FromProto(const shortener::v1::Link& link) {
  db::model::LinkRecord record;
  record.id            = link.id();
  record.original_url  = link.original_url();
  record.short_code    = link.short_code();
  record.created_at_ms = util::ToUnixMillis(util::FromProto(link.created_at()));
  return record;
}

std::string ShortenedUrl(std::string_view base_url, std::string_view short_code) {
  while (!base_url.empty() && base_url.back() == '/') base_url.remove_suffix(1);

  std::string out;
  out.reserve(base_url.size() + 1 + short_code.size());
  out.append(base_url);
  out.push_back('/');
  out.append(short_code);
  return out;
}

} // namespace shortener::core
