#pragma once

#include <string>
#include <string_view>

#include "internal/db/model/link_record.hpp"
#include "shortener/v1/link.pb.h"

namespace shortener::core {

inline constexpr const char* kDefaultPublicBaseUrl = "http://localhost:3000";

// Leaves shortened_url empty; it depends on where the service is exposed.
shortener::v1::Link   ToProto(const db::model::LinkRecord& record);
db::model::LinkRecord FromProto(const shortener::v1::Link& link);

// "<base_url>/<short_code>", tolerating a trailing slash on base_url.
std::string ShortenedUrl(std::string_view base_url, std::string_view short_code);

} // namespace shortener::core
