#pragma once

#include <string>
#include <string_view>

namespace shortener::core {

inline constexpr const char* kBlankUrlMessage   = "Original url can't be blank";
inline constexpr const char* kInvalidUrlMessage = "Original url must be a valid URL";

// Throws util::InvalidArgument unless url is an absolute http(s) URL.
void ValidateOriginalUrl(std::string_view url);

// Throws util::InvalidArgument unless code has the issued short code shape.
void ValidateShortCode(std::string_view code);

bool IsValidOriginalUrl(std::string_view url);

} // namespace shortener::core
