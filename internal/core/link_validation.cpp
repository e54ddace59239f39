#include "link_validation.hpp"

#include <algorithm>
#include <cctype>

#include "internal/codec/base62.hpp"
#include "internal/util/errors.hpp"

namespace shortener::core {

namespace {

bool IsBlank(std::string_view s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
           return std::tolower(x) == std::tolower(y);
         });
}

// RFC 3986 reg-name characters, percent escapes included.
bool IsHostChar(unsigned char c) {
  if (std::isalnum(c)) return true;
  switch (c) {
    case '-': case '.': case '_': case '~': case '%':
    case '!': case '$': case '&': case '\'': case '(': case ')':
    case '*': case '+': case ',': case ';': case '=':
      return true;
    default:
      return false;
  }
}

bool IsValidPort(std::string_view port) {
  if (port.empty() || port.size() > 5) return false;
  if (!std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) return false;
  return std::stoi(std::string(port)) <= 65535;
}

bool IsValidAuthority(std::string_view authority) {
  if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
    authority.remove_prefix(at + 1);
  }
  if (authority.empty()) return false;

  std::string_view host = authority;
  std::string_view port;
  bool             has_port = false;

  if (authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string_view::npos || close == 1) return false;
    host = authority.substr(1, close - 1);
    if (!std::all_of(host.begin(), host.end(), [](unsigned char c) { return std::isxdigit(c) || c == ':' || c == '.'; })) return false;
    const auto rest = authority.substr(close + 1);
    if (!rest.empty()) {
      if (rest.front() != ':') return false;
      port     = rest.substr(1);
      has_port = true;
    }
    return !has_port || IsValidPort(port);
  }

  if (const auto colon = authority.rfind(':'); colon != std::string_view::npos) {
    host     = authority.substr(0, colon);
    port     = authority.substr(colon + 1);
    has_port = true;
  }

  if (host.empty()) return false;
  if (!std::all_of(host.begin(), host.end(), [](unsigned char c) { return IsHostChar(c); })) return false;
  return !has_port || IsValidPort(port);
}

} // namespace

bool IsValidOriginalUrl(std::string_view url) {
  // whitespace and control characters are never part of a URL
  if (std::any_of(url.begin(), url.end(), [](unsigned char c) { return c <= 0x20 || c == 0x7F; })) return false;

  const auto colon = url.find(':');
  if (colon == std::string_view::npos) return false;

  const auto scheme = url.substr(0, colon);
  if (!EqualsIgnoreCase(scheme, "http") && !EqualsIgnoreCase(scheme, "https")) return false;

  auto rest = url.substr(colon + 1);
  if (rest.substr(0, 2) != "//") return false;
  rest.remove_prefix(2);

  const auto authority_end = rest.find_first_of("/?#");
  return IsValidAuthority(rest.substr(0, authority_end));
}

void ValidateOriginalUrl(std::string_view url) {
  if (IsBlank(url)) {
    throw util::InvalidArgument(kBlankUrlMessage);
  }
  if (!IsValidOriginalUrl(url)) {
    throw util::InvalidArgument(kInvalidUrlMessage);
  }
}

void ValidateShortCode(std::string_view code) {
  if (code.empty()) {
    throw util::InvalidArgument("Short code can't be blank");
  }
  if (code.size() != codec::kShortCodeLength) {
    throw util::InvalidArgument("Short code is the wrong length (should be " + std::to_string(codec::kShortCodeLength) + " characters)");
  }
  if (!std::all_of(code.begin(), code.end(), codec::IsAlphabetSymbol)) {
    throw util::InvalidArgument("Short code contains characters outside the code alphabet");
  }
}

} // namespace shortener::core
