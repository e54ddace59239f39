#include "internal/core/link_validation.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using namespace shortener::core;

std::string ValidationMessage(const std::string& url) {
  try {
    ValidateOriginalUrl(url);
  } catch (const shortener::util::InvalidArgument& e) {
    return e.what();
  }
  return "";
}

bool ShortCodeRejected(const std::string& code) {
  try {
    ValidateShortCode(code);
  } catch (const shortener::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestAcceptsHttpAndHttps() {
  assert(IsValidOriginalUrl("https://example.com"));
  assert(IsValidOriginalUrl("http://example.com/path?q=1#frag"));
  assert(IsValidOriginalUrl("HTTPS://Example.COM/"));
  assert(IsValidOriginalUrl("https://user:pw@example.com:8443/a/b"));
  assert(IsValidOriginalUrl("http://[::1]:3000/health"));
  assert(IsValidOriginalUrl("http://localhost"));
  assert(ValidationMessage("https://www.google.com/search?q=url+shortener").empty());
}

void TestRejectsOtherSchemesAndShapes() {
  assert(!IsValidOriginalUrl("ftp://example.com"));
  assert(!IsValidOriginalUrl("javascript:alert(1)"));
  assert(!IsValidOriginalUrl("example.com"));
  assert(!IsValidOriginalUrl("https:/example.com"));
  assert(!IsValidOriginalUrl("https://"));
  assert(!IsValidOriginalUrl("https:///path"));
  assert(!IsValidOriginalUrl("https://exa mple.com"));
  assert(!IsValidOriginalUrl("https://example.com:99999"));
  assert(!IsValidOriginalUrl("https://example.com:80a"));
  assert(!IsValidOriginalUrl("http://[::1"));
  assert(!IsValidOriginalUrl("https://example.com/\npath"));
}

void TestBlankAndInvalidMessages() {
  assert(ValidationMessage("") == kBlankUrlMessage);
  assert(ValidationMessage("   ") == kBlankUrlMessage);
  assert(ValidationMessage("not a url") == kInvalidUrlMessage);
  assert(ValidationMessage("mailto:someone@example.com") == kInvalidUrlMessage);
}

void TestShortCodeShape() {
  assert(!ShortCodeRejected("OGsBFX"));
  assert(ShortCodeRejected(""));
  assert(ShortCodeRejected("OGsBF"));
  assert(ShortCodeRejected("OGsBFXX"));
  assert(ShortCodeRejected("OGs_FX"));
  assert(ShortCodeRejected("OGs FX"));
}

} // namespace

int main() {
  TestAcceptsHttpAndHttps();
  TestRejectsOtherSchemesAndShapes();
  TestBlankAndInvalidMessages();
  TestShortCodeShape();

  std::cout << "shortener_unit_link_validation: pass\n";
  return 0;
}
