#include "internal/access/request_context.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/encoding.hpp"
#include "internal/util/errors.hpp"

namespace {

using cirrus::access::ParseBasicCredential;
using cirrus::access::ParseReferer;
using cirrus::access::ParseRequesterIp;

template <typename Fn>
bool ThrowsClientSyntax(Fn&& fn) {
  try {
    fn();
  } catch (const cirrus::util::ClientSyntaxError&) {
    return true;
  }
  return false;
}

void TestForwardedForFirstEntryWins() {
  const auto ip = ParseRequesterIp(std::string_view("198.51.100.7, 10.0.0.1"), "127.0.0.1");
  assert(ip.to_string() == "198.51.100.7");
}

void TestForwardedForPortIsStripped() {
  assert(ParseRequesterIp(std::string_view("198.51.100.7:4431"), "127.0.0.1").to_string() == "198.51.100.7");
  assert(ParseRequesterIp(std::string_view("[2001:db8::5]:80"), "127.0.0.1").to_string() == "2001:db8::5");
  assert(ParseRequesterIp(std::string_view("2001:db8::5"), "127.0.0.1").to_string() == "2001:db8::5");
}

void TestPeerAddressUsedWithoutHeader() {
  assert(ParseRequesterIp(std::nullopt, "192.0.2.44").to_string() == "192.0.2.44");
  assert(ParseRequesterIp(std::nullopt, "2001:db8::7").to_string() == "2001:db8::7");
}

void TestUnparsableForwardedForIsRejected() {
  assert(ThrowsClientSyntax([] { (void)ParseRequesterIp(std::string_view("not-an-ip"), "127.0.0.1"); }));
  assert(ThrowsClientSyntax([] { (void)ParseRequesterIp(std::string_view(""), "127.0.0.1"); }));
}

void TestRefererParsing() {
  assert(!ParseReferer(std::nullopt));
  assert(*ParseReferer(std::string_view("https://example.com/page?a=1")) == "https://example.com/page?a=1");
  assert(*ParseReferer(std::string_view("HTTP://example.com")) == "HTTP://example.com");
  assert(ThrowsClientSyntax([] { (void)ParseReferer(std::string_view("ftp://example.com/")); }));
  assert(ThrowsClientSyntax([] { (void)ParseReferer(std::string_view("https:///nohost")); }));
  assert(ThrowsClientSyntax([] { (void)ParseReferer(std::string_view("https://exa mple.com/")); }));
}

void TestBasicCredential() {
  assert(!ParseBasicCredential(std::nullopt));

  const auto header = "Basic " + std::string("dXNlcjpzM2NyM3Q="); // user:s3cr3t
  assert(*ParseBasicCredential(std::string_view(header)) == "s3cr3t");

  assert(ThrowsClientSyntax([] { (void)ParseBasicCredential(std::string_view("Bearer abc")); }));
  assert(ThrowsClientSyntax([] { (void)ParseBasicCredential(std::string_view("Basic !!!!")); }));
  assert(ThrowsClientSyntax([] { (void)ParseBasicCredential(std::string_view("Basic dXNlcg==")); })); // "user"
}

} // namespace

int main() {
  TestForwardedForFirstEntryWins();
  TestForwardedForPortIsStripped();
  TestPeerAddressUsedWithoutHeader();
  TestUnparsableForwardedForIsRejected();
  TestRefererParsing();
  TestBasicCredential();

  std::cout << "cirrus_unit_request_context: pass\n";
  return 0;
}
