#include "server/request_id.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <random>

namespace labgate::server {

namespace {

constexpr std::size_t kMaxRequestIdLength = 128U;

bool IsAllowedIdChar(const char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '_' || c == '.' ||
         c == ':';
}

} // namespace

std::string GenerateRequestId() {
  thread_local std::mt19937_64 engine(std::random_device{}());
  static constexpr char kHexDigits[] = "0123456789abcdef";

  std::string id;
  id.reserve(32);
  for (int word = 0; word < 2; ++word) {
    std::uint64_t bits = engine();
    for (int nibble = 0; nibble < 16; ++nibble) {
      id.push_back(kHexDigits[bits & 0xFU]);
      bits >>= 4U;
    }
  }
  return id;
}

std::string ResolveRequestId(std::string_view inbound) {
  if (inbound.empty() || inbound.size() > kMaxRequestIdLength ||
      !std::all_of(inbound.begin(), inbound.end(), IsAllowedIdChar)) {
    return GenerateRequestId();
  }
  return std::string(inbound);
}

} // namespace labgate::server
