#include "uuid.hpp"

#include <random>

namespace auditgate::util {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

std::mt19937_64& Engine() {
  static thread_local std::mt19937_64 engine{std::random_device{}()};
  return engine;
}

} // namespace

UUID GenerateUUID() {
  UUID id{};
  auto& engine = Engine();

  for (size_t i = 0; i < id.size(); i += 8) {
    uint64_t word = engine();
    for (size_t j = 0; j < 8; ++j, word >>= 8)
      id[i + j] = static_cast<uint8_t>(word & 0xFF);
  }

  // version 4, RFC 4122 variant
  id[6] = static_cast<uint8_t>((id[6] & 0x0F) | 0x40);
  id[8] = static_cast<uint8_t>((id[8] & 0x3F) | 0x80);
  return id;
}

std::string ToString(const UUID& id) {
  std::string out;
  out.reserve(36);

  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHexDigits[id[i] >> 4]);
    out.push_back(kHexDigits[id[i] & 0x0F]);
  }
  return out;
}

} // namespace auditgate::util
