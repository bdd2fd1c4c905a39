#include <cassert>
#include <iostream>
#include <set>
#include <string>

#include "internal/util/uuid.hpp"

namespace {

using auditgate::util::GenerateRequestId;
using auditgate::util::GenerateUUID;
using auditgate::util::ToString;

void TestVersionAndVariantBits() {
  for (int i = 0; i < 64; ++i) {
    const auto id = GenerateUUID();
    assert((id[6] & 0xF0) == 0x40);
    assert((id[8] & 0xC0) == 0x80);
  }
}

void TestCanonicalTextForm() {
  auditgate::util::UUID id{};
  for (size_t i = 0; i < id.size(); ++i)
    id[i] = static_cast<uint8_t>(i * 17);

  assert(ToString(id) == "00112233-4455-6677-8899-aabbccddeeff");
}

void TestRequestIdsAreDistinct() {
  std::set<std::string> seen;
  for (int i = 0; i < 1000; ++i) {
    const auto id = GenerateRequestId();
    assert(id.size() == 36);
    assert(id[14] == '4');
    seen.insert(id);
  }
  assert(seen.size() == 1000);
}

} // namespace

int main() {
  TestVersionAndVariantBits();
  TestCanonicalTextForm();
  TestRequestIdsAreDistinct();

  std::cout << "auditgate_unit_uuid: pass\n";
  return 0;
}
