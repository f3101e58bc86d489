#include "rem/core/object_id.hpp"

#include <chrono>
#include <cstdint>
#include <random>

namespace rem::core {

namespace {

constexpr std::string_view kAlphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
constexpr size_t kLength = 26;
constexpr size_t kTimeChars = 10;

// 10 base32 characters hold 50 bits; a 48-bit timestamp leaves the first <= '7'
constexpr char kMaxLeadingChar = '7';

bool isValidUlid(std::string_view str) {
  if (str.size() != kLength || str.front() > kMaxLeadingChar) {
    return false;
  }
  return str.find_first_not_of(kAlphabet) == std::string_view::npos;
}

}  // namespace

ObjectId ObjectId::generate() {
  static thread_local std::mt19937_64 engine{std::random_device{}()};

  auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch());
  auto millis = static_cast<uint64_t>(now.count());

  std::string id(kLength, '0');
  for (size_t i = kTimeChars; i-- > 0; millis >>= 5) {
    id[i] = kAlphabet[millis & 0x1F];
  }

  // 80 random bits, 5 per character
  uint64_t bits = engine();
  for (size_t i = kTimeChars; i < kLength; ++i) {
    if (i == kTimeChars + 12) {
      bits = engine();
    }
    id[i] = kAlphabet[bits & 0x1F];
    bits >>= 5;
  }

  return ObjectId(std::move(id));
}

Result<ObjectId> ObjectId::fromString(std::string_view str) {
  if (!isValidUlid(str)) {
    return makeErrorResult<ObjectId>(ErrorCode::kInvalidArgument,
                                     "Invalid object id: " + std::string(str));
  }
  return ObjectId(std::string(str));
}

bool ObjectId::isValid() const noexcept {
  return isValidUlid(id_);
}

}  // namespace rem::core
