#pragma once

#include <string>
#include <string_view>

#include "rem/common.hpp"

namespace rem::core {

/**
 * @brief Identity of a list or reminder inside a store
 *
 * A ULID: 26 upper-case Crockford base32 characters, the first ten encoding
 * the creation time in milliseconds. A default constructed id is invalid.
 */
class ObjectId {
 public:
  ObjectId() = default;

  static ObjectId generate();
  static Result<ObjectId> fromString(std::string_view str);

  const std::string& toString() const noexcept { return id_; }
  bool isValid() const noexcept;

  bool operator==(const ObjectId& other) const = default;

 private:
  explicit ObjectId(std::string id) : id_(std::move(id)) {}

  std::string id_;
};

}  // namespace rem::core
