#ifndef WS_SYNC_SERIALIZE_HPP
#define WS_SYNC_SERIALIZE_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace ws {

/**
 * OutputArchive - Write-only binary archive for hashing
 *
 * Integers are written big endian, strings and vectors with a uint64_t
 * length prefix. Structs opt in with a member template:
 *
 *   template <typename Archive> void serialize(Archive &ar) {
 *     ar & field1 & field2;
 *   }
 */
class OutputArchive {
public:
  explicit OutputArchive(std::ostream &os) : os_(os) {}

  template <typename T>
  std::enable_if_t<std::is_unsigned_v<T>, OutputArchive &> operator&(T value) {
    char bytes[sizeof(T)];
    for (size_t i = 0; i < sizeof(T); ++i) {
      bytes[sizeof(T) - 1 - i] =
          static_cast<char>((static_cast<uint64_t>(value) >> (8 * i)) & 0xff);
    }
    os_.write(bytes, sizeof(T));
    return *this;
  }

  OutputArchive &operator&(int64_t value) {
    return *this & static_cast<uint64_t>(value);
  }

  OutputArchive &operator&(const std::string &value) {
    *this & static_cast<uint64_t>(value.size());
    os_.write(value.data(), static_cast<std::streamsize>(value.size()));
    return *this;
  }

  template <typename T> OutputArchive &operator&(const std::vector<T> &value) {
    static_assert(!std::is_pointer_v<T>, "Archive does not support pointers");
    *this & static_cast<uint64_t>(value.size());
    for (const auto &item : value) {
      *this & item;
    }
    return *this;
  }

  // serialize() is non-const so one member template serves every archive
  template <typename T>
  auto operator&(const T &value)
      -> decltype(std::declval<T &>().serialize(std::declval<OutputArchive &>()),
                  std::declval<OutputArchive &>()) {
    const_cast<T &>(value).serialize(*this);
    return *this;
  }

private:
  std::ostream &os_;
};

} // namespace ws

#endif // WS_SYNC_SERIALIZE_HPP
