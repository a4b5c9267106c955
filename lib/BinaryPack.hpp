#ifndef WS_SYNC_BINARY_PACK_HPP
#define WS_SYNC_BINARY_PACK_HPP

#include "Serialize.hpp"

#include <sstream>
#include <string>

namespace ws {
namespace utl {

/**
 * Pack a struct/object to binary string using OutputArchive
 * @param t The object to serialize
 * @return Binary string representation
 */
template <typename T> std::string binaryPack(const T &t) {
  std::ostringstream oss;
  OutputArchive ar(oss);
  ar &t;
  return oss.str();
}

} // namespace utl
} // namespace ws

#endif // WS_SYNC_BINARY_PACK_HPP
