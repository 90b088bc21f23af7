#pragma once
#include <string>
#include <vector>
#include "crypto/block/block.h"
#include "td/utils/Status.h"
#include "td/utils/Slice.h"


struct Bits256Hasher {
  std::size_t operator()(const td::Bits256& k) const {
    std::size_t seed = 0;
    for(const auto& el : k.as_array()) {
        seed ^= std::hash<td::uint8>{}(el) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
  }
};

namespace std {
template <>
struct hash<block::StdAddress> {
  auto operator()(const block::StdAddress &addr) const -> size_t {
    return std::hash<td::int32>{}(addr.workchain) ^ Bits256Hasher{}(addr.addr);
  }
};
}  // namespace std

namespace convert {
  // "wc:HEX" form used as keys in the trace store and lookup tables
  std::string to_raw_address(const block::StdAddress& address);

  // accepts both raw and user-friendly (base64) forms
  td::Result<block::StdAddress> to_std_address(td::Slice address);

  // comma separated list, every entry must be valid
  td::Result<std::vector<block::StdAddress>> to_std_address_list(td::Slice list);
}
