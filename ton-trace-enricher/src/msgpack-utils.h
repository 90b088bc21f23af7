#pragma once
#include <cstring>
#include <msgpack.hpp>
#include "crypto/block/block.h"
#include "AccountAddress.h"

namespace msgpack {
  MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS) {
    namespace adaptor {

    template<>
    struct pack<block::StdAddress> {
      template <typename Stream>
      msgpack::packer<Stream>& operator()(msgpack::packer<Stream>& o, const block::StdAddress& v) const {
        o.pack(::convert::to_raw_address(v));
        return o;
      }
    };

    template <>
    struct convert<block::StdAddress> {
      msgpack::object const& operator()(msgpack::object const& o, block::StdAddress& v) const {
        if (o.type != msgpack::type::STR) throw msgpack::type_error();
        std::string addr = o.as<std::string>();
        if (!v.parse_addr(addr)) throw std::runtime_error("Failed to deserialize block::StdAddress");
        return o;
      }
    };

    template<>
    struct pack<td::Bits256> {
      template <typename Stream>
      msgpack::packer<Stream>& operator()(msgpack::packer<Stream>& o, const td::Bits256& v) const {
        o.pack_bin(32);
        o.pack_bin_body((const char*)v.data(), 32);
        return o;
      }
    };

    template <>
    struct convert<td::Bits256> {
      msgpack::object const& operator()(msgpack::object const& o, td::Bits256& v) const {
        if (o.type == msgpack::type::BIN && o.via.bin.size == 32) {
          std::memcpy(v.data(), o.via.bin.ptr, 32);
          return o;
        }
        if (o.type == msgpack::type::STR) {
          std::string hex = o.as<std::string>();
          if (v.from_hex(hex) < 0) throw std::runtime_error("Failed to deserialize td::Bits256");
          return o;
        }
        throw msgpack::type_error();
      }
    };

    } // namespace adaptor
  } // MSGPACK_API_VERSION_NAMESPACE(MSGPACK_DEFAULT_API_NS)
} // namespace msgpack
