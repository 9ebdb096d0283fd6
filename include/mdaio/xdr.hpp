#pragma once

// ============================================================================
// XDR - big-endian, 4-byte aligned binary codec
// ============================================================================
//
// Basic usage:
//
//   #include "mdaio/xdr.hpp"
//
//   auto p = mdaio::xdr::packer{};
//   p.pack_uint(1);
//   p.pack_string("ab");
//   p.pack_list(std::vector<double>{1.0, 2.0},
//               [](auto& p, double x) { p.pack_double(x); });
//
//   auto u = mdaio::xdr::unpacker{p.get_buffer()};
//   auto n = u.unpack_uint();                                  // 1
//   auto s = u.unpack_string();                                // "ab"
//   auto v = u.unpack_list(&mdaio::xdr::unpacker::unpack_double);
//   u.done();
//
// ============================================================================

#include "xdr/error.hpp"
#include "xdr/format.hpp"
#include "xdr/packer.hpp"
#include "xdr/unpacker.hpp"
#include "xdr/convenience.hpp"
