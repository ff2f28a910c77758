// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license

#include "util/uint.hpp"

namespace stratus {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

}  // namespace

template <unsigned int BITS>
std::string base_blob<BITS>::GetHex() const {
  std::string out;
  out.reserve(WIDTH * 2);
  for (uint8_t b : m_data) {
    out.push_back(kHexDigits[b >> 4]);
    out.push_back(kHexDigits[b & 0x0f]);
  }
  return out;
}

template class base_blob<256>;

}  // namespace stratus
