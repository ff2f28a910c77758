// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <string>

namespace stratus {

/** Fixed-size opaque blob of BITS bits, stored in the byte order it was given. */
template <unsigned int BITS>
class base_blob {
protected:
  static constexpr int WIDTH = BITS / 8;
  static_assert(BITS % 8 == 0, "base_blob currently only supports whole bytes.");
  std::array<uint8_t, WIDTH> m_data;

public:
  constexpr base_blob() : m_data() {}

  constexpr explicit base_blob(uint8_t first_byte) : m_data() { m_data[0] = first_byte; }

  int Compare(const base_blob& other) const { return std::memcmp(m_data.data(), other.m_data.data(), WIDTH); }

  friend bool operator==(const base_blob& a, const base_blob& b) { return a.Compare(b) == 0; }
  friend bool operator!=(const base_blob& a, const base_blob& b) { return a.Compare(b) != 0; }
  friend bool operator<(const base_blob& a, const base_blob& b) { return a.Compare(b) < 0; }

  // Lowercase hex, first byte first.
  std::string GetHex() const;

  constexpr uint8_t* data() { return m_data.data(); }
  constexpr const uint8_t* data() const { return m_data.data(); }

  constexpr uint8_t* begin() { return m_data.data(); }
  constexpr uint8_t* end() { return m_data.data() + WIDTH; }
  constexpr const uint8_t* begin() const { return m_data.data(); }
  constexpr const uint8_t* end() const { return m_data.data() + WIDTH; }

  // First 8 bytes as an integer; blobs here are hashes or random tokens so this
  // is a good enough bucket key.
  uint64_t GetCheapHash() const {
    uint64_t result;
    std::memcpy(&result, m_data.data(), sizeof(result));
    return result;
  }
};

/** 256-bit opaque blob. */
class uint256 : public base_blob<256> {
public:
  constexpr uint256() = default;
  constexpr explicit uint256(uint8_t first_byte) : base_blob<256>(first_byte) {}
};

}  // namespace stratus
