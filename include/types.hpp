// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license

#pragma once

// Identifier vocabulary shared by the bus and the autopilot. All identifiers
// are 32-byte opaque blobs supplied by callers; distinct classes keep them from
// being passed for one another by accident.

#include "util/uint.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>

namespace stratus {

// Size of a sector stored on a host (4 MiB)
static constexpr uint64_t SECTOR_SIZE = uint64_t{1} << 22;

// Identifier of a file contract with a host. Renewals produce a new id.
class ContractID : public uint256 {
public:
  using uint256::uint256;
};

// Merkle root of a sector's content.
class Hash256 : public uint256 {
public:
  using uint256::uint256;
};

// Caller-chosen token identifying one upload operation.
class UploadID : public uint256 {
public:
  using uint256::uint256;
};

// Ed25519 public key of a host.
class PublicKey : public uint256 {
public:
  using uint256::uint256;
};

struct BlobHasher {
  size_t operator()(const uint256& blob) const noexcept { return static_cast<size_t>(blob.GetCheapHash()); }
};

}  // namespace stratus

template <>
struct std::hash<stratus::ContractID> : stratus::BlobHasher {};
template <>
struct std::hash<stratus::Hash256> : stratus::BlobHasher {};
template <>
struct std::hash<stratus::UploadID> : stratus::BlobHasher {};
template <>
struct std::hash<stratus::PublicKey> : stratus::BlobHasher {};
