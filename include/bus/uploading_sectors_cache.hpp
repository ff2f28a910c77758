// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license

#pragma once

/*
 UploadingSectorsCache — sectors pushed by uploads that are still in flight

 Purpose
 - Tell contract selection how much of a contract's capacity is already spoken
   for by uploads that have not been recorded in the metadata store yet
 - Let repair and placement see which sector roots are already on their way

 Key responsibilities
 1. Track upload lifetimes (Track / Finish)
 2. Record sectors per upload and contract (AddSector)
 3. Follow contract renewals so the old and the new contract id report the
    same in-flight data (AddRenewal / ResolveChain)
 4. Drop uploads whose owner never finished them (24h expiry, swept on Finish)

 Locking
 - mutex_ guards the upload map and both renewal maps
 - every OngoingUpload has its own mutex guarding its sector lists, so
   uploads never contend with each other while appending
 - Pending/Sectors copy the upload pointers under mutex_ and then visit each
   upload under its own lock

 Renewal chains are kept two links deep: recording C renews B drops the
 A -> B link. An upload that outlives two renewals of the same contract loses
 sight of the sectors it wrote to the oldest one.
*/

#include "types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace stratus {
namespace bus {

enum class UploadResult {
  Success,
  AlreadyExists,  // Track() on an upload id that is already tracked
  UnknownUpload   // AddSector() on an upload id that is not tracked
};

std::string UploadResultToString(UploadResult result);

class UploadingSectorsCache {
public:
  // Uploads older than this are considered abandoned
  static constexpr std::chrono::hours UPLOAD_EXPIRY{24};

  // Contract id currently in use for a chain, and the id it was renewed from
  struct ResolvedChain {
    ContractID current;
    std::optional<ContractID> renewed_from;
  };

  UploadingSectorsCache() = default;
  ~UploadingSectorsCache() = default;

  // Non-copyable
  UploadingSectorsCache(const UploadingSectorsCache&) = delete;
  UploadingSectorsCache& operator=(const UploadingSectorsCache&) = delete;

  // Start tracking an upload. Returns AlreadyExists if the id is in use.
  UploadResult Track(const UploadID& upload_id);

  // Append a sector root uploaded to `contract_id` as part of `upload_id`.
  // Returns UnknownUpload if the upload is not tracked.
  UploadResult AddSector(const UploadID& upload_id, const ContractID& contract_id, const Hash256& root);

  // Stop tracking an upload and prune every expired upload. Unknown ids are ignored.
  void Finish(const UploadID& upload_id);

  // Record that `renewed_to` is the renewal of `renewed_from`.
  void AddRenewal(const ContractID& renewed_to, const ContractID& renewed_from);

  ResolvedChain ResolveChain(const ContractID& contract_id) const;

  // Bytes uploaded to the contract (or the other end of its renewal) by live uploads.
  uint64_t Pending(const ContractID& contract_id) const;

  // Sector roots uploaded to the contract (or the other end of its renewal) by live uploads.
  std::vector<Hash256> Sectors(const ContractID& contract_id) const;

  // === Diagnostics ===

  size_t Size() const;
  bool IsTracked(const UploadID& upload_id) const;

  // Sizes of the (renewed_from, renewed_to) maps
  std::pair<size_t, size_t> RenewalCount() const;

private:
  class OngoingUpload {
  public:
    explicit OngoingUpload(std::chrono::steady_clock::time_point started) : started_(started) {}

    void AddSector(const ContractID& contract_id, const Hash256& root);

    // Roots recorded for the contract, empty once the upload has expired.
    // Appends to `out` to save copies when visiting many uploads.
    size_t AppendSectors(const ContractID& contract_id, std::chrono::steady_clock::time_point now,
                         std::vector<Hash256>* out) const;

    bool IsExpired(std::chrono::steady_clock::time_point now) const { return now - started_ > UPLOAD_EXPIRY; }

  private:
    const std::chrono::steady_clock::time_point started_;

    mutable std::mutex mutex_;
    std::unordered_map<ContractID, std::vector<Hash256>> contract_sectors_;
  };

  std::vector<std::shared_ptr<OngoingUpload>> OngoingUploads() const;

  mutable std::mutex mutex_;
  std::unordered_map<UploadID, std::shared_ptr<OngoingUpload>> uploads_;
  std::unordered_map<ContractID, ContractID> renewed_from_;  // renewal -> parent
  std::unordered_map<ContractID, ContractID> renewed_to_;    // parent -> renewal
};

}  // namespace bus
}  // namespace stratus
