// Copyright (c) 2025 The Stratus Developers
// Distributed under the MIT software license

#include "bus/uploading_sectors_cache.hpp"

#include "util/logging.hpp"
#include "util/time.hpp"

namespace stratus {
namespace bus {

std::string UploadResultToString(UploadResult result) {
  switch (result) {
  case UploadResult::Success:
    return "success";
  case UploadResult::AlreadyExists:
    return "upload already exists";
  case UploadResult::UnknownUpload:
    return "unknown upload";
  }
  return "unknown";
}

void UploadingSectorsCache::OngoingUpload::AddSector(const ContractID& contract_id, const Hash256& root) {
  std::lock_guard<std::mutex> lock(mutex_);
  contract_sectors_[contract_id].push_back(root);
}

size_t UploadingSectorsCache::OngoingUpload::AppendSectors(const ContractID& contract_id,
                                                           std::chrono::steady_clock::time_point now,
                                                           std::vector<Hash256>* out) const {
  std::lock_guard<std::mutex> lock(mutex_);

  // Expired uploads stay in the map until the next Finish() but report nothing
  if (IsExpired(now)) {
    return 0;
  }

  auto it = contract_sectors_.find(contract_id);
  if (it == contract_sectors_.end()) {
    return 0;
  }
  if (out) {
    out->insert(out->end(), it->second.begin(), it->second.end());
  }
  return it->second.size();
}

UploadResult UploadingSectorsCache::Track(const UploadID& upload_id) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (uploads_.find(upload_id) != uploads_.end()) {
    LOG_BUS_DEBUG("UploadingSectorsCache: upload {} already tracked", upload_id.GetHex());
    return UploadResult::AlreadyExists;
  }

  uploads_.emplace(upload_id, std::make_shared<OngoingUpload>(util::GetSteadyTime()));
  LOG_BUS_TRACE("UploadingSectorsCache: tracking upload {} ({} ongoing)", upload_id.GetHex(), uploads_.size());
  return UploadResult::Success;
}

UploadResult UploadingSectorsCache::AddSector(const UploadID& upload_id, const ContractID& contract_id,
                                              const Hash256& root) {
  std::shared_ptr<OngoingUpload> ongoing;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = uploads_.find(upload_id);
    if (it != uploads_.end()) {
      ongoing = it->second;
    }
  }

  if (!ongoing) {
    LOG_BUS_DEBUG("UploadingSectorsCache: sector {} for unknown upload {}", root.GetHex(), upload_id.GetHex());
    return UploadResult::UnknownUpload;
  }

  ongoing->AddSector(contract_id, root);
  return UploadResult::Success;
}

void UploadingSectorsCache::Finish(const UploadID& upload_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  uploads_.erase(upload_id);

  auto now = util::GetSteadyTime();
  size_t pruned = 0;
  for (auto it = uploads_.begin(); it != uploads_.end();) {
    if (it->second->IsExpired(now)) {
      LOG_BUS_DEBUG("UploadingSectorsCache: pruning expired upload {}", it->first.GetHex());
      it = uploads_.erase(it);
      ++pruned;
    } else {
      ++it;
    }
  }

  LOG_BUS_TRACE("UploadingSectorsCache: finished upload {} (pruned {}, {} ongoing)", upload_id.GetHex(), pruned,
                uploads_.size());
}

void UploadingSectorsCache::AddRenewal(const ContractID& renewed_to, const ContractID& renewed_from) {
  std::lock_guard<std::mutex> lock(mutex_);

  // Drop the grandparent link to bound memory. This only loses information if
  // a contract renews twice during a single upload.
  auto parent = renewed_from_.find(renewed_from);
  if (parent != renewed_from_.end()) {
    renewed_to_.erase(parent->second);
    renewed_from_.erase(parent);
  }

  renewed_from_[renewed_to] = renewed_from;
  renewed_to_[renewed_from] = renewed_to;

  LOG_BUS_DEBUG("UploadingSectorsCache: contract {} renewed to {}", renewed_from.GetHex(), renewed_to.GetHex());
}

UploadingSectorsCache::ResolvedChain UploadingSectorsCache::ResolveChain(const ContractID& contract_id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto child = renewed_to_.find(contract_id);
  if (child != renewed_to_.end()) {
    return ResolvedChain{child->second, contract_id};
  }

  auto parent = renewed_from_.find(contract_id);
  if (parent != renewed_from_.end()) {
    return ResolvedChain{contract_id, parent->second};
  }
  return ResolvedChain{contract_id, std::nullopt};
}

std::vector<std::shared_ptr<UploadingSectorsCache::OngoingUpload>> UploadingSectorsCache::OngoingUploads() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::shared_ptr<OngoingUpload>> uploads;
  uploads.reserve(uploads_.size());
  for (const auto& [id, ongoing] : uploads_) {
    uploads.push_back(ongoing);
  }
  return uploads;
}

uint64_t UploadingSectorsCache::Pending(const ContractID& contract_id) const {
  ResolvedChain chain = ResolveChain(contract_id);
  auto now = util::GetSteadyTime();

  uint64_t sectors = 0;
  for (const auto& ongoing : OngoingUploads()) {
    sectors += ongoing->AppendSectors(chain.current, now, nullptr);
    if (chain.renewed_from) {
      sectors += ongoing->AppendSectors(*chain.renewed_from, now, nullptr);
    }
  }
  return sectors * SECTOR_SIZE;
}

std::vector<Hash256> UploadingSectorsCache::Sectors(const ContractID& contract_id) const {
  ResolvedChain chain = ResolveChain(contract_id);
  auto now = util::GetSteadyTime();

  std::vector<Hash256> roots;
  for (const auto& ongoing : OngoingUploads()) {
    ongoing->AppendSectors(chain.current, now, &roots);
    if (chain.renewed_from) {
      ongoing->AppendSectors(*chain.renewed_from, now, &roots);
    }
  }
  return roots;
}

size_t UploadingSectorsCache::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return uploads_.size();
}

bool UploadingSectorsCache::IsTracked(const UploadID& upload_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return uploads_.find(upload_id) != uploads_.end();
}

std::pair<size_t, size_t> UploadingSectorsCache::RenewalCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {renewed_from_.size(), renewed_to_.size()};
}

}  // namespace bus
}  // namespace stratus
