// Copyright 2025 Tenstorrent Corporation or its affiliates.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <iostream>
#include <mutex>
#include "VmManager.hpp"

using namespace ArmHyp;


VmManager::VmManager(GasidAllocator& gasids, PageTableArena& arena, CpuBackend& cpu,
                     const Stage2Config& config)
  : gasids_(gasids), arena_(arena), cpu_(cpu), config_(config)
{
}


HvError
VmManager::createGuest(Gasid& gasid)
{
  Gasid id = 0;
  HvError err = gasids_.allocate(id);
  if (err != HvError::None)
    return err;

  std::unique_ptr<Stage2Context> context;
  {
    std::lock_guard<SpinLock> guard(lock_);
    err = Stage2Context::create(id, config_, arena_, cpu_, context);
    if (err == HvError::None)
      {
        context->enableTrace(trace_ != nullptr, trace_);
        guests_[id] = std::move(context);
      }
  }

  if (err != HvError::None)
    {
      gasids_.free(id);
      return err;
    }

  if (trace_)
    *trace_ << "vm: created guest " << id << '\n';

  gasid = id;
  return HvError::None;
}


HvError
VmManager::destroyGuest(Gasid gasid)
{
  {
    std::lock_guard<SpinLock> guard(lock_);
    auto iter = guests_.find(gasid);
    if (iter == guests_.end())
      return HvError::InvalidArgument;

    // No stale translation may outlive the id: it gets reused.
    iter->second->invalidateAll();
    guests_.erase(iter);
  }

  gasids_.free(gasid);

  if (trace_)
    *trace_ << "vm: destroyed guest " << gasid << '\n';
  return HvError::None;
}


HvError
VmManager::map(Gasid gasid, uint64_t ipa, uint64_t hpa, uint64_t size, const MapAttrs& attrs)
{
  std::lock_guard<SpinLock> guard(lock_);
  auto iter = guests_.find(gasid);
  if (iter == guests_.end())
    return HvError::InvalidArgument;
  return iter->second->map(ipa, hpa, size, attrs);
}


HvError
VmManager::unmap(Gasid gasid, uint64_t ipa, uint64_t size)
{
  std::lock_guard<SpinLock> guard(lock_);
  auto iter = guests_.find(gasid);
  if (iter == guests_.end())
    return HvError::InvalidArgument;
  return iter->second->unmap(ipa, size);
}


HvError
VmManager::addLazyRegion(Gasid gasid, uint64_t ipa, uint64_t hpa, uint64_t size,
                         const MapAttrs& attrs)
{
  std::lock_guard<SpinLock> guard(lock_);
  auto iter = guests_.find(gasid);
  if (iter == guests_.end())
    return HvError::InvalidArgument;
  return iter->second->addLazyRegion(ipa, hpa, size, attrs);
}


HvError
VmManager::translate(Gasid gasid, uint64_t ipa, TranslationResult& result,
                     AccessType access) const
{
  std::lock_guard<SpinLock> guard(lock_);
  auto iter = guests_.find(gasid);
  if (iter == guests_.end())
    return HvError::InvalidArgument;
  return iter->second->translate(ipa, result, access);
}


HvError
VmManager::handleStage2Abort(Gasid gasid, const AbortInfo& info, GuestMemoryError& error)
{
  std::lock_guard<SpinLock> guard(lock_);
  auto iter = guests_.find(gasid);
  if (iter == guests_.end())
    return HvError::InvalidArgument;
  Stage2Context& context = *iter->second;

  HvError err = faultToError(info.kind);

  if (info.kind == FaultKind::Translation and info.ipaValid and
      context.findLazyRegion(info.ipa))
    {
      err = context.installLazyPage(info.ipa);
      if (err == HvError::None)
        return HvError::None;
    }

  error.gasid = gasid;
  error.ipa = info.ipa;
  error.kind = info.kind;
  error.level = info.level;
  error.write = info.write;

  if (trace_)
    *trace_ << "vm: guest " << gasid << ' ' << describeFault(info) << ": "
            << to_string(err) << '\n';

  return err;
}


Stage2Context*
VmManager::findContext(Gasid gasid)
{
  std::lock_guard<SpinLock> guard(lock_);
  auto iter = guests_.find(gasid);
  return iter == guests_.end() ? nullptr : iter->second.get();
}


const Stage2Context*
VmManager::findContext(Gasid gasid) const
{
  std::lock_guard<SpinLock> guard(lock_);
  auto iter = guests_.find(gasid);
  return iter == guests_.end() ? nullptr : iter->second.get();
}


unsigned
VmManager::guestCount() const
{
  std::lock_guard<SpinLock> guard(lock_);
  return unsigned(guests_.size());
}


std::vector<Gasid>
VmManager::guestIds() const
{
  std::lock_guard<SpinLock> guard(lock_);
  std::vector<Gasid> ids;
  for (const auto& kv : guests_)
    ids.push_back(kv.first);
  return ids;
}


void
VmManager::printPageTables(std::ostream& out) const
{
  std::lock_guard<SpinLock> guard(lock_);
  for (const auto& kv : guests_)
    kv.second->printPageTable(out);
}


void
VmManager::enableTrace(bool flag, std::ostream* out)
{
  std::lock_guard<SpinLock> guard(lock_);
  trace_ = flag ? (out ? out : &std::cerr) : nullptr;
  for (auto& kv : guests_)
    kv.second->enableTrace(flag, trace_);
}
