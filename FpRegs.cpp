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

#include "FpRegs.hpp"

using namespace ArmHyp;


FpRegs::FpRegs(unsigned regCount)
  : regs_(regCount)
{
}


bool
FpRegs::findReg(const std::string_view name, unsigned& ix) const
{
  unsigned i = 0;
  if (not FpRegNames::findReg(name, i))
    return false;

  if (i >= regs_.size())
    return false;

  ix = i;
  return true;
}


void
FpRegs::reset()
{
  for (auto& reg : regs_)
    reg = VecReg{};
  fpcr_ = 0;
  fpsr_ = 0;
}
