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

#include "IntRegs.hpp"


using namespace ArmHyp;


IntRegs::IntRegs(unsigned regCount)
  : regs_(regCount, 0)
{
}


bool
IntRegs::findReg(std::string_view name, unsigned& ix) const
{
  unsigned i = 0;
  if (not IntRegNames::findReg(name, i))
    return false;

  if (i >= regs_.size())
    return false;

  ix = i;
  return true;
}
