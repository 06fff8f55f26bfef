#include "core/operations.hpp"
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::core {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
optional<Operation> parseOperation(string_view name) noexcept
// Find the operation of a wire name
{
    for (auto i = 0u; i < operationCount; i++)
        if (operationNames[i] == name)
            return static_cast<Operation>(i);
    return nullopt;
}
//---------------------------------------------------------------------------
} // namespace caplink::core
