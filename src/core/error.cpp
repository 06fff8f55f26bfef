#include "core/error.hpp"
#include <cstdlib>
#include <spdlog/spdlog.h>
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
string_view errorKindName(ErrorKind kind) noexcept
// Get the name of an error kind
{
    switch (kind) {
        case ErrorKind::Malformed: return "malformed";
        case ErrorKind::UnknownOperation: return "unknown operation";
        case ErrorKind::OutOfSequence: return "out of sequence";
        case ErrorKind::SizeMismatch: return "size mismatch";
        case ErrorKind::Rejected: return "rejected";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Backend: return "backend";
        case ErrorKind::InvalidDescriptor: return "invalid descriptor";
        case ErrorKind::NotConfigured: return "not configured";
    }
    return "unknown";
}
//---------------------------------------------------------------------------
DispatchError::DispatchError(ErrorKind kind, const string& message) : runtime_error(string(errorKindName(kind)) + ": " + message), _kind(kind)
// The constructor
{
}
//---------------------------------------------------------------------------
void fatal(ErrorKind kind, string_view message)
// Report an integration bug and abort the process
{
    spdlog::critical("[CapLink] fatal {}: {}", errorKindName(kind), message);
    spdlog::default_logger()->flush();
    abort();
}
//---------------------------------------------------------------------------
} // namespace caplink::core
