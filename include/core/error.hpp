#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::core {
//---------------------------------------------------------------------------
/// The error kinds a dispatch call can fail with
enum class ErrorKind : uint8_t {
    /// The payload could not be decoded
    Malformed = 1,
    /// The operation is not part of the capability
    UnknownOperation = 2,
    /// A chunk arrived with a sequence number that was not expected next
    OutOfSequence = 3,
    /// The transferred bytes do not match the announced size
    SizeMismatch = 4,
    /// The provider refused a well-formed operation
    Rejected = 5,
    /// No reply arrived within the timeout
    Timeout = 6,
    /// The backing system failed
    Backend = 7,
    /// The capability descriptor is inconsistent
    InvalidDescriptor = 8,
    /// The dispatcher was used before it was configured (fatal)
    NotConfigured = 9
};
//---------------------------------------------------------------------------
/// Get the name of an error kind
[[nodiscard]] std::string_view errorKindName(ErrorKind kind) noexcept;
//---------------------------------------------------------------------------
/// The error raised by every failed dispatch call
class DispatchError : public std::runtime_error {
    /// The kind
    ErrorKind _kind;

    public:
    /// The constructor
    DispatchError(ErrorKind kind, const std::string& message);

    /// Get the kind
    [[nodiscard]] ErrorKind kind() const noexcept { return _kind; }
};
//---------------------------------------------------------------------------
/// Report an integration bug and abort the process
[[noreturn]] void fatal(ErrorKind kind, std::string_view message);
//---------------------------------------------------------------------------
} // namespace caplink::core
