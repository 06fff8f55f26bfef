#pragma once
#include <string_view>
#include <spdlog/spdlog.h>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::utils {
//---------------------------------------------------------------------------
/// Parse a level name (trace, debug, info, warn, error, critical, off), unknown names map to info
[[nodiscard]] spdlog::level::level_enum parseLogLevel(std::string_view name) noexcept;
/// Install a colored stdout logger as default logger
void initLogging(spdlog::level::level_enum level = spdlog::level::info);
/// Install a colored stdout logger with a level given by name
void initLogging(std::string_view level);
//---------------------------------------------------------------------------
} // namespace caplink::utils
