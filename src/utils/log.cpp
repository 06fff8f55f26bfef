#include "utils/log.hpp"
#include <string>
#include <spdlog/sinks/stdout_color_sinks.h>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::utils {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
spdlog::level::level_enum parseLogLevel(string_view name) noexcept
// Parse a level name
{
    auto level = spdlog::level::from_str(string(name));
    // from_str answers off for unknown names
    if (level == spdlog::level::off && name != "off")
        return spdlog::level::info;
    return level;
}
//---------------------------------------------------------------------------
void initLogging(spdlog::level::level_enum level)
// Install a colored stdout logger as default logger
{
    auto logger = spdlog::get("caplink");
    if (!logger)
        logger = spdlog::stdout_color_mt("caplink");
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    logger->set_level(level);
    spdlog::set_default_logger(logger);
}
//---------------------------------------------------------------------------
void initLogging(string_view level)
// Install a colored stdout logger with a level given by name
{
    initLogging(parseLogLevel(level));
}
//---------------------------------------------------------------------------
} // namespace caplink::utils
