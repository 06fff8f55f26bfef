#pragma once
#include "messaging/messages.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::messaging {
//---------------------------------------------------------------------------
/// Owns the reply inboxes of the request/reply convention.
/// The requester never sees correlation ids, it only waits for the reply or the timeout.
class InboxRegistry {
    /// The prefix of every inbox subject
    static constexpr std::string_view inboxPrefix = "_INBOX.";

    /// The lock
    std::mutex _mutex;
    /// Signals a delivered reply
    std::condition_variable _delivered;
    /// The open inboxes and their reply
    std::unordered_map<std::string, std::optional<BrokerMessage>> _inboxes;

    public:
    /// Open an inbox and return its subject
    [[nodiscard]] std::string open();
    /// Deliver the reply to an inbox, false for unknown, closed or answered inboxes
    bool deliver(const std::string& inbox, BrokerMessage reply);
    /// Wait for the reply, throws Timeout when none arrived in time, the inbox is closed afterwards
    [[nodiscard]] BrokerMessage await(const std::string& inbox, std::chrono::milliseconds timeout);
    /// Perform a request, publish sends the message carrying the inbox as reply subject
    [[nodiscard]] BrokerMessage request(const RequestMessage& request, const std::function<void(const BrokerMessage&)>& publish);
    /// Get the number of open inboxes
    [[nodiscard]] size_t size();
    /// Is the subject an inbox subject?
    [[nodiscard]] static bool isInbox(std::string_view subject) { return subject.starts_with(inboxPrefix); }
};
//---------------------------------------------------------------------------
} // namespace caplink::messaging
