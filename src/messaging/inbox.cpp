#include "messaging/inbox.hpp"
#include "core/error.hpp"
#include "utils/utils.hpp"
#include <spdlog/spdlog.h>
//---------------------------------------------------------------------------
// CapLink - Actor Capability Dispatch Library
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace caplink::messaging {
//---------------------------------------------------------------------------
using namespace std;
using core::DispatchError;
using core::ErrorKind;
//---------------------------------------------------------------------------
string InboxRegistry::open()
// Open an inbox
{
    auto inbox = string(inboxPrefix) + utils::generateGuid();
    lock_guard lock(_mutex);
    _inboxes.emplace(inbox, nullopt);
    return inbox;
}
//---------------------------------------------------------------------------
bool InboxRegistry::deliver(const string& inbox, BrokerMessage reply)
// Deliver the reply, the first one wins
{
    {
        lock_guard lock(_mutex);
        auto it = _inboxes.find(inbox);
        if (it == _inboxes.end() || it->second) {
            spdlog::debug("[InboxRegistry] dropping reply to {}", inbox);
            return false;
        }
        it->second = move(reply);
    }
    _delivered.notify_all();
    return true;
}
//---------------------------------------------------------------------------
BrokerMessage InboxRegistry::await(const string& inbox, chrono::milliseconds timeout)
// Wait for the reply
{
    unique_lock lock(_mutex);
    auto it = _inboxes.find(inbox);
    if (it == _inboxes.end())
        throw DispatchError(ErrorKind::Rejected, "inbox " + inbox + " is not open");
    if (timeout.count() <= 0) {
        _inboxes.erase(it);
        throw DispatchError(ErrorKind::Malformed, "timeout must be positive");
    }

    auto answered = _delivered.wait_for(lock, timeout, [&] { return _inboxes.at(inbox).has_value(); });
    auto node = _inboxes.extract(inbox);
    if (!answered)
        throw DispatchError(ErrorKind::Timeout, "no reply on " + inbox + " within " + to_string(timeout.count()) + " ms");
    return move(*node.mapped());
}
//---------------------------------------------------------------------------
BrokerMessage InboxRegistry::request(const RequestMessage& request, const function<void(const BrokerMessage&)>& publish)
// Perform a request
{
    if (request.timeoutMs <= 0)
        throw DispatchError(ErrorKind::Malformed, "request on " + request.subject + " has timeout " + to_string(request.timeoutMs));
    auto inbox = open();
    try {
        publish(BrokerMessage{request.subject, inbox, request.body});
    } catch (const exception&) {
        lock_guard lock(_mutex);
        _inboxes.erase(inbox);
        throw;
    }
    return await(inbox, chrono::milliseconds(request.timeoutMs));
}
//---------------------------------------------------------------------------
size_t InboxRegistry::size()
// Get the number of open inboxes
{
    lock_guard lock(_mutex);
    return _inboxes.size();
}
//---------------------------------------------------------------------------
} // namespace caplink::messaging
