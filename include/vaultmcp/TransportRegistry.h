//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TransportRegistry.h
// Purpose: Session id to live channel map with live-connection accounting
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "vaultmcp/Channel.h"

namespace vaultmcp {

//==========================================================================================================
// TransportRegistry
// Purpose: Holds at most one channel per session id. Never constructs or closes channels itself; the
//          request router owns both so that ordering stays explicit.
// Notes:
//   - Bind refuses to replace an open channel (std::logic_error); the caller closes and unbinds first.
//   - OnChannelClosed removes the entry only when it still refers to the closing channel, so a late close
//     notification from a replaced channel never drops its successor.
//==========================================================================================================
class TransportRegistry {
public:
    std::shared_ptr<IChannel> Get(const std::string& sessionId) const;

    void Bind(const std::string& sessionId, std::shared_ptr<IChannel> channel);

    // Removes the mapping and returns the removed channel; nullptr when absent.
    std::shared_ptr<IChannel> Unbind(const std::string& sessionId);

    // Close notification delivered by a channel.
    void OnChannelClosed(const std::string& sessionId, const IChannel* channel);

    // Removes every mapping and returns the channels for the caller to close.
    std::vector<std::shared_ptr<IChannel>> DrainAll();

    std::size_t LiveConnections() const;
    std::vector<std::string> SessionIds() const;

private:
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<IChannel>> channels;
    std::size_t liveConnections{0};
};

} // namespace vaultmcp
