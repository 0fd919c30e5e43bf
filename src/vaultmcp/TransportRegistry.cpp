//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TransportRegistry.cpp
// Purpose: Channel map bookkeeping
//==========================================================================================================

#include "vaultmcp/TransportRegistry.h"
#include "logging/Logger.h"

#include <stdexcept>

namespace vaultmcp {

std::shared_ptr<IChannel> TransportRegistry::Get(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = channels.find(sessionId);
    return it == channels.end() ? nullptr : it->second;
}

void TransportRegistry::Bind(const std::string& sessionId, std::shared_ptr<IChannel> channel) {
    if (!channel) {
        throw std::invalid_argument("Cannot bind a null channel for session " + sessionId);
    }
    std::lock_guard<std::mutex> lock(mutex);
    auto it = channels.find(sessionId);
    if (it != channels.end()) {
        if (it->second->IsOpen()) {
            throw std::logic_error("Session " + sessionId + " already has an open channel");
        }
        it->second = std::move(channel);
    } else {
        channels.emplace(sessionId, std::move(channel));
        ++liveConnections;
    }
    LOG_DEBUG("Channel bound for session {} (live={})", sessionId, liveConnections);
}

std::shared_ptr<IChannel> TransportRegistry::Unbind(const std::string& sessionId) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = channels.find(sessionId);
    if (it == channels.end()) {
        return nullptr;
    }
    auto channel = std::move(it->second);
    channels.erase(it);
    --liveConnections;
    LOG_DEBUG("Channel unbound for session {} (live={})", sessionId, liveConnections);
    return channel;
}

void TransportRegistry::OnChannelClosed(const std::string& sessionId, const IChannel* channel) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = channels.find(sessionId);
    if (it == channels.end() || it->second.get() != channel) {
        return;
    }
    channels.erase(it);
    --liveConnections;
    LOG_INFO("Channel for session {} closed; removed from registry (live={})", sessionId, liveConnections);
}

std::vector<std::shared_ptr<IChannel>> TransportRegistry::DrainAll() {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::shared_ptr<IChannel>> out;
    out.reserve(channels.size());
    for (auto& [id, ch] : channels) {
        out.push_back(std::move(ch));
    }
    channels.clear();
    liveConnections = 0;
    return out;
}

std::size_t TransportRegistry::LiveConnections() const {
    std::lock_guard<std::mutex> lock(mutex);
    return liveConnections;
}

std::vector<std::string> TransportRegistry::SessionIds() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::string> ids;
    ids.reserve(channels.size());
    for (const auto& [id, ch] : channels) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace vaultmcp
