#include "ClientRegistry.hpp"

#include <algorithm>

namespace bus {

void ClientRegistry::add(std::shared_ptr<ClientSession> session) {
    if (!session) return;
    std::lock_guard<std::mutex> lk(mutex_);
    live_[session->id()] = std::move(session);
}

std::shared_ptr<ClientSession> ClientRegistry::remove(const std::string& id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = live_.find(id);
    if (it == live_.end()) return nullptr;
    auto session = std::move(it->second);
    live_.erase(it);
    retired_.push_back(session);
    return session;
}

std::shared_ptr<ClientSession> ClientRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = live_.find(id);
    return it == live_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<ClientSession>> ClientRegistry::snapshot() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<std::shared_ptr<ClientSession>> out;
    out.reserve(live_.size());
    for (const auto& [id, s] : live_) out.push_back(s);
    return out;
}

std::vector<std::string> ClientRegistry::ids() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<std::string> out;
    out.reserve(live_.size());
    for (const auto& [id, s] : live_) out.push_back(id);
    return out;
}

std::size_t ClientRegistry::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return live_.size();
}

bool ClientRegistry::has_role(ClientRole role) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return std::any_of(live_.begin(), live_.end(),
                       [role](const auto& entry) { return entry.second->role() == role && entry.second->is_open(); });
}

std::size_t ClientRegistry::deliver(const std::string& frame, const Filter& filter) const {
    // Writes may block; never hold the table lock across them.
    std::size_t delivered = 0;
    for (const auto& session : snapshot()) {
        if (!session->is_open()) continue;
        if (filter && !filter(*session)) continue;
        if (session->send_frame(frame)) ++delivered;
    }
    return delivered;
}

std::vector<std::shared_ptr<ClientSession>> ClientRegistry::take_all() {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<std::shared_ptr<ClientSession>> out;
    out.reserve(live_.size());
    for (auto& [id, s] : live_) {
        out.push_back(s);
        retired_.push_back(s);
    }
    live_.clear();
    return out;
}

std::size_t ClientRegistry::purge_retired(bool force) {
    std::vector<std::shared_ptr<ClientSession>> dropped;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto split = std::partition(retired_.begin(), retired_.end(),
                                    [force](const std::shared_ptr<ClientSession>& s) { return !force && !s->is_done(); });
        dropped.assign(std::make_move_iterator(split), std::make_move_iterator(retired_.end()));
        retired_.erase(split, retired_.end());
    }
    // Session destructors run outside the lock.
    return dropped.size();
}

std::size_t ClientRegistry::retired_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return retired_.size();
}

} // namespace bus
