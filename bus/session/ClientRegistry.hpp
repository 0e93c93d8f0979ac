/**
 * \file bus/session/ClientRegistry.hpp
 * \brief Thread-safe table of connected bus clients.
 * \ingroup bus_module
 */
#pragma once

#include "ClientSession.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace bus {

/**
 * \brief Live sessions by id plus a retired list.
 * \ingroup bus_module
 *
 * A removed session may still be running its reader coroutine (it is often removed
 * from inside that coroutine), so it is parked in the retired list until `is_done()`.
 */
class ClientRegistry {
public:
    using Filter = std::function<bool(const ClientSession&)>;

    void add(std::shared_ptr<ClientSession> session);
    /** \brief Unlink `id`; the session moves to the retired list. Null if unknown. */
    std::shared_ptr<ClientSession> remove(const std::string& id);
    std::shared_ptr<ClientSession> find(const std::string& id) const;

    std::vector<std::shared_ptr<ClientSession>> snapshot() const;
    std::vector<std::string> ids() const;
    std::size_t size() const;
    bool has_role(ClientRole role) const;

    /**
     * \brief Write one encoded frame to every open session accepted by `filter`.
     * \return Number of successful deliveries. Closing sessions are skipped.
     */
    std::size_t deliver(const std::string& frame, const Filter& filter = {}) const;

    /** \brief Unlink everything; the sessions are retired and returned. */
    std::vector<std::shared_ptr<ClientSession>> take_all();

    /** \brief Drop retired sessions whose reader finished, or all of them with `force`. */
    std::size_t purge_retired(bool force = false);
    std::size_t retired_count() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ClientSession>> live_;
    std::vector<std::shared_ptr<ClientSession>> retired_;
};

} // namespace bus
