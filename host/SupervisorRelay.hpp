/**
 * \file host/SupervisorRelay.hpp
 * \brief Publishes worker lifecycle and output to UI clients.
 */
#pragma once

#include "bus/MessageBus.hpp"
#include "logger.hpp"
#include "supervisor/ProcessSupervisor.hpp"

#include <memory>

namespace host {

/**
 * \brief Bridges supervisor observers onto the bus.
 *
 * Status transitions become `PYTHON_STATUS{status, error?}` and captured lines become
 * `PYTHON_LOG{level, message, timestamp}`, both sent to renderers. A `SYSTEM_STATUS`
 * request is answered with the bus and worker snapshots.
 */
class SupervisorRelay {
public:
    SupervisorRelay(bus::MessageBus& bus, supervisor::ProcessSupervisor& supervisor,
                    std::shared_ptr<Logger> logger);
    ~SupervisorRelay();

    SupervisorRelay(const SupervisorRelay&) = delete;
    SupervisorRelay& operator=(const SupervisorRelay&) = delete;

    void attach();
    /** \brief Remove the supervisor callbacks. Called by the destructor. */
    void detach();

    HostBus::Envelope status_snapshot() const;

private:
    bus::MessageBus& bus_;
    supervisor::ProcessSupervisor& supervisor_;
    std::shared_ptr<Logger> logger_;
    bool attached_{false};
};

} // namespace host
