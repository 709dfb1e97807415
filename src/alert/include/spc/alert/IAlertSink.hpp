/**
 * @file IAlertSink.hpp
 * @brief Alerting collaborator interface.
 * @author MasterLaplace
 *
 * Implementations contact emergency contacts, push notifications, etc.
 * The core never retries a delivery; retry policy belongs to the sink.
 */

#pragma once

#include <spc/alert/Alert.hpp>

namespace spc::alert {

/**
 * @brief Receiver of alerts raised by the safety core.
 *
 * notify() is invoked from the dispatcher worker thread, one alert at a
 * time.  A sink reporting failure by throwing has the failure logged and
 * the alert counted as failed.
 */
class IAlertSink {
public:
    virtual ~IAlertSink() = default;

    virtual void notify(const Alert &alert) = 0;
};

} // namespace spc::alert
