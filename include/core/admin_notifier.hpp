#pragma once

#include <string>

/**
 * @brief Channel for operational alerts to administrators
 */
class AdminNotifier
{
public:
    virtual ~AdminNotifier() = default;
    virtual void sendAlert(const std::string &subject, const std::string &message) = 0;
};

/**
 * @brief Writes alerts to the pipeline log at WARN level
 */
class LoggingAdminNotifier : public AdminNotifier
{
public:
    void sendAlert(const std::string &subject, const std::string &message) override;
};
