#include "core/admin_notifier.hpp"
#include "logging/logger.hpp"

void LoggingAdminNotifier::sendAlert(const std::string &subject, const std::string &message)
{
    Logger::warn("[ADMIN ALERT] " + subject + ": " + message);
}
