#include "HostContext.hpp"
#include <boost/log/trivial.hpp>

namespace hrb {

void HostContext::log(LogLevel level, const QString& message)
{
    const std::string text = message.toStdString();
    switch (level) {
        case LogLevel::Debug:   BOOST_LOG_TRIVIAL(debug) << "[plugin] " << text; break;
        case LogLevel::Info:    BOOST_LOG_TRIVIAL(info) << "[plugin] " << text; break;
        case LogLevel::Warning: BOOST_LOG_TRIVIAL(warning) << "[plugin] " << text; break;
        case LogLevel::Error:   BOOST_LOG_TRIVIAL(error) << "[plugin] " << text; break;
    }
}

} // namespace hrb
