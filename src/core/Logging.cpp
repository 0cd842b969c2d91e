#include "Logging.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

namespace hrb {

bool applyLogLevel(const QString& level)
{
    namespace logging = boost::log;
    using logging::trivial::severity_level;

    const QString name = level.trimmed().toLower();
    severity_level threshold;
    if (name == QLatin1String("trace")) threshold = severity_level::trace;
    else if (name == QLatin1String("debug")) threshold = severity_level::debug;
    else if (name == QLatin1String("info")) threshold = severity_level::info;
    else if (name == QLatin1String("warning") || name == QLatin1String("warn")) threshold = severity_level::warning;
    else if (name == QLatin1String("error")) threshold = severity_level::error;
    else {
        BOOST_LOG_TRIVIAL(warning) << "[Logging] Unknown level \"" << level.toStdString()
                                   << "\", keeping current filter";
        return false;
    }

    logging::core::get()->set_filter(logging::trivial::severity >= threshold);
    return true;
}

} // namespace hrb
