#include "ConfigService.hpp"
#include "core/YamlConfig.hpp"
#include <QDebug>

namespace hrb {

ConfigService::ConfigService(YamlConfig* config, const QString& configPath, QObject* parent)
    : QObject(parent), config_(config), configPath_(configPath)
{
}

QVariant ConfigService::value(const QString& key) const
{
    return config_->valueByPath(key);
}

bool ConfigService::setValue(const QString& key, const QVariant& val)
{
    if (!config_->setValueByPath(key, val)) {
        qWarning() << "ConfigService: rejected write to unknown key" << key;
        return false;
    }
    emit configChanged(key, val);
    return true;
}

void ConfigService::save()
{
    if (configPath_.isEmpty()) return;
    config_->save(configPath_);
}

} // namespace hrb
