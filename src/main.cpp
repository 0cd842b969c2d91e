#include <signal.h>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QHostAddress>
#include <QTextStream>
#include <QUrl>
#include <boost/log/trivial.hpp>
#include <memory>
#include "cli/ProbeReport.hpp"
#include "core/Logging.hpp"
#include "core/YamlConfig.hpp"
#include "core/plugin/HostContext.hpp"
#include "core/services/ConfigService.hpp"
#include "core/services/HttpRouteView.hpp"
#include "core/services/IpcServer.hpp"
#include "core/services/ScreamSink.hpp"
#include "plugins/tuner_radio/TunerRadioPlugin.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("hdhr-radio-bridge");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Bridges HDHomeRun radio channels into an audio router");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption("config", "Configuration file.", "path",
                                    QDir::homePath() + "/.config/hdhr-radio-bridge/config.yaml");
    QCommandLineOption discoverOption("discover", "Discover tuners, print their lineups and exit.");
    QCommandLineOption ipOption("ip", "Probe one address, print its lineup and exit.", "address");
    parser.addOption(configOption);
    parser.addOption(discoverOption);
    parser.addOption(ipOption);
    parser.process(app);

    // Built-in defaults unless a config file exists
    const QString configPath = parser.value(configOption);
    auto yamlConfig = std::make_shared<hrb::YamlConfig>();
    if (QFile::exists(configPath)) {
        try {
            yamlConfig->load(configPath);
        } catch (const YAML::Exception& e) {
            BOOST_LOG_TRIVIAL(error) << "[main] Cannot load " << configPath.toStdString()
                                     << ": " << e.what();
            return 1;
        }
    } else if (parser.isSet(configOption)) {
        BOOST_LOG_TRIVIAL(error) << "[main] Config file not found: " << configPath.toStdString();
        return 1;
    }

    hrb::applyLogLevel(yamlConfig->logLevel());

    // One-shot diagnostics
    if (parser.isSet(ipOption) || parser.isSet(discoverOption)) {
        QTextStream out(stdout);
        if (parser.isSet(ipOption)) {
            const QString ip = parser.value(ipOption);
            if (QHostAddress(ip).protocol() != QAbstractSocket::IPv4Protocol) {
                BOOST_LOG_TRIVIAL(error) << "[main] Not an IPv4 address: " << ip.toStdString();
                return 2;
            }
            return hrb::cli::runProbeReport(*yamlConfig, ip, out);
        }
        return hrb::cli::runDiscoveryReport(*yamlConfig, out);
    }

    BOOST_LOG_TRIVIAL(info) << "[main] hdhr-radio-bridge starting, config "
                            << (QFile::exists(configPath) ? configPath.toStdString() : std::string("(defaults)"));

    auto* configService = new hrb::ConfigService(yamlConfig.get(), configPath, &app);

    hrb::ScreamSink screamSink(QHostAddress(yamlConfig->screamAddress()), yamlConfig->screamPort());

    auto* routeView = new hrb::HttpRouteView(QUrl(yamlConfig->hostApiUrl()),
                                             yamlConfig->routePollMs(), &app);
    routeView->start();

    hrb::HostContext hostContext;
    hostContext.setAudioSink(&screamSink);
    hostContext.setSourceRegistry(&screamSink);
    hostContext.setRouteView(routeView);
    hostContext.setConfigService(configService);

    auto* bridge = new hrb::plugins::TunerRadioPlugin(&app);
    if (!bridge->initialize(&hostContext)) {
        BOOST_LOG_TRIVIAL(error) << "[main] Bridge failed to initialize";
        return 1;
    }

    auto* ipcServer = new hrb::IpcServer(&app);
    ipcServer->setBridge(bridge);
    if (!ipcServer->start(yamlConfig->ipcSocketPath()))
        BOOST_LOG_TRIVIAL(warning) << "[main] Control socket unavailable, continuing without it";

    // SIGINT/SIGTERM -> leave the event loop, teardown below
    signal(SIGINT, [](int) {
        QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                                  Qt::QueuedConnection);
    });
    signal(SIGTERM, [](int) {
        QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                                  Qt::QueuedConnection);
    });
    // A control-socket client hanging up mid-reply must not kill us
    signal(SIGPIPE, SIG_IGN);

    int ret = app.exec();

    // Sessions and sources go before the sink and route view they use
    ipcServer->stop();
    bridge->shutdown();
    routeView->stop();

    BOOST_LOG_TRIVIAL(info) << "[main] hdhr-radio-bridge stopped";
    return ret;
}
