#include <QtTest>
#include <boost/log/core.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include "core/Logging.hpp"

namespace {

bool passes(boost::log::trivial::severity_level level)
{
    // A record is only opened when the core filter lets it through
    auto& lg = boost::log::trivial::logger::get();
    boost::log::record rec = lg.open_record(boost::log::keywords::severity = level);
    return static_cast<bool>(rec);
}

} // namespace

class TestLogging : public QObject {
    Q_OBJECT
private slots:
    void cleanup();
    void testLevels();
    void testCaseInsensitive();
    void testUnknownLevelKeepsFilter();
};

void TestLogging::cleanup()
{
    boost::log::core::get()->reset_filter();
}

void TestLogging::testLevels()
{
    using boost::log::trivial::severity_level;

    QVERIFY(hrb::applyLogLevel("warning"));
    QVERIFY(!passes(severity_level::info));
    QVERIFY(passes(severity_level::warning));
    QVERIFY(passes(severity_level::error));

    QVERIFY(hrb::applyLogLevel("trace"));
    QVERIFY(passes(severity_level::trace));
}

void TestLogging::testCaseInsensitive()
{
    using boost::log::trivial::severity_level;

    QVERIFY(hrb::applyLogLevel("  ERROR "));
    QVERIFY(!passes(severity_level::warning));
    QVERIFY(passes(severity_level::error));
}

void TestLogging::testUnknownLevelKeepsFilter()
{
    using boost::log::trivial::severity_level;

    QVERIFY(hrb::applyLogLevel("error"));
    QVERIFY(!hrb::applyLogLevel("loud"));
    QVERIFY(!passes(severity_level::info));
}

QTEST_MAIN(TestLogging)
#include "test_logging.moc"
