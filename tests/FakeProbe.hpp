#pragma once

#include "core/discovery/DeviceVerifier.hpp"
#include <QAtomicInt>
#include <QMap>
#include <QThread>

/// Answers from a fixed ip -> name table. Read-only after setup, so pool
/// threads may call it concurrently.
class FakeProbe : public hrb::IDeviceProbe {
public:
    explicit FakeProbe(const QMap<QString, QString>& tuners = {})
        : tuners_(tuners)
    {
    }

    bool verify(const QString& ip) override { return describe(ip).isValid(); }

    hrb::Device describe(const QString& ip) override
    {
        calls_.fetchAndAddRelaxed(1);
        if (!tuners_.contains(ip)) return {};

        hrb::Device device;
        device.ip = ip;
        device.friendlyName = tuners_.value(ip);
        device.deviceId = QStringLiteral("10AA%1").arg(ip.section('.', 3, 3));
        device.modelNumber = QStringLiteral("HDHR5-4US");
        return device;
    }

    int calls() const { return calls_.loadRelaxed(); }

private:
    QMap<QString, QString> tuners_;
    QAtomicInt calls_{0};
};

/// Takes delayMs per probe (or a per-ip override) and records how many
/// probes were in flight at once. Never finds a tuner.
class SlowProbe : public hrb::IDeviceProbe {
public:
    explicit SlowProbe(int delayMs, const QMap<QString, int>& overrides = {})
        : delayMs_(delayMs)
        , overrides_(overrides)
    {
    }

    bool verify(const QString& ip) override { return describe(ip).isValid(); }

    hrb::Device describe(const QString& ip) override
    {
        const int now = inFlight_.fetchAndAddOrdered(1) + 1;
        int seen = peak_.loadAcquire();
        while (now > seen && !peak_.testAndSetOrdered(seen, now))
            seen = peak_.loadAcquire();

        QThread::msleep(static_cast<unsigned long>(overrides_.value(ip, delayMs_)));

        inFlight_.fetchAndAddOrdered(-1);
        calls_.fetchAndAddOrdered(1);
        return {};
    }

    int peak() const { return peak_.loadAcquire(); }
    int calls() const { return calls_.loadAcquire(); }

private:
    int delayMs_;
    QMap<QString, int> overrides_;
    QAtomicInt inFlight_{0};
    QAtomicInt peak_{0};
    QAtomicInt calls_{0};
};
