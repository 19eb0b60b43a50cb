#pragma once

#include <utility>

#include <QList>
#include <QObject>
#include <QTimer>

#include "keylight_transport.h"

namespace keylight::control::test {

// In-memory device that answers on the next event-loop turn, or only when
// told to when `autoComplete` is off.
class FakeTransport final : public DeviceTransport
{
public:
    enum class Kind {
        Read,
        Write,
        Info,
    };

    struct Call {
        quint64 id = 0;
        Kind kind = Kind::Read;
        ConnectionSettings target;
        DeviceState state;
        bool snapshot = false;
        Callback done;
    };

    bool autoComplete = true;
    bool reachable = true;
    // Reads answer with the device state at request time instead of at completion.
    bool snapshotReads = false;
    DeviceState device;
    AccessoryInfo accessory;

    QList<DeviceState> writes;
    QList<ConnectionSettings> writeTargets;
    int reads = 0;
    QList<quint64> cancelled;
    QList<Call> pending;

    quint64 readState(const ConnectionSettings &target,
                      int,
                      Callback done,
                      QString * = nullptr) override
    {
        ++reads;
        const quint64 id = enqueue(Kind::Read, target, device, std::move(done));
        pending.last().snapshot = snapshotReads;
        return id;
    }

    quint64 writeState(const ConnectionSettings &target,
                       const DeviceState &state,
                       int,
                       Callback done,
                       QString * = nullptr) override
    {
        writes.append(state);
        writeTargets.append(target);
        return enqueue(Kind::Write, target, state, std::move(done));
    }

    quint64 readAccessoryInfo(const ConnectionSettings &target,
                              int,
                              Callback done,
                              QString * = nullptr) override
    {
        return enqueue(Kind::Info, target, DeviceState{}, std::move(done));
    }

    void cancel(quint64 callId) override
    {
        for (int i = 0; i < pending.size(); ++i) {
            if (pending.at(i).id == callId) {
                pending.removeAt(i);
                cancelled.append(callId);
                return;
            }
        }
    }

    int pendingOf(Kind kind) const
    {
        int count = 0;
        for (const Call &call : pending) {
            if (call.kind == kind)
                ++count;
        }
        return count;
    }

    bool complete(quint64 callId)
    {
        for (int i = 0; i < pending.size(); ++i) {
            if (pending.at(i).id != callId)
                continue;
            const Call call = pending.takeAt(i);
            call.done(resultFor(call));
            return true;
        }
        return false;
    }

    quint64 firstPendingOf(Kind kind) const
    {
        for (const Call &call : pending) {
            if (call.kind == kind)
                return call.id;
        }
        return 0;
    }

    void completeAll()
    {
        while (!pending.isEmpty())
            complete(pending.first().id);
    }

private:
    quint64 enqueue(Kind kind, const ConnectionSettings &target, const DeviceState &state, Callback done)
    {
        Call call;
        call.id = m_nextId++;
        call.kind = kind;
        call.target = target;
        call.state = state;
        call.done = std::move(done);
        pending.append(call);

        if (autoComplete) {
            const quint64 id = call.id;
            QTimer::singleShot(0, &m_context, [this, id]() { complete(id); });
        }
        return call.id;
    }

    TransportResult resultFor(const Call &call)
    {
        TransportResult out;
        if (!reachable) {
            out.error = DeviceError::DeviceUnreachable;
            out.message = QStringLiteral("Connection refused");
            return out;
        }

        out.ok = true;
        switch (call.kind) {
        case Kind::Read:
            out.state = call.snapshot ? call.state : device;
            break;
        case Kind::Write:
            // The device only keeps its own temperature units.
            device = call.state;
            device.temperatureKelvin = kelvinFromDeviceUnits(deviceUnitsFromKelvin(call.state.temperatureKelvin));
            out.state = call.state;
            break;
        case Kind::Info:
            out.accessory = accessory;
            break;
        }
        return out;
    }

    QObject m_context;
    quint64 m_nextId = 1;
};

} // namespace keylight::control::test
