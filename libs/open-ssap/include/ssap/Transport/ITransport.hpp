#pragma once

#include <QObject>
#include <QString>

namespace ssap {

/// One logical text-frame connection to the device.
/// Implementations own their reconnect policy; the session only reacts to
/// the four events below.
class ITransport : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~ITransport() override = default;

    virtual void start() = 0;
    virtual void stop() = 0;
    virtual void sendText(const QString& message) = 0;
    virtual bool isConnected() const = 0;

signals:
    void opened();
    void messageReceived(const QString& message);
    void error(const QString& message);
    void closed();
};

} // namespace ssap
