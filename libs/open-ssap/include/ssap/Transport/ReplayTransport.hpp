#pragma once

#include <ssap/Transport/ITransport.hpp>
#include <QStringList>

namespace ssap {

/// In-memory transport: tests feed inbound frames and inspect what was sent.
class ReplayTransport : public ITransport {
    Q_OBJECT
public:
    explicit ReplayTransport(QObject* parent = nullptr);
    ~ReplayTransport() override;

    // ITransport interface
    void start() override;
    void stop() override;
    void sendText(const QString& message) override;
    bool isConnected() const override;

    // Test API
    void feedMessage(const QString& message);
    void simulateConnect();
    void simulateDisconnect();
    QStringList sentMessages() const;
    void clearSent();
    bool isStarted() const { return started_; }

private:
    bool started_ = false;
    bool connected_ = false;
    QStringList sent_;
};

} // namespace ssap
