#pragma once

#include <ssap/Messenger/Frame.hpp>
#include <ssap/Transport/ITransport.hpp>
#include <QObject>

namespace ssap {

/// Encodes outbound frames onto the transport and decodes inbound text into
/// InboundFrame. Undecodable text is dropped here and never reaches the
/// session.
class Messenger : public QObject {
    Q_OBJECT

public:
    explicit Messenger(ITransport* transport, QObject* parent = nullptr);

    void start();
    void stop();

    void sendFrame(const ssap::OutboundFrame& frame);

    int parseFailures() const { return parseFailures_; }

signals:
    void frameReceived(const ssap::InboundFrame& frame);
    void frameSent(const ssap::OutboundFrame& frame);
    void rawReceived(const QString& text);

private:
    void onMessage(const QString& text);

    ITransport* transport_;
    bool started_ = false;
    int parseFailures_ = 0;
};

} // namespace ssap
