#include <ssap/Messenger/Messenger.hpp>
#include <ssap/Messenger/FrameCodec.hpp>
#include <QDebug>

namespace ssap {

Messenger::Messenger(ITransport* transport, QObject* parent)
    : QObject(parent)
    , transport_(transport)
{
}

void Messenger::start()
{
    if (started_) return;
    started_ = true;
    connect(transport_, &ITransport::messageReceived, this, &Messenger::onMessage);
}

void Messenger::stop()
{
    if (!started_) return;
    started_ = false;
    disconnect(transport_, &ITransport::messageReceived, this, &Messenger::onMessage);
}

void Messenger::sendFrame(const OutboundFrame& frame)
{
    emit frameSent(frame);
    transport_->sendText(FrameCodec::encode(frame));
}

void Messenger::onMessage(const QString& text)
{
    emit rawReceived(text);

    QString why;
    auto frame = FrameCodec::decode(text, &why);
    if (!frame) {
        ++parseFailures_;
        qDebug() << "[Messenger] Dropping undecodable frame:" << why;
        return;
    }
    emit frameReceived(*frame);
}

} // namespace ssap
