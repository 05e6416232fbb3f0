#include <ssap/Transport/ReplayTransport.hpp>

namespace ssap {

ReplayTransport::ReplayTransport(QObject* parent)
    : ITransport(parent)
{
}

ReplayTransport::~ReplayTransport() = default;

void ReplayTransport::start()
{
    started_ = true;
}

void ReplayTransport::stop()
{
    started_ = false;
}

void ReplayTransport::sendText(const QString& message)
{
    if (!connected_) return;
    sent_.append(message);
}

bool ReplayTransport::isConnected() const
{
    return connected_;
}

void ReplayTransport::feedMessage(const QString& message)
{
    emit messageReceived(message);
}

void ReplayTransport::simulateConnect()
{
    connected_ = true;
    emit opened();
}

void ReplayTransport::simulateDisconnect()
{
    connected_ = false;
    emit closed();
}

QStringList ReplayTransport::sentMessages() const
{
    return sent_;
}

void ReplayTransport::clearSent()
{
    sent_.clear();
}

} // namespace ssap
