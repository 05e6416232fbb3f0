#include <ssap/Session/CredentialStore.hpp>
#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QDebug>

namespace ssap {

namespace {

// Addresses are used as file names; keep them to a safe character set so an
// IPv6 literal or hostname cannot escape the key directory.
QString fileNameFor(const QString& deviceAddress)
{
    QString name;
    name.reserve(deviceAddress.size());
    for (const QChar c : deviceAddress) {
        if (c.isLetterOrNumber() || c == '.' || c == '-' || c == '_')
            name.append(c);
        else
            name.append('_');
    }
    if (name == "." || name == "..")
        name.prepend('_');
    return name;
}

} // namespace

CredentialStore::CredentialStore(const QString& directory)
    : directory_(directory)
{
}

QString CredentialStore::filePath(const QString& deviceAddress) const
{
    return QDir(directory_).filePath(fileNameFor(deviceAddress));
}

QString CredentialStore::load(const QString& deviceAddress) const
{
    QFile file(filePath(deviceAddress));
    if (!file.exists())
        return {};
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[CredentialStore] Cannot read" << file.fileName() << ":" << file.errorString();
        return {};
    }
    return QString::fromUtf8(file.readAll()).trimmed();
}

bool CredentialStore::save(const QString& deviceAddress, const QString& credential,
                           QString* errorString) const
{
    if (deviceAddress.isEmpty()) {
        if (errorString) *errorString = QStringLiteral("empty device address");
        return false;
    }

    if (!QDir().mkpath(directory_)) {
        if (errorString)
            *errorString = QStringLiteral("cannot create directory %1").arg(directory_);
        return false;
    }

    QSaveFile file(filePath(deviceAddress));
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorString) *errorString = file.errorString();
        return false;
    }
    file.write(credential.toUtf8());
    if (!file.commit()) {
        if (errorString) *errorString = file.errorString();
        return false;
    }
    QFile::setPermissions(filePath(deviceAddress),
                          QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    return true;
}

bool CredentialStore::contains(const QString& deviceAddress) const
{
    return QFile::exists(filePath(deviceAddress));
}

bool CredentialStore::remove(const QString& deviceAddress) const
{
    return QFile::remove(filePath(deviceAddress));
}

} // namespace ssap
