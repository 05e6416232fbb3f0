#pragma once

#include <QString>

namespace ssap {

/// Pairing credentials on disk: one file per device address, file contents are
/// the raw UTF-8 token. The directory is created on first save.
class CredentialStore {
public:
    explicit CredentialStore(const QString& directory = "keys");

    QString directory() const { return directory_; }

    /// Returns the stored credential, or an empty string when none exists.
    QString load(const QString& deviceAddress) const;

    bool save(const QString& deviceAddress, const QString& credential,
              QString* errorString = nullptr) const;

    bool contains(const QString& deviceAddress) const;
    bool remove(const QString& deviceAddress) const;

    QString filePath(const QString& deviceAddress) const;

private:
    QString directory_;
};

} // namespace ssap
