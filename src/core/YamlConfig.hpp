#pragma once

#include <QString>
#include <QVariant>
#include <yaml-cpp/yaml.h>
#include <ssap/Messenger/ProtocolLogger.hpp>
#include <ssap/Session/SessionConfig.hpp>

namespace wr {

class YamlConfig {
public:
    YamlConfig();

    /// Merges the file over the built-in defaults. On a missing or malformed
    /// file the defaults stay in place and false is returned.
    bool load(const QString& filePath, QString* errorString = nullptr);
    bool save(const QString& filePath, QString* errorString = nullptr) const;

    static QString defaultPath();

    // Device
    QString deviceProtocol() const;
    void setDeviceProtocol(const QString& v);
    QString deviceAddress() const;
    void setDeviceAddress(const QString& v);
    uint16_t devicePort() const;
    void setDevicePort(uint16_t v);
    QString deviceMac() const;
    void setDeviceMac(const QString& v);
    QString broadcastAddress() const;
    void setBroadcastAddress(const QString& v);
    bool tlsVerify() const;
    void setTlsVerify(bool v);

    // Credentials
    QString keyDirectory() const;
    void setKeyDirectory(const QString& v);

    // Session
    int requestTimeoutMs() const;
    int readyTimeoutMs() const;
    int reconnectDelayMs() const;
    int registerRetryMs() const;
    QString handshakeManifest() const;

    // Watchdog
    QString watchdogOutput() const;
    void setWatchdogOutput(const QString& v);
    int watchdogIntervalMs() const;
    bool watchdogQuirkMode() const;

    // Logging
    QString logLevel() const;
    QString protocolLog() const;
    QString protocolLogFormatName() const;

    /// logging.protocol_format mapped to a logger format; "tsv" or "jsonl".
    bool protocolLogFormat(ssap::ProtocolLogger::OutputFormat& out,
                           QString* errorString = nullptr) const;

    /// Session settings assembled from the device/keys/session sections.
    /// Fails when session.handshake_manifest names an unreadable or non-JSON file.
    bool sessionConfig(ssap::SessionConfig& out, QString* errorString = nullptr) const;

    // Generic dot-path access (e.g. "watchdog.interval_ms")
    QVariant valueByPath(const QString& dottedKey) const;
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

private:
    YAML::Node root_;

    void initDefaults();
    static YAML::Node buildDefaultsNode();
    static void overlay(YAML::Node target, const YAML::Node& source);
};

} // namespace wr
