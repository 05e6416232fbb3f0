#include "core/YamlConfig.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>

namespace wr {

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["device"]["protocol"] = "wss";
    root_["device"]["address"] = "";
    root_["device"]["port"] = 3001;
    root_["device"]["mac"] = "";
    root_["device"]["broadcast"] = "255.255.255.255";
    root_["device"]["tls_verify"] = false;

    root_["keys"]["directory"] = "keys";

    root_["session"]["request_timeout_ms"] = ssap::DEFAULT_REQUEST_TIMEOUT_MS;
    root_["session"]["ready_timeout_ms"] = ssap::DEFAULT_READY_TIMEOUT_MS;
    root_["session"]["reconnect_delay_ms"] = ssap::DEFAULT_RECONNECT_DELAY_MS;
    root_["session"]["register_retry_ms"] = ssap::DEFAULT_REGISTER_RETRY_DELAY_MS;
    root_["session"]["handshake_manifest"] = "";

    root_["watchdog"]["sound_output"] = "";
    root_["watchdog"]["interval_ms"] = 2000;
    root_["watchdog"]["quirk_mode"] = false;

    root_["logging"]["level"] = "info";
    root_["logging"]["protocol_log"] = "";
    root_["logging"]["protocol_format"] = "tsv";
}

// Maps recurse; a sequence or scalar in the source replaces the target's.
void YamlConfig::overlay(YAML::Node target, const YAML::Node& source)
{
    for (auto it = source.begin(); it != source.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        YAML::Node slot = target[key];
        if (slot.IsMap() && it->second.IsMap())
            overlay(slot, it->second);
        else
            target[key] = YAML::Clone(it->second);
    }
}

bool YamlConfig::load(const QString& filePath, QString* errorString)
{
    initDefaults();

    YAML::Node loaded;
    try {
        loaded = YAML::LoadFile(filePath.toStdString());
    } catch (const YAML::Exception& e) {
        if (errorString)
            *errorString = QStringLiteral("%1: %2").arg(filePath, QString::fromStdString(e.what()));
        return false;
    }

    if (!loaded || loaded.IsNull())
        return true;  // empty file: defaults only
    if (!loaded.IsMap()) {
        if (errorString)
            *errorString = QStringLiteral("%1: top level is not a mapping").arg(filePath);
        return false;
    }

    overlay(root_, loaded);
    return true;
}

bool YamlConfig::save(const QString& filePath, QString* errorString) const
{
    const QString dir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(dir)) {
        if (errorString) *errorString = QStringLiteral("cannot create %1").arg(dir);
        return false;
    }

    YAML::Emitter emitter;
    emitter << root_;

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)
        || file.write(emitter.c_str(), qint64(emitter.size())) != qint64(emitter.size())
        || !file.commit()) {
        if (errorString) *errorString = QStringLiteral("cannot write %1: %2").arg(filePath, file.errorString());
        return false;
    }
    return true;
}

QString YamlConfig::defaultPath()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)
        + "/webos-remote/config.yaml";
}

// --- Device ---

QString YamlConfig::deviceProtocol() const
{
    return QString::fromStdString(root_["device"]["protocol"].as<std::string>("wss"));
}

void YamlConfig::setDeviceProtocol(const QString& v)
{
    root_["device"]["protocol"] = v.toStdString();
}

QString YamlConfig::deviceAddress() const
{
    return QString::fromStdString(root_["device"]["address"].as<std::string>(""));
}

void YamlConfig::setDeviceAddress(const QString& v)
{
    root_["device"]["address"] = v.toStdString();
}

uint16_t YamlConfig::devicePort() const
{
    return root_["device"]["port"].as<uint16_t>(3001);
}

void YamlConfig::setDevicePort(uint16_t v)
{
    root_["device"]["port"] = v;
}

QString YamlConfig::deviceMac() const
{
    return QString::fromStdString(root_["device"]["mac"].as<std::string>(""));
}

void YamlConfig::setDeviceMac(const QString& v)
{
    root_["device"]["mac"] = v.toStdString();
}

QString YamlConfig::broadcastAddress() const
{
    return QString::fromStdString(root_["device"]["broadcast"].as<std::string>("255.255.255.255"));
}

void YamlConfig::setBroadcastAddress(const QString& v)
{
    root_["device"]["broadcast"] = v.toStdString();
}

bool YamlConfig::tlsVerify() const
{
    return root_["device"]["tls_verify"].as<bool>(false);
}

void YamlConfig::setTlsVerify(bool v)
{
    root_["device"]["tls_verify"] = v;
}

// --- Credentials ---

QString YamlConfig::keyDirectory() const
{
    return QString::fromStdString(root_["keys"]["directory"].as<std::string>("keys"));
}

void YamlConfig::setKeyDirectory(const QString& v)
{
    root_["keys"]["directory"] = v.toStdString();
}

// --- Session ---

int YamlConfig::requestTimeoutMs() const
{
    return root_["session"]["request_timeout_ms"].as<int>(ssap::DEFAULT_REQUEST_TIMEOUT_MS);
}

int YamlConfig::readyTimeoutMs() const
{
    return root_["session"]["ready_timeout_ms"].as<int>(ssap::DEFAULT_READY_TIMEOUT_MS);
}

int YamlConfig::reconnectDelayMs() const
{
    return root_["session"]["reconnect_delay_ms"].as<int>(ssap::DEFAULT_RECONNECT_DELAY_MS);
}

int YamlConfig::registerRetryMs() const
{
    return root_["session"]["register_retry_ms"].as<int>(ssap::DEFAULT_REGISTER_RETRY_DELAY_MS);
}

QString YamlConfig::handshakeManifest() const
{
    return QString::fromStdString(root_["session"]["handshake_manifest"].as<std::string>(""));
}

// --- Watchdog ---

QString YamlConfig::watchdogOutput() const
{
    return QString::fromStdString(root_["watchdog"]["sound_output"].as<std::string>(""));
}

void YamlConfig::setWatchdogOutput(const QString& v)
{
    root_["watchdog"]["sound_output"] = v.toStdString();
}

int YamlConfig::watchdogIntervalMs() const
{
    return root_["watchdog"]["interval_ms"].as<int>(2000);
}

bool YamlConfig::watchdogQuirkMode() const
{
    return root_["watchdog"]["quirk_mode"].as<bool>(false);
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return QString::fromStdString(root_["logging"]["level"].as<std::string>("info"));
}

QString YamlConfig::protocolLog() const
{
    return QString::fromStdString(root_["logging"]["protocol_log"].as<std::string>(""));
}

QString YamlConfig::protocolLogFormatName() const
{
    return QString::fromStdString(root_["logging"]["protocol_format"].as<std::string>("tsv"));
}

bool YamlConfig::protocolLogFormat(ssap::ProtocolLogger::OutputFormat& out,
                                   QString* errorString) const
{
    const QString name = protocolLogFormatName().toLower();
    if (name == "tsv") {
        out = ssap::ProtocolLogger::OutputFormat::Tsv;
    } else if (name == "jsonl") {
        out = ssap::ProtocolLogger::OutputFormat::Jsonl;
    } else {
        if (errorString)
            *errorString = QStringLiteral("logging.protocol_format: unknown format '%1' (tsv|jsonl)")
                               .arg(protocolLogFormatName());
        return false;
    }
    return true;
}

bool YamlConfig::sessionConfig(ssap::SessionConfig& out, QString* errorString) const
{
    out.endpoint.protocol = deviceProtocol();
    out.endpoint.address = deviceAddress();
    out.endpoint.port = devicePort();
    out.tlsPolicy = tlsVerify() ? ssap::TlsPolicy::Verify : ssap::TlsPolicy::AcceptSelfSigned;
    out.keyDirectory = keyDirectory();
    out.requestTimeout = requestTimeoutMs();
    out.readyTimeout = readyTimeoutMs();
    out.reconnectDelay = reconnectDelayMs();
    out.registerRetryDelay = registerRetryMs();

    const QString manifestPath = handshakeManifest();
    if (manifestPath.isEmpty()) {
        out.handshakePayload = QJsonObject();
        return true;
    }

    QFile file(manifestPath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorString)
            *errorString = QStringLiteral("cannot read handshake manifest %1: %2")
                               .arg(manifestPath, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorString)
            *errorString = QStringLiteral("handshake manifest %1 is not a JSON object").arg(manifestPath);
        return false;
    }
    out.handshakePayload = doc.object();
    return true;
}

// --- Generic dot-path access ---

namespace {

// Read-only walk; a miss yields an undefined node instead of inserting one.
YAML::Node descend(const YAML::Node& node, const QStringList& parts, int index = 0)
{
    if (index == parts.size())
        return node;
    if (!node.IsMap())
        return YAML::Node(YAML::NodeType::Undefined);
    const YAML::Node child = node[parts.at(index).toStdString()];
    if (!child.IsDefined())
        return YAML::Node(YAML::NodeType::Undefined);
    return descend(child, parts, index + 1);
}

void store(YAML::Node node, const QStringList& parts, int index, const QVariant& value)
{
    YAML::Node slot = node[parts.at(index).toStdString()];
    if (index + 1 < parts.size()) {
        store(slot, parts, index + 1, value);
        return;
    }

    if (value.typeId() == QMetaType::Bool)
        slot = value.toBool();
    else if (value.typeId() == QMetaType::Int)
        slot = value.toInt();
    else
        slot = value.toString().toStdString();
}

} // namespace

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    const YAML::Node node = descend(root_, dottedKey.split('.'));
    if (!node.IsDefined() || !node.IsScalar()) return {};

    const QString text = QString::fromStdString(node.Scalar());
    if (text == QLatin1String("true") || text == QLatin1String("false"))
        return text == QLatin1String("true");

    bool isInt = false;
    const int number = text.toInt(&isInt);
    return isInt ? QVariant(number) : QVariant(text);
}

YAML::Node YamlConfig::buildDefaultsNode()
{
    return YamlConfig().root_;
}

bool YamlConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    if (dottedKey.isEmpty()) return false;

    // Only leaves of the defaults schema are writable
    const QStringList parts = dottedKey.split('.');
    const YAML::Node schema = descend(buildDefaultsNode(), parts);
    if (!schema.IsDefined() || !schema.IsScalar()) return false;

    store(root_, parts, 0, value);
    return true;
}

} // namespace wr
