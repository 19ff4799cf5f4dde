#include "storage/panel_settings_store.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLoggingCategory>

#include <algorithm>
#include <cmath>

Q_LOGGING_CATEGORY(marginaliaStorageLog, "marginalia.storage")

namespace marginalia::storage {
namespace {

QString to_qstring(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

template<typename T, typename Parse>
std::optional<T> read_token(const QJsonObject& obj, const QString& key, Parse parse) {
    const auto value = obj.value(key);
    if (!value.isString()) return std::nullopt;
    auto parsed = parse(value.toString().toStdString());
    if (parsed.is_err()) {
        qCDebug(marginaliaStorageLog) << "ignoring" << key << ":"
                                      << QString::fromStdString(parsed.unwrap_err().message);
        return std::nullopt;
    }
    return parsed.unwrap();
}

// JSON numbers may be fractional or exceed int; clamp before rounding.
std::optional<int> read_dimension(const QJsonObject& obj, const QString& key, int min, int max) {
    const auto value = obj.value(key);
    if (!value.isDouble()) return std::nullopt;
    const double clamped = std::clamp(value.toDouble(), static_cast<double>(min), static_cast<double>(max));
    return static_cast<int>(std::lround(clamped));
}

} // namespace

Result<panel::PartialPanelSettings> panel_settings_from_json(const QByteArray& json) {
    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(json, &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        return Result<panel::PartialPanelSettings>::err(
            Error::storage("invalid_json", "Malformed panel settings: " + parse_error.errorString().toStdString()));
    }

    const auto obj = doc.object();
    panel::PartialPanelSettings partial;
    partial.position = read_token<panel::PanelPosition>(obj, QStringLiteral("position"),
                                                        panel::parse_panel_position);
    const auto& limits = panel::DEFAULT_PANEL_CONSTRAINTS;
    partial.width = read_dimension(obj, QStringLiteral("width"), limits.min_width, limits.max_width);
    partial.height = read_dimension(obj, QStringLiteral("height"), limits.min_height, limits.max_height);
    partial.filter_preset = read_token<panel::FilterPreset>(obj, QStringLiteral("filterPreset"),
                                                            panel::parse_filter_preset);
    partial.sort_field = read_token<query::SortField>(obj, QStringLiteral("sortField"),
                                                      query::parse_sort_field);
    partial.sort_direction = read_token<query::SortDirection>(obj, QStringLiteral("sortDirection"),
                                                              query::parse_sort_direction);
    return Result<panel::PartialPanelSettings>::ok(partial);
}

QByteArray panel_settings_to_json(const panel::NotesPanelSettings& settings) {
    QJsonObject obj;
    obj.insert(QStringLiteral("position"), to_qstring(panel::position_token(settings.position)));
    obj.insert(QStringLiteral("width"), settings.width);
    obj.insert(QStringLiteral("height"), settings.height);
    obj.insert(QStringLiteral("filterPreset"), to_qstring(panel::preset_token(settings.filter_preset)));
    obj.insert(QStringLiteral("sortField"), to_qstring(query::sort_field_token(settings.sort_field)));
    obj.insert(QStringLiteral("sortDirection"), to_qstring(query::sort_direction_token(settings.sort_direction)));
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

// ============================================================================
// PanelSettingsStore
// ============================================================================

PanelSettingsStore::PanelSettingsStore(QString ini_path)
    : ini_path_(std::move(ini_path)) {}

std::unique_ptr<QSettings> PanelSettingsStore::open() const {
    if (ini_path_.isEmpty()) {
        return std::make_unique<QSettings>();
    }
    return std::make_unique<QSettings>(ini_path_, QSettings::IniFormat);
}

Result<panel::NotesPanelSettings> PanelSettingsStore::try_load() const {
    using R = Result<panel::NotesPanelSettings>;

    const auto settings = open();
    if (settings->status() != QSettings::NoError) {
        return R::err(Error::storage("read_failed", "Settings storage is not readable"));
    }

    const auto raw = settings->value(QString::fromLatin1(PANEL_SETTINGS_KEY)).toString();
    if (raw.isEmpty()) {
        return R::ok(panel::default_panel_settings());
    }

    return panel_settings_from_json(raw.toUtf8()).map([](const panel::PartialPanelSettings& partial) {
        return panel::validate_panel_settings(partial);
    });
}

Result<void> PanelSettingsStore::try_save(const panel::PartialPanelSettings& partial) const {
    const auto validated = panel::validate_panel_settings(partial);

    const auto settings = open();
    settings->setValue(QString::fromLatin1(PANEL_SETTINGS_KEY),
                       QString::fromUtf8(panel_settings_to_json(validated)));
    settings->sync();
    if (settings->status() != QSettings::NoError) {
        return Result<void>::err(Error::storage("write_failed", "Could not write panel settings"));
    }
    return Result<void>::ok();
}

panel::NotesPanelSettings PanelSettingsStore::load() const {
    auto loaded = try_load();
    if (loaded.is_err()) {
        qCWarning(marginaliaStorageLog) << "using default panel settings:"
                                        << QString::fromStdString(loaded.unwrap_err().describe());
        return panel::default_panel_settings();
    }
    return loaded.unwrap();
}

void PanelSettingsStore::save(const panel::PartialPanelSettings& settings) const {
    auto saved = try_save(settings);
    if (saved.is_err()) {
        qCWarning(marginaliaStorageLog) << "panel settings not saved:"
                                        << QString::fromStdString(saved.unwrap_err().describe());
    }
}

void PanelSettingsStore::save(const panel::NotesPanelSettings& settings) const {
    save(panel::to_partial(settings));
}

void PanelSettingsStore::clear() const {
    const auto settings = open();
    settings->remove(QString::fromLatin1(PANEL_SETTINGS_KEY));
    settings->sync();
}

} // namespace marginalia::storage
