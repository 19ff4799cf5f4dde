#pragma once

#include "core/panel_settings.hpp"
#include "core/result.hpp"

#include <QByteArray>
#include <QSettings>
#include <QString>

#include <memory>

namespace marginalia::storage {

inline constexpr auto PANEL_SETTINGS_KEY = "reader/notes_panel";

/**
 * Decode the persisted JSON. Fields that are missing, mistyped or carry an
 * unknown token come back empty; only malformed JSON is an error.
 */
[[nodiscard]] Result<panel::PartialPanelSettings> panel_settings_from_json(const QByteArray& json);

[[nodiscard]] QByteArray panel_settings_to_json(const panel::NotesPanelSettings& settings);

/**
 * PanelSettingsStore - Load/validate/save boundary for the notes panel
 * configuration.
 *
 * load() and save() never fail: storage errors are logged and load()
 * falls back to defaults. Last write wins.
 */
class PanelSettingsStore {
public:
    PanelSettingsStore() = default;

    // Use an INI file instead of the application's native settings.
    explicit PanelSettingsStore(QString ini_path);

    [[nodiscard]] panel::NotesPanelSettings load() const;
    void save(const panel::PartialPanelSettings& settings) const;
    void save(const panel::NotesPanelSettings& settings) const;
    void clear() const;

    [[nodiscard]] Result<panel::NotesPanelSettings> try_load() const;
    [[nodiscard]] Result<void> try_save(const panel::PartialPanelSettings& settings) const;

private:
    [[nodiscard]] std::unique_ptr<QSettings> open() const;

    QString ini_path_;
};

} // namespace marginalia::storage
