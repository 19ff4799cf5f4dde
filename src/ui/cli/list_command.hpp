#pragma once

#include "core/annotation.hpp"
#include "core/panel_settings.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <QString>

#include <optional>
#include <vector>

namespace marginalia::storage {
class PanelSettingsStore;
}

namespace marginalia::ui {

struct ListCommandOptions {
    QString input_path;
    QString preset;     // empty keeps the persisted preset
    QString search;
    QString sort_field;
    QString direction;
    QString at;         // point lookup offset
    QString range;      // "start:end" overlap query
};

/**
 * Apply command-line overrides on top of the persisted settings.
 */
[[nodiscard]] Result<panel::NotesPanelSettings> apply_list_overrides(panel::NotesPanelSettings settings,
                                                                     const ListCommandOptions& options);

/**
 * One line per annotation: type, id, range, relative date and excerpt.
 */
[[nodiscard]] QString format_annotation_list(const std::vector<Annotation>& annotations, Timestamp now);

/**
 * "all: 5 | notes-only: 2 | with-notes: 4 | recent: 5"
 */
[[nodiscard]] QString format_preset_counts(const std::vector<Annotation>& annotations);

/**
 * List the file through the notes-panel view. Overrides given on the
 * command line are persisted for the next run.
 */
[[nodiscard]] Result<QString> run_list_command(const ListCommandOptions& options,
                                               const storage::PanelSettingsStore& store,
                                               Timestamp now);

} // namespace marginalia::ui
