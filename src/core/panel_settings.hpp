#pragma once

#include "core/annotation.hpp"
#include "core/annotation_query.hpp"
#include "core/result.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace marginalia::panel {

enum class PanelPosition {
    Right,
    Bottom
};

enum class FilterPreset {
    All,
    NotesOnly,
    WithNotes,
    Recent  // no extra filter; ordering alone expresses "recent"
};

inline constexpr std::array<FilterPreset, 4> ALL_FILTER_PRESETS = {
    FilterPreset::All, FilterPreset::NotesOnly, FilterPreset::WithNotes, FilterPreset::Recent,
};

inline constexpr std::array<query::SortField, 4> ALL_SORT_FIELDS = {
    query::SortField::CreatedAt, query::SortField::UpdatedAt,
    query::SortField::StartOffset, query::SortField::Type,
};

struct PanelConstraints {
    int min_width{280};
    int max_width{600};
    int default_width{360};
    int min_height{200};
    int max_height{500};
    int default_height{300};
};

inline constexpr PanelConstraints DEFAULT_PANEL_CONSTRAINTS{};

/**
 * NotesPanelSettings - Persisted view configuration of the notes panel.
 * Passed by value; persistence goes through validate_panel_settings().
 */
struct NotesPanelSettings {
    PanelPosition position{PanelPosition::Right};
    int width{DEFAULT_PANEL_CONSTRAINTS.default_width};
    int height{DEFAULT_PANEL_CONSTRAINTS.default_height};
    FilterPreset filter_preset{FilterPreset::All};
    query::SortField sort_field{query::SortField::CreatedAt};
    query::SortDirection sort_direction{query::SortDirection::Desc};

    bool operator==(const NotesPanelSettings&) const = default;
};

/**
 * Untrusted settings as loaded from storage or supplied by a caller;
 * any field may be missing.
 */
struct PartialPanelSettings {
    std::optional<PanelPosition> position;
    std::optional<int> width;
    std::optional<int> height;
    std::optional<FilterPreset> filter_preset;
    std::optional<query::SortField> sort_field;
    std::optional<query::SortDirection> sort_direction;
};

template<typename T>
[[nodiscard]] constexpr T clamp(T value, T min, T max) {
    return std::min(std::max(value, min), max);
}

[[nodiscard]] constexpr int clamp_width(int width,
                                        const PanelConstraints& c = DEFAULT_PANEL_CONSTRAINTS) {
    return clamp(width, c.min_width, c.max_width);
}

[[nodiscard]] constexpr int clamp_height(int height,
                                         const PanelConstraints& c = DEFAULT_PANEL_CONSTRAINTS) {
    return clamp(height, c.min_height, c.max_height);
}

[[nodiscard]] NotesPanelSettings default_panel_settings();

/**
 * Fill missing fields from defaults and clamp the numeric ones. The single
 * entry point before persisting or applying externally supplied settings.
 */
[[nodiscard]] NotesPanelSettings validate_panel_settings(
    const PartialPanelSettings& partial,
    const PanelConstraints& constraints = DEFAULT_PANEL_CONSTRAINTS
);

[[nodiscard]] PartialPanelSettings to_partial(const NotesPanelSettings& settings);

// ============================================================================
// Tokens
// ============================================================================

[[nodiscard]] constexpr std::string_view position_token(PanelPosition position) {
    return position == PanelPosition::Right ? "right" : "bottom";
}

[[nodiscard]] constexpr std::string_view preset_token(FilterPreset preset) {
    switch (preset) {
        case FilterPreset::All: return "all";
        case FilterPreset::NotesOnly: return "notes-only";
        case FilterPreset::WithNotes: return "with-notes";
        case FilterPreset::Recent: return "recent";
    }
    return "all";
}

[[nodiscard]] Result<PanelPosition> parse_panel_position(std::string_view token);
[[nodiscard]] Result<FilterPreset> parse_filter_preset(std::string_view token);

[[nodiscard]] std::string_view filter_preset_label_key(FilterPreset preset);
[[nodiscard]] std::string_view sort_field_label_key(query::SortField field);

// ============================================================================
// Derived views
// ============================================================================

[[nodiscard]] query::FilterCriteria preset_to_filters(FilterPreset preset);

/**
 * Preset filter plus optional search, ordered by the settings' sort spec.
 */
[[nodiscard]] std::vector<Annotation> filtered_annotations(
    const std::vector<Annotation>& annotations,
    const NotesPanelSettings& settings,
    std::string_view search = {}
);

[[nodiscard]] size_t count_by_preset(const std::vector<Annotation>& annotations, FilterPreset preset);

struct PanelLayout {
    int panel_width{0};
    int panel_height{0};
    int reader_width{0};
    int reader_height{0};

    bool operator==(const PanelLayout&) const = default;
};

[[nodiscard]] PanelLayout calculate_panel_layout(
    PanelPosition position,
    int width,
    int height,
    int container_width,
    int container_height,
    const PanelConstraints& constraints = DEFAULT_PANEL_CONSTRAINTS
);

// ============================================================================
// List item text
// ============================================================================

/**
 * Text shown in the editor: the note, else the highlighted text, else "".
 */
[[nodiscard]] std::string edit_text(const Annotation& a);

/**
 * Quoted context: selected text of highlights and notes that have one.
 */
[[nodiscard]] std::optional<std::string> context_text(const Annotation& a);

[[nodiscard]] std::string list_excerpt(const Annotation& a, size_t max_length = 80);

/**
 * "Today", "Yesterday", "N days ago" within a week, otherwise M/D/YYYY.
 */
[[nodiscard]] std::string format_relative_date(Timestamp ts, Timestamp now);

} // namespace marginalia::panel
