#include "core/panel_settings.hpp"

#include "core/text.hpp"

#include <algorithm>

namespace marginalia::panel {

NotesPanelSettings default_panel_settings() {
    return NotesPanelSettings{};
}

NotesPanelSettings validate_panel_settings(const PartialPanelSettings& partial,
                                           const PanelConstraints& constraints) {
    NotesPanelSettings out;
    out.position = partial.position.value_or(PanelPosition::Right);
    out.width = clamp_width(partial.width.value_or(constraints.default_width), constraints);
    out.height = clamp_height(partial.height.value_or(constraints.default_height), constraints);
    out.filter_preset = partial.filter_preset.value_or(FilterPreset::All);
    out.sort_field = partial.sort_field.value_or(query::SortField::CreatedAt);
    out.sort_direction = partial.sort_direction.value_or(query::SortDirection::Desc);
    return out;
}

PartialPanelSettings to_partial(const NotesPanelSettings& settings) {
    PartialPanelSettings p;
    p.position = settings.position;
    p.width = settings.width;
    p.height = settings.height;
    p.filter_preset = settings.filter_preset;
    p.sort_field = settings.sort_field;
    p.sort_direction = settings.sort_direction;
    return p;
}

Result<PanelPosition> parse_panel_position(std::string_view token) {
    if (token == "right") return Result<PanelPosition>::ok(PanelPosition::Right);
    if (token == "bottom") return Result<PanelPosition>::ok(PanelPosition::Bottom);
    return Result<PanelPosition>::err(Error::configuration(
        "invalid_position", "Unknown panel position: " + std::string(token)));
}

Result<FilterPreset> parse_filter_preset(std::string_view token) {
    for (const auto preset : ALL_FILTER_PRESETS) {
        if (preset_token(preset) == token) return Result<FilterPreset>::ok(preset);
    }
    return Result<FilterPreset>::err(Error::configuration(
        "invalid_filter_preset", "Unknown filter preset: " + std::string(token)));
}

std::string_view filter_preset_label_key(FilterPreset preset) {
    switch (preset) {
        case FilterPreset::All: return "reader.notes.filters.all";
        case FilterPreset::NotesOnly: return "reader.notes.filters.notesOnly";
        case FilterPreset::WithNotes: return "reader.notes.filters.withNotes";
        case FilterPreset::Recent: return "reader.notes.filters.recent";
    }
    return "reader.notes.filters.all";
}

std::string_view sort_field_label_key(query::SortField field) {
    switch (field) {
        case query::SortField::CreatedAt: return "reader.notes.sort.created";
        case query::SortField::UpdatedAt: return "reader.notes.sort.updated";
        case query::SortField::StartOffset: return "reader.notes.sort.position";
        case query::SortField::Type: return "reader.notes.sort.type";
    }
    return "reader.notes.sort.created";
}

query::FilterCriteria preset_to_filters(FilterPreset preset) {
    query::FilterCriteria criteria;
    switch (preset) {
        case FilterPreset::All:
        case FilterPreset::Recent:
            break;
        case FilterPreset::NotesOnly:
            criteria.type = AnnotationType::Note;
            break;
        case FilterPreset::WithNotes:
            criteria.has_note = true;
            break;
    }
    return criteria;
}

std::vector<Annotation> filtered_annotations(const std::vector<Annotation>& annotations,
                                             const NotesPanelSettings& settings,
                                             std::string_view search) {
    auto criteria = preset_to_filters(settings.filter_preset);
    const auto trimmed = text::trim(search);
    if (!trimmed.empty()) {
        criteria.search = std::string(trimmed);
    }
    return query::sort(query::filter(annotations, criteria),
                       query::SortSpec{settings.sort_field, settings.sort_direction});
}

size_t count_by_preset(const std::vector<Annotation>& annotations, FilterPreset preset) {
    const auto criteria = preset_to_filters(preset);
    return static_cast<size_t>(std::count_if(annotations.begin(), annotations.end(),
        [&criteria](const Annotation& a) { return query::matches(a, criteria); }));
}

PanelLayout calculate_panel_layout(PanelPosition position, int width, int height,
                                   int container_width, int container_height,
                                   const PanelConstraints& constraints) {
    PanelLayout layout;
    if (position == PanelPosition::Right) {
        layout.panel_width = clamp_width(width, constraints);
        layout.panel_height = container_height;
        layout.reader_width = container_width - layout.panel_width;
        layout.reader_height = container_height;
    } else {
        layout.panel_width = container_width;
        layout.panel_height = clamp_height(height, constraints);
        layout.reader_width = container_width;
        layout.reader_height = container_height - layout.panel_height;
    }
    return layout;
}

std::string edit_text(const Annotation& a) {
    if (a.note && !a.note->empty()) return *a.note;
    if (const auto* h = std::get_if<HighlightBody>(&a.body)) return h->selected_text;
    return {};
}

std::optional<std::string> context_text(const Annotation& a) {
    auto selected = selected_text(a);
    if (selected && selected->empty()) return std::nullopt;
    return selected;
}

std::string list_excerpt(const Annotation& a, size_t max_length) {
    return text::excerpt(edit_text(a), max_length);
}

std::string format_relative_date(Timestamp ts, Timestamp now) {
    constexpr int64_t kDayMillis = 86'400'000;
    const int64_t diff = (now - ts).count();
    const int64_t days = diff >= 0 ? diff / kDayMillis : -1;
    if (days == 0) return "Today";
    if (days == 1) return "Yesterday";
    if (days > 1 && days < 7) return std::to_string(days) + " days ago";

    const auto c = ts.to_civil();
    return std::to_string(c.month) + "/" + std::to_string(c.day) + "/" + std::to_string(c.year);
}

} // namespace marginalia::panel
