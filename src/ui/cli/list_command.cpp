#include "ui/cli/list_command.hpp"

#include "core/annotation_query.hpp"
#include "core/text.hpp"
#include "storage/panel_settings_store.hpp"
#include "ui/cli/cli_common.hpp"

namespace marginalia::ui {
namespace {

Result<int64_t> parse_offset(const QString& text) {
    bool ok = false;
    const auto value = text.trimmed().toLongLong(&ok);
    if (!ok || value < 0) {
        return Result<int64_t>::err(Error::configuration("invalid_offset", "Invalid offset: " + text.toStdString()));
    }
    return Result<int64_t>::ok(value);
}

Result<std::vector<Annotation>> narrow_by_position(std::vector<Annotation> annotations,
                                                  const ListCommandOptions& options) {
    using R = Result<std::vector<Annotation>>;

    if (!options.at.isEmpty()) {
        auto offset = parse_offset(options.at);
        if (offset.is_err()) return R::err(offset.unwrap_err());
        auto hit = query::point_lookup(annotations, offset.unwrap());
        if (!hit) return R::ok({});
        return R::ok({*hit});
    }

    if (!options.range.isEmpty()) {
        const auto parts = options.range.split(QLatin1Char(':'));
        if (parts.size() != 2) {
            return R::err(Error::configuration("invalid_range", "Expected start:end, got " + options.range.toStdString()));
        }
        auto start = parse_offset(parts.at(0));
        if (start.is_err()) return R::err(start.unwrap_err());
        auto end = parse_offset(parts.at(1));
        if (end.is_err()) return R::err(end.unwrap_err());
        return R::ok(query::range_overlap(annotations, start.unwrap(), end.unwrap()));
    }

    return R::ok(std::move(annotations));
}

} // namespace

Result<panel::NotesPanelSettings> apply_list_overrides(panel::NotesPanelSettings settings,
                                                       const ListCommandOptions& options) {
    using R = Result<panel::NotesPanelSettings>;

    if (!options.preset.isEmpty()) {
        auto preset = panel::parse_filter_preset(options.preset.toStdString());
        if (preset.is_err()) return R::err(preset.unwrap_err());
        settings.filter_preset = preset.unwrap();
    }
    if (!options.sort_field.isEmpty()) {
        auto field = query::parse_sort_field(options.sort_field.toStdString());
        if (field.is_err()) return R::err(field.unwrap_err());
        settings.sort_field = field.unwrap();
    }
    if (!options.direction.isEmpty()) {
        auto direction = query::parse_sort_direction(options.direction.toStdString());
        if (direction.is_err()) return R::err(direction.unwrap_err());
        settings.sort_direction = direction.unwrap();
    }
    return R::ok(settings);
}

QString format_annotation_list(const std::vector<Annotation>& annotations, Timestamp now) {
    QString out;
    for (const auto& a : annotations) {
        QString line = to_qstring(type_token(get_type(a))).leftJustified(9)
            + QLatin1Char(' ') + QString::fromStdString(a.id)
            + QStringLiteral(" [%1-%2]").arg(a.start_offset).arg(a.end_offset);
        if (const auto color = highlight_color(a)) {
            line += QLatin1Char(' ') + QString::fromStdString(color_display_name(*color));
        }
        line += QStringLiteral(" (") + QString::fromStdString(panel::format_relative_date(a.created_at, now))
            + QStringLiteral(")");

        const auto excerpt = panel::list_excerpt(a);
        if (!excerpt.empty()) {
            line += QStringLiteral(" ") + QString::fromStdString(excerpt);
        }
        if (const auto context = panel::context_text(a); context && is_note(a)) {
            line += QStringLiteral(" > ") + QString::fromStdString(text::excerpt(*context, 40));
        }
        out += line + QLatin1Char('\n');
    }
    return out;
}

QString format_preset_counts(const std::vector<Annotation>& annotations) {
    QStringList parts;
    for (const auto preset : panel::ALL_FILTER_PRESETS) {
        parts.append(to_qstring(panel::preset_token(preset)) + QStringLiteral(": ")
                     + QString::number(panel::count_by_preset(annotations, preset)));
    }
    return parts.join(QStringLiteral(" | "));
}

Result<QString> run_list_command(const ListCommandOptions& options,
                                 const storage::PanelSettingsStore& store,
                                 Timestamp now) {
    using R = Result<QString>;

    auto settings = apply_list_overrides(store.load(), options);
    if (settings.is_err()) return R::err(settings.unwrap_err());

    auto annotations = load_annotation_file(options.input_path);
    if (annotations.is_err()) return R::err(annotations.unwrap_err());

    const auto& view = settings.unwrap();
    auto positioned = narrow_by_position(
        panel::filtered_annotations(annotations.unwrap(), view, options.search.toStdString()), options);
    if (positioned.is_err()) return R::err(positioned.unwrap_err());

    store.save(view);

    qCDebug(marginaliaCliLog) << "list preset=" << to_qstring(panel::preset_token(view.filter_preset))
                              << "sort=" << to_qstring(query::sort_field_token(view.sort_field))
                              << to_qstring(query::sort_direction_token(view.sort_direction));

    QString out = format_preset_counts(annotations.unwrap()) + QLatin1Char('\n');
    out += format_annotation_list(positioned.unwrap(), now);
    return R::ok(out);
}

} // namespace marginalia::ui
