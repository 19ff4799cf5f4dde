#include "export/export_common.hpp"

#include "core/annotation_query.hpp"
#include "core/text.hpp"

#include <algorithm>
#include <array>
#include <cstdio>

namespace marginalia::exporting {
namespace {

constexpr size_t kMaxSlugLength = 50;

constexpr std::array<std::string_view, 12> kMonthNames = {
    "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December",
};

bool is_slug_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

template<typename T>
bool contains(const std::vector<T>& values, T value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

std::string format_export_date(Timestamp ts, DateFormat format) {
    const auto c = ts.to_civil();
    switch (format) {
        case DateFormat::Iso:
            return ts.to_iso_date();
        case DateFormat::Short: {
            char buf[16];
            std::snprintf(buf, sizeof(buf), "%02d/%02d/%04d", c.month, c.day, c.year);
            return buf;
        }
        case DateFormat::Long:
            break;
    }
    return std::string(kMonthNames[static_cast<size_t>(c.month - 1)]) + " " +
           std::to_string(c.day) + ", " + std::to_string(c.year);
}

std::string slugify(std::string_view title) {
    std::string slug;
    slug.reserve(title.size());
    bool in_separator_run = false;
    for (const char raw : title) {
        char c = raw;
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        if (is_slug_char(c)) {
            slug.push_back(c);
            in_separator_run = false;
        } else if (!in_separator_run) {
            slug.push_back('-');
            in_separator_run = true;
        }
    }

    const auto first = slug.find_first_not_of('-');
    if (first == std::string::npos) return {};
    const auto last = slug.find_last_not_of('-');
    slug = slug.substr(first, last - first + 1);

    if (slug.size() > kMaxSlugLength) {
        slug.resize(kMaxSlugLength);
    }
    return slug;
}

std::string generate_export_filename(std::string_view book_title, ExportFormat format, Timestamp now) {
    auto slug = slugify(book_title);
    if (slug.empty()) {
        slug = "untitled";
    }
    return slug + "-annotations-" + now.to_iso_date() + "." + std::string(file_extension(format));
}

std::string truncate_text(std::string_view text, size_t max_length) {
    return text::excerpt(text, max_length);
}

std::vector<Annotation> filter_for_export(const std::vector<Annotation>& annotations,
                                          const std::optional<ExportFilters>& filters) {
    if (!filters) return annotations;

    std::vector<Annotation> out;
    for (const auto& a : annotations) {
        if (!filters->types.empty() && !contains(filters->types, get_type(a))) {
            continue;
        }
        if (filters->public_only && !a.is_public) {
            continue;
        }
        if (!filters->colors.empty()) {
            const auto color = highlight_color(a);
            if (!color || !contains(filters->colors, *color)) {
                continue;
            }
        }
        out.push_back(a);
    }
    return out;
}

std::vector<Annotation> sort_for_export(std::vector<Annotation> annotations) {
    return query::sort(std::move(annotations),
                       query::SortSpec{query::SortField::StartOffset, query::SortDirection::Asc});
}

ExportStats calculate_export_stats(const std::vector<Annotation>& annotations, Timestamp now) {
    ExportStats stats;
    stats.total_annotations = annotations.size();
    stats.export_date = now;

    const auto counts = query::count_by_type(annotations);
    stats.highlights = counts.highlights;
    stats.notes = counts.notes;
    stats.bookmarks = counts.bookmarks;

    for (const auto& a : annotations) {
        if (has_note(a)) ++stats.with_notes;
        if (a.is_public) ++stats.public_annotations;
    }
    return stats;
}

ExportGroups group_for_export(const std::vector<Annotation>& annotations) {
    ExportGroups groups;
    for (const auto& a : annotations) {
        auto& bucket = [&]() -> std::vector<ExportItem>& {
            switch (get_type(a)) {
                case AnnotationType::Highlight: return groups.highlights;
                case AnnotationType::Note: return groups.notes;
                case AnnotationType::Bookmark: break;
            }
            return groups.bookmarks;
        }();
        bucket.push_back(ExportItem{bucket.size() + 1, a});
    }
    return groups;
}

Result<PreparedExport> prepare_export(const std::vector<Annotation>& annotations,
                                      const ExportOptions& options,
                                      Timestamp now) {
    auto valid = validate_export_options(options);
    if (valid.is_err()) {
        return Result<PreparedExport>::err(valid.unwrap_err());
    }

    PreparedExport prepared;
    prepared.annotations = sort_for_export(filter_for_export(annotations, options.filters));
    prepared.stats = calculate_export_stats(prepared.annotations, now);
    prepared.groups = group_for_export(prepared.annotations);
    return Result<PreparedExport>::ok(std::move(prepared));
}

} // namespace marginalia::exporting
