#include "core/annotation_query.hpp"

#include "core/text.hpp"

#include <algorithm>
#include <iterator>

namespace marginalia::query {

Result<SortField> parse_sort_field(std::string_view token) {
    for (const auto field : {SortField::CreatedAt, SortField::UpdatedAt,
                             SortField::StartOffset, SortField::Type}) {
        if (sort_field_token(field) == token) {
            return Result<SortField>::ok(field);
        }
    }
    return Result<SortField>::err(Error::configuration(
        "invalid_sort_field", "Unknown sort field: " + std::string(token)));
}

Result<SortDirection> parse_sort_direction(std::string_view token) {
    if (token == "asc") return Result<SortDirection>::ok(SortDirection::Asc);
    if (token == "desc") return Result<SortDirection>::ok(SortDirection::Desc);
    return Result<SortDirection>::err(Error::configuration(
        "invalid_sort_direction", "Unknown sort direction: " + std::string(token)));
}

Result<SortSpec> parse_sort_spec(std::string_view field, std::string_view direction) {
    return parse_sort_field(field).and_then([direction](SortField f) {
        return parse_sort_direction(direction).map([f](SortDirection d) {
            return SortSpec{f, d};
        });
    });
}

bool matches(const Annotation& a, const FilterCriteria& criteria) {
    if (criteria.type && get_type(a) != *criteria.type) {
        return false;
    }
    if (criteria.has_note && has_note(a) != *criteria.has_note) {
        return false;
    }
    if (criteria.is_public && a.is_public != *criteria.is_public) {
        return false;
    }
    if (criteria.search && !criteria.search->empty()) {
        const auto& needle = *criteria.search;
        const bool in_note = a.note && text::contains_ignore_case(*a.note, needle);
        bool in_text = false;
        if (const auto* h = std::get_if<HighlightBody>(&a.body)) {
            in_text = text::contains_ignore_case(h->selected_text, needle);
        }
        if (!in_note && !in_text) {
            return false;
        }
    }
    return true;
}

std::vector<Annotation> filter(const std::vector<Annotation>& annotations,
                               const FilterCriteria& criteria) {
    std::vector<Annotation> out;
    out.reserve(annotations.size());
    std::copy_if(annotations.begin(), annotations.end(), std::back_inserter(out),
                 [&criteria](const Annotation& a) { return matches(a, criteria); });
    return out;
}

namespace {

// Three-way key comparison for one field; direction is applied by the caller.
int compare_by(const Annotation& a, const Annotation& b, SortField field) {
    const auto cmp = [](auto x, auto y) { return x < y ? -1 : (y < x ? 1 : 0); };
    switch (field) {
        case SortField::CreatedAt: return cmp(a.created_at, b.created_at);
        case SortField::UpdatedAt: return cmp(a.updated_at, b.updated_at);
        case SortField::StartOffset: return cmp(a.start_offset, b.start_offset);
        case SortField::Type: return type_token(get_type(a)).compare(type_token(get_type(b)));
    }
    return 0;
}

} // namespace

std::vector<Annotation> sort(std::vector<Annotation> annotations, const SortSpec& spec) {
    const bool descending = spec.direction == SortDirection::Desc;
    std::stable_sort(annotations.begin(), annotations.end(),
        [&spec, descending](const Annotation& a, const Annotation& b) {
            const int c = compare_by(a, b, spec.field);
            return descending ? c > 0 : c < 0;
        });
    return annotations;
}

std::vector<Annotation> range_overlap(const std::vector<Annotation>& annotations,
                                      int64_t start_offset,
                                      int64_t end_offset) {
    const bool point_query = start_offset == end_offset;
    std::vector<Annotation> out;
    for (const auto& a : annotations) {
        const bool point_annotation = a.start_offset == a.end_offset;
        bool hit = false;
        if (point_annotation) {
            hit = point_query && a.start_offset == start_offset;
        } else {
            hit = a.start_offset < end_offset && a.end_offset > start_offset;
        }
        if (hit) {
            out.push_back(a);
        }
    }
    return out;
}

std::optional<Annotation> point_lookup(const std::vector<Annotation>& annotations,
                                       int64_t offset) {
    auto it = std::find_if(annotations.begin(), annotations.end(),
        [offset](const Annotation& a) {
            return offset >= a.start_offset && offset <= a.end_offset;
        });
    if (it == annotations.end()) return std::nullopt;
    return *it;
}

std::vector<MergedRange> merge_overlapping_ranges(const std::vector<Annotation>& annotations) {
    std::vector<const Annotation*> highlights;
    for (const auto& a : annotations) {
        if (is_highlight(a)) highlights.push_back(&a);
    }
    std::stable_sort(highlights.begin(), highlights.end(),
        [](const Annotation* a, const Annotation* b) {
            if (a->start_offset != b->start_offset) return a->start_offset < b->start_offset;
            return a->end_offset < b->end_offset;
        });

    std::vector<MergedRange> merged;
    for (const auto* h : highlights) {
        if (!merged.empty() && h->start_offset <= merged.back().end_offset) {
            auto& current = merged.back();
            current.end_offset = std::max(current.end_offset, h->end_offset);
            current.annotation_ids.push_back(h->id);
            continue;
        }
        merged.push_back(MergedRange{h->start_offset, h->end_offset, {h->id}});
    }
    return merged;
}

AnnotationGroups group_by_type(const std::vector<Annotation>& annotations) {
    AnnotationGroups groups;
    for (const auto& a : annotations) {
        std::visit(Overloaded{
            [&](const HighlightBody&) { groups.highlights.push_back(a); },
            [&](const NoteBody&) { groups.notes.push_back(a); },
            [&](const BookmarkBody&) { groups.bookmarks.push_back(a); },
        }, a.body);
    }
    return groups;
}

TypeCounts count_by_type(const std::vector<Annotation>& annotations) {
    TypeCounts counts;
    for (const auto& a : annotations) {
        switch (get_type(a)) {
            case AnnotationType::Highlight: ++counts.highlights; break;
            case AnnotationType::Note: ++counts.notes; break;
            case AnnotationType::Bookmark: ++counts.bookmarks; break;
        }
    }
    return counts;
}

} // namespace marginalia::query
