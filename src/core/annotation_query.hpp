#pragma once

#include "core/annotation.hpp"
#include "core/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace marginalia::query {

/**
 * FilterCriteria - Structured predicate set. All present fields are ANDed;
 * absent fields impose no constraint.
 */
struct FilterCriteria {
    std::optional<AnnotationType> type;
    std::optional<bool> has_note;
    std::optional<bool> is_public;
    std::optional<std::string> search;  // case-insensitive, note or selected text

    bool operator==(const FilterCriteria&) const = default;
};

enum class SortField {
    CreatedAt,
    UpdatedAt,
    StartOffset,
    Type
};

enum class SortDirection {
    Asc,
    Desc
};

struct SortSpec {
    SortField field{SortField::StartOffset};
    SortDirection direction{SortDirection::Asc};

    bool operator==(const SortSpec&) const = default;
};

[[nodiscard]] constexpr std::string_view sort_field_token(SortField field) {
    switch (field) {
        case SortField::CreatedAt: return "createdAt";
        case SortField::UpdatedAt: return "updatedAt";
        case SortField::StartOffset: return "startOffset";
        case SortField::Type: return "type";
    }
    return "startOffset";
}

[[nodiscard]] constexpr std::string_view sort_direction_token(SortDirection direction) {
    return direction == SortDirection::Asc ? "asc" : "desc";
}

/**
 * Parse sort configuration. Unknown values are a Configuration error.
 */
[[nodiscard]] Result<SortField> parse_sort_field(std::string_view token);
[[nodiscard]] Result<SortDirection> parse_sort_direction(std::string_view token);
[[nodiscard]] Result<SortSpec> parse_sort_spec(std::string_view field, std::string_view direction);

[[nodiscard]] bool matches(const Annotation& a, const FilterCriteria& criteria);

/**
 * Returns a new sequence of the annotations satisfying `criteria`, in input order.
 */
[[nodiscard]] std::vector<Annotation> filter(
    const std::vector<Annotation>& annotations,
    const FilterCriteria& criteria
);

/**
 * Stable sort: elements with equal keys keep their relative input order.
 */
[[nodiscard]] std::vector<Annotation> sort(
    std::vector<Annotation> annotations,
    const SortSpec& spec
);

/**
 * Annotations whose [start, end) intersects [start_offset, end_offset).
 *
 * Zero-width annotations (bookmarks) only match a zero-width query at the
 * same offset; use point_lookup for point hits.
 */
[[nodiscard]] std::vector<Annotation> range_overlap(
    const std::vector<Annotation>& annotations,
    int64_t start_offset,
    int64_t end_offset
);

/**
 * First annotation, in input order, with start <= offset <= end.
 */
[[nodiscard]] std::optional<Annotation> point_lookup(
    const std::vector<Annotation>& annotations,
    int64_t offset
);

/**
 * MergedRange - Union of touching or overlapping highlight ranges and the
 * ids of every highlight that contributed, in merge-scan order.
 */
struct MergedRange {
    int64_t start_offset{0};
    int64_t end_offset{0};
    std::vector<std::string> annotation_ids;

    bool operator==(const MergedRange&) const = default;
};

/**
 * Interval merge over highlight ranges only; other kinds are ignored.
 * Output is ordered by start offset.
 */
[[nodiscard]] std::vector<MergedRange> merge_overlapping_ranges(
    const std::vector<Annotation>& annotations
);

/**
 * AnnotationGroups - Annotations split by kind, each bucket in input order.
 */
struct AnnotationGroups {
    std::vector<Annotation> highlights;
    std::vector<Annotation> notes;
    std::vector<Annotation> bookmarks;
};

[[nodiscard]] AnnotationGroups group_by_type(const std::vector<Annotation>& annotations);

struct TypeCounts {
    size_t highlights{0};
    size_t notes{0};
    size_t bookmarks{0};

    bool operator==(const TypeCounts&) const = default;
};

[[nodiscard]] TypeCounts count_by_type(const std::vector<Annotation>& annotations);

} // namespace marginalia::query
