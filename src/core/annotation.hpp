#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace marginalia {

/**
 * Helper for exhaustive std::visit over the annotation variants.
 * A missing overload is a compile error.
 */
template<class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

enum class AnnotationType {
    Highlight,
    Note,
    Bookmark
};

/**
 * The fixed highlight palette. No other colors exist.
 */
enum class HighlightColor {
    Yellow,
    Green,
    Blue,
    Pink,
    Purple,
    Orange
};

inline constexpr HighlightColor DEFAULT_HIGHLIGHT_COLOR = HighlightColor::Yellow;

inline constexpr std::array<HighlightColor, 6> ALL_HIGHLIGHT_COLORS = {
    HighlightColor::Yellow, HighlightColor::Green, HighlightColor::Blue,
    HighlightColor::Pink, HighlightColor::Purple, HighlightColor::Orange,
};

inline constexpr std::array<AnnotationType, 3> ALL_ANNOTATION_TYPES = {
    AnnotationType::Highlight, AnnotationType::Note, AnnotationType::Bookmark,
};

// ============================================================================
// Variant bodies
// ============================================================================

struct HighlightBody {
    std::string selected_text;
    HighlightColor color{DEFAULT_HIGHLIGHT_COLOR};

    bool operator==(const HighlightBody&) const = default;
};

struct NoteBody {
    std::optional<std::string> selected_text;  // context snippet

    bool operator==(const NoteBody&) const = default;
};

struct BookmarkBody {
    bool operator==(const BookmarkBody&) const = default;
};

using AnnotationBody = std::variant<HighlightBody, NoteBody, BookmarkBody>;

/**
 * Fields shared by every annotation kind.
 *
 * Offsets are canonical linear character offsets into the book's extracted
 * plain text. They are signed so that bad input can be rejected instead of
 * wrapping around.
 */
struct AnnotationFields {
    std::string id;
    std::string book_id;
    int64_t start_offset{0};
    int64_t end_offset{0};
    std::optional<std::string> note;
    bool is_public{false};
    int like_count{0};
    bool is_liked_by_current_user{false};
    Timestamp created_at;
    Timestamp updated_at;

    bool operator==(const AnnotationFields&) const = default;
};

/**
 * Annotation - A validated highlight, note or bookmark.
 *
 * Only the make_* factories and the with_* transformations produce values
 * that are guaranteed to satisfy the range invariants.
 */
struct Annotation : AnnotationFields {
    AnnotationBody body;

    bool operator==(const Annotation&) const = default;
};

// ============================================================================
// Type discrimination
// ============================================================================

[[nodiscard]] constexpr AnnotationType get_type(const AnnotationBody& body) {
    return std::visit(Overloaded{
        [](const HighlightBody&) { return AnnotationType::Highlight; },
        [](const NoteBody&) { return AnnotationType::Note; },
        [](const BookmarkBody&) { return AnnotationType::Bookmark; },
    }, body);
}

[[nodiscard]] inline AnnotationType get_type(const Annotation& a) {
    return get_type(a.body);
}

[[nodiscard]] inline bool is_highlight(const Annotation& a) {
    return std::holds_alternative<HighlightBody>(a.body);
}

[[nodiscard]] inline bool is_note(const Annotation& a) {
    return std::holds_alternative<NoteBody>(a.body);
}

[[nodiscard]] inline bool is_bookmark(const Annotation& a) {
    return std::holds_alternative<BookmarkBody>(a.body);
}

/**
 * Wire token of the type ("HIGHLIGHT", "NOTE", "BOOKMARK").
 */
[[nodiscard]] constexpr std::string_view type_token(AnnotationType type) {
    switch (type) {
        case AnnotationType::Highlight: return "HIGHLIGHT";
        case AnnotationType::Note: return "NOTE";
        case AnnotationType::Bookmark: return "BOOKMARK";
    }
    return "UNKNOWN";
}

[[nodiscard]] std::optional<AnnotationType> parse_type(std::string_view token);

[[nodiscard]] constexpr std::string_view annotation_icon(AnnotationType type) {
    switch (type) {
        case AnnotationType::Highlight: return "highlight";
        case AnnotationType::Note: return "note";
        case AnnotationType::Bookmark: return "bookmark";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view annotation_label(AnnotationType type) {
    switch (type) {
        case AnnotationType::Highlight: return "Highlight";
        case AnnotationType::Note: return "Note";
        case AnnotationType::Bookmark: return "Bookmark";
    }
    return "Unknown";
}

// ============================================================================
// Palette
// ============================================================================

[[nodiscard]] constexpr std::string_view color_token(HighlightColor color) {
    switch (color) {
        case HighlightColor::Yellow: return "yellow";
        case HighlightColor::Green: return "green";
        case HighlightColor::Blue: return "blue";
        case HighlightColor::Pink: return "pink";
        case HighlightColor::Purple: return "purple";
        case HighlightColor::Orange: return "orange";
    }
    return "yellow";
}

[[nodiscard]] constexpr std::string_view color_to_hex(HighlightColor color) {
    switch (color) {
        case HighlightColor::Yellow: return "#fff176";
        case HighlightColor::Green: return "#a5d6a7";
        case HighlightColor::Blue: return "#90caf9";
        case HighlightColor::Pink: return "#f48fb1";
        case HighlightColor::Purple: return "#ce93d8";
        case HighlightColor::Orange: return "#ffcc80";
    }
    return "#fff176";
}

/**
 * "blue" -> "Blue".
 */
[[nodiscard]] std::string color_display_name(HighlightColor color);

/**
 * Token to palette entry. Unknown tokens yield nullopt, never a fallback color.
 */
[[nodiscard]] std::optional<HighlightColor> parse_color(std::string_view token);

/**
 * Reverse hex lookup (case-insensitive).
 */
[[nodiscard]] std::optional<HighlightColor> hex_to_color(std::string_view hex);

// ============================================================================
// Accessors
// ============================================================================

[[nodiscard]] std::optional<std::string> selected_text(const Annotation& a);

[[nodiscard]] std::optional<HighlightColor> highlight_color(const Annotation& a);

/**
 * True when the annotation carries a note that is non-empty after trimming.
 */
[[nodiscard]] bool has_note(const Annotation& a);

// ============================================================================
// Construction (validating)
// ============================================================================

/**
 * Check every invariant of an assembled annotation.
 *
 * Fails with a Validation error for negative or inverted offsets, a bookmark
 * whose offsets differ, an empty note on a Note, an empty highlight text,
 * a negative like count or an empty id.
 */
[[nodiscard]] Result<void> validate(const Annotation& a);

[[nodiscard]] Result<Annotation> make_annotation(AnnotationFields fields, AnnotationBody body);

[[nodiscard]] Result<Annotation> make_highlight(
    AnnotationFields fields,
    std::string selected_text,
    HighlightColor color = DEFAULT_HIGHLIGHT_COLOR
);

/**
 * Highlight from an untrusted color token; unknown colors are rejected.
 */
[[nodiscard]] Result<Annotation> make_highlight(
    AnnotationFields fields,
    std::string selected_text,
    std::string_view color_token
);

/**
 * Note; the note text travels in fields.note and is required.
 */
[[nodiscard]] Result<Annotation> make_note(
    AnnotationFields fields,
    std::optional<std::string> context = std::nullopt
);

[[nodiscard]] Result<Annotation> make_bookmark(AnnotationFields fields);

// ============================================================================
// Pure transformation functions
// ============================================================================

/**
 * Replace the note. Clearing or blanking the note of a Note is rejected.
 */
[[nodiscard]] Result<Annotation> with_note(
    Annotation a,
    std::optional<std::string> note,
    Timestamp now
);

/**
 * Recolor a highlight. Other kinds have no color and are rejected.
 */
[[nodiscard]] Result<Annotation> with_color(Annotation a, HighlightColor color, Timestamp now);

[[nodiscard]] Annotation with_visibility(Annotation a, bool is_public, Timestamp now);

/**
 * Set whether the current user likes the annotation, keeping like_count
 * consistent and never below zero.
 */
[[nodiscard]] Annotation with_like(Annotation a, bool liked);

// ============================================================================
// Selection capture
// ============================================================================

/**
 * TextSelection - A range captured by the reader, already mapped to
 * canonical offsets.
 */
struct TextSelection {
    std::string text;
    int64_t start_offset{0};
    int64_t end_offset{0};
};

[[nodiscard]] Result<void> validate_selection(const std::optional<TextSelection>& selection);

[[nodiscard]] Result<Annotation> create_highlight_from_selection(
    std::string id,
    std::string book_id,
    const TextSelection& selection,
    HighlightColor color,
    std::optional<std::string> note,
    Timestamp now
);

[[nodiscard]] Result<Annotation> create_note_from_selection(
    std::string id,
    std::string book_id,
    const TextSelection& selection,
    std::string note,
    Timestamp now
);

[[nodiscard]] Result<Annotation> create_bookmark_at(
    std::string id,
    std::string book_id,
    int64_t offset,
    std::optional<std::string> note,
    Timestamp now
);

} // namespace marginalia
