#include "core/annotation.hpp"

#include "core/text.hpp"

#include <algorithm>
#include <limits>

namespace marginalia {

std::optional<AnnotationType> parse_type(std::string_view token) {
    for (const auto type : ALL_ANNOTATION_TYPES) {
        if (type_token(type) == token) return type;
    }
    return std::nullopt;
}

std::string color_display_name(HighlightColor color) {
    std::string name(color_token(color));
    if (!name.empty()) {
        name[0] = static_cast<char>(name[0] - 'a' + 'A');
    }
    return name;
}

std::optional<HighlightColor> parse_color(std::string_view token) {
    for (const auto color : ALL_HIGHLIGHT_COLORS) {
        if (color_token(color) == token) return color;
    }
    return std::nullopt;
}

std::optional<HighlightColor> hex_to_color(std::string_view hex) {
    const auto lowered = text::to_lower(hex);
    for (const auto color : ALL_HIGHLIGHT_COLORS) {
        if (color_to_hex(color) == lowered) return color;
    }
    return std::nullopt;
}

std::optional<std::string> selected_text(const Annotation& a) {
    return std::visit(Overloaded{
        [](const HighlightBody& h) -> std::optional<std::string> { return h.selected_text; },
        [](const NoteBody& n) -> std::optional<std::string> { return n.selected_text; },
        [](const BookmarkBody&) -> std::optional<std::string> { return std::nullopt; },
    }, a.body);
}

std::optional<HighlightColor> highlight_color(const Annotation& a) {
    if (const auto* h = std::get_if<HighlightBody>(&a.body)) {
        return h->color;
    }
    return std::nullopt;
}

bool has_note(const Annotation& a) {
    return a.note.has_value() && !text::is_blank(*a.note);
}

Result<void> validate(const Annotation& a) {
    if (a.id.empty()) {
        return Result<void>::err(Error::validation("missing_id", "Annotation id is required"));
    }
    if (a.start_offset < 0 || a.end_offset < 0) {
        return Result<void>::err(Error::validation("negative_offset", "Offsets must be non-negative"));
    }
    if (a.end_offset < a.start_offset) {
        return Result<void>::err(Error::validation(
            "inverted_range", "Start offset must be less than or equal to end offset"));
    }
    if (a.like_count < 0) {
        return Result<void>::err(Error::validation("negative_like_count", "Like count must be non-negative"));
    }

    return std::visit(Overloaded{
        [](const HighlightBody& h) -> Result<void> {
            if (h.selected_text.empty()) {
                return Result<void>::err(Error::validation(
                    "empty_selected_text", "Selected text is required for highlights"));
            }
            return Result<void>::ok();
        },
        [&a](const NoteBody&) -> Result<void> {
            if (!has_note(a)) {
                return Result<void>::err(Error::validation("empty_note", "Note content is required"));
            }
            return Result<void>::ok();
        },
        [&a](const BookmarkBody&) -> Result<void> {
            if (a.start_offset != a.end_offset) {
                return Result<void>::err(Error::validation(
                    "bookmark_range", "Bookmark start and end offsets must be equal"));
            }
            return Result<void>::ok();
        },
    }, a.body);
}

Result<Annotation> make_annotation(AnnotationFields fields, AnnotationBody body) {
    Annotation a{std::move(fields), std::move(body)};
    auto checked = validate(a);
    if (checked.is_err()) {
        return Result<Annotation>::err(checked.unwrap_err());
    }
    return Result<Annotation>::ok(std::move(a));
}

Result<Annotation> make_highlight(AnnotationFields fields, std::string text, HighlightColor color) {
    return make_annotation(std::move(fields), HighlightBody{std::move(text), color});
}

Result<Annotation> make_highlight(AnnotationFields fields, std::string text, std::string_view token) {
    const auto color = parse_color(token);
    if (!color) {
        return Result<Annotation>::err(Error::validation(
            "invalid_color", "Unknown highlight color: " + std::string(token)));
    }
    return make_highlight(std::move(fields), std::move(text), *color);
}

Result<Annotation> make_note(AnnotationFields fields, std::optional<std::string> context) {
    return make_annotation(std::move(fields), NoteBody{std::move(context)});
}

Result<Annotation> make_bookmark(AnnotationFields fields) {
    return make_annotation(std::move(fields), BookmarkBody{});
}

Result<Annotation> with_note(Annotation a, std::optional<std::string> note, Timestamp now) {
    a.note = std::move(note);
    a.updated_at = now;
    auto checked = validate(a);
    if (checked.is_err()) {
        return Result<Annotation>::err(checked.unwrap_err());
    }
    return Result<Annotation>::ok(std::move(a));
}

Result<Annotation> with_color(Annotation a, HighlightColor color, Timestamp now) {
    auto* h = std::get_if<HighlightBody>(&a.body);
    if (h == nullptr) {
        return Result<Annotation>::err(Error::validation(
            "not_a_highlight", "Only highlights carry a color"));
    }
    h->color = color;
    a.updated_at = now;
    return Result<Annotation>::ok(std::move(a));
}

Annotation with_visibility(Annotation a, bool is_public, Timestamp now) {
    a.is_public = is_public;
    a.updated_at = now;
    return a;
}

Annotation with_like(Annotation a, bool liked) {
    if (liked == a.is_liked_by_current_user) return a;
    a.is_liked_by_current_user = liked;
    if (liked) {
        if (a.like_count < std::numeric_limits<int>::max()) ++a.like_count;
    } else {
        a.like_count = std::max(0, a.like_count - 1);
    }
    return a;
}

Result<void> validate_selection(const std::optional<TextSelection>& selection) {
    if (!selection) {
        return Result<void>::err(Error::validation("no_selection", "No text selected"));
    }
    if (text::is_blank(selection->text)) {
        return Result<void>::err(Error::validation("empty_selection", "Selection is empty"));
    }
    if (selection->start_offset < 0) {
        return Result<void>::err(Error::validation("negative_offset", "Invalid start offset"));
    }
    if (selection->end_offset <= selection->start_offset) {
        return Result<void>::err(Error::validation("inverted_range", "Invalid selection range"));
    }
    return Result<void>::ok();
}

namespace {

AnnotationFields fresh_fields(std::string id, std::string book_id,
                              int64_t start, int64_t end,
                              std::optional<std::string> note, Timestamp now) {
    AnnotationFields f;
    f.id = std::move(id);
    f.book_id = std::move(book_id);
    f.start_offset = start;
    f.end_offset = end;
    f.note = std::move(note);
    f.created_at = now;
    f.updated_at = now;
    return f;
}

} // namespace

Result<Annotation> create_highlight_from_selection(
    std::string id, std::string book_id, const TextSelection& selection,
    HighlightColor color, std::optional<std::string> note, Timestamp now) {
    return validate_selection(selection).and_then([&]() {
        return make_highlight(
            fresh_fields(std::move(id), std::move(book_id),
                         selection.start_offset, selection.end_offset, std::move(note), now),
            selection.text, color);
    });
}

Result<Annotation> create_note_from_selection(
    std::string id, std::string book_id, const TextSelection& selection,
    std::string note, Timestamp now) {
    return validate_selection(selection).and_then([&]() {
        return make_note(
            fresh_fields(std::move(id), std::move(book_id),
                         selection.start_offset, selection.end_offset, std::move(note), now),
            selection.text);
    });
}

Result<Annotation> create_bookmark_at(
    std::string id, std::string book_id, int64_t offset,
    std::optional<std::string> note, Timestamp now) {
    return make_bookmark(fresh_fields(std::move(id), std::move(book_id), offset, offset,
                                      std::move(note), now));
}

} // namespace marginalia
