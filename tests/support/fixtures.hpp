#pragma once

#include "core/annotation.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace marginalia::testing {

inline constexpr auto BOOK_ID = "book-1";

// UTC instant from calendar fields.
inline Timestamp at(int y, unsigned m, unsigned d, int hour = 0, int minute = 0, int second = 0) {
    using namespace std::chrono;
    const sys_days day{year{y} / month{m} / d};
    return Timestamp(time_point_cast<milliseconds>(
        day + hours{hour} + minutes{minute} + seconds{second}));
}

inline AnnotationFields fields(std::string id, int64_t start, int64_t end,
                               std::optional<std::string> note = std::nullopt,
                               Timestamp created = at(2024, 1, 5, 10)) {
    AnnotationFields f;
    f.id = std::move(id);
    f.book_id = BOOK_ID;
    f.start_offset = start;
    f.end_offset = end;
    f.note = std::move(note);
    f.created_at = created;
    f.updated_at = created;
    return f;
}

inline Annotation highlight(std::string id, int64_t start, int64_t end,
                            HighlightColor color = HighlightColor::Yellow,
                            std::optional<std::string> note = std::nullopt,
                            std::string text = "highlighted text") {
    return make_highlight(fields(std::move(id), start, end, std::move(note)), std::move(text), color).unwrap();
}

inline Annotation note(std::string id, int64_t start, int64_t end, std::string body,
                       std::optional<std::string> context = std::nullopt) {
    return make_note(fields(std::move(id), start, end, std::move(body)), std::move(context)).unwrap();
}

inline Annotation bookmark(std::string id, int64_t offset,
                           std::optional<std::string> note = std::nullopt) {
    return make_bookmark(fields(std::move(id), offset, offset, std::move(note))).unwrap();
}

inline Annotation created(Annotation a, Timestamp when) {
    a.created_at = when;
    a.updated_at = a.created_at;
    return a;
}

} // namespace marginalia::testing
