#include "core/annotation_store.hpp"

#include <algorithm>

namespace marginalia {

AnnotationStore::AnnotationStore(std::string book_id)
    : book_id_(std::move(book_id)) {}

Result<void> AnnotationStore::add(Annotation annotation) {
    auto checked = validate(annotation);
    if (checked.is_err()) {
        return checked;
    }
    if (annotation.book_id != book_id_) {
        return Result<void>::err(Error::validation(
            "wrong_book", "Annotation " + annotation.id + " belongs to book " + annotation.book_id));
    }
    if (by_id_.count(annotation.id) != 0) {
        return Result<void>::err(Error::validation(
            "duplicate_id", "Duplicate annotation id: " + annotation.id));
    }
    order_.push_back(annotation.id);
    auto id = annotation.id;
    by_id_.emplace(std::move(id), std::move(annotation));
    return Result<void>::ok();
}

std::optional<Annotation> AnnotationStore::find(std::string_view id) const {
    auto it = by_id_.find(std::string(id));
    if (it == by_id_.end()) return std::nullopt;
    return it->second;
}

Result<Annotation> AnnotationStore::update_note(std::string_view id,
                                                std::optional<std::string> note,
                                                Timestamp now) {
    auto current = find(id);
    if (!current) return Result<Annotation>::err(not_found(id));
    return replace(id, with_note(std::move(*current), std::move(note), now));
}

Result<Annotation> AnnotationStore::update_color(std::string_view id, HighlightColor color, Timestamp now) {
    auto current = find(id);
    if (!current) return Result<Annotation>::err(not_found(id));
    return replace(id, with_color(std::move(*current), color, now));
}

Result<Annotation> AnnotationStore::set_public(std::string_view id, bool is_public, Timestamp now) {
    auto current = find(id);
    if (!current) return Result<Annotation>::err(not_found(id));
    return replace(id, Result<Annotation>::ok(with_visibility(std::move(*current), is_public, now)));
}

Result<Annotation> AnnotationStore::toggle_like(std::string_view id) {
    auto current = find(id);
    if (!current) return Result<Annotation>::err(not_found(id));
    const bool liked = !current->is_liked_by_current_user;
    return replace(id, Result<Annotation>::ok(with_like(std::move(*current), liked)));
}

bool AnnotationStore::remove(std::string_view id) {
    auto it = by_id_.find(std::string(id));
    if (it == by_id_.end()) return false;
    by_id_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    return true;
}

std::vector<Annotation> AnnotationStore::snapshot() const {
    std::vector<Annotation> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        out.push_back(by_id_.at(id));
    }
    return out;
}

Result<Annotation> AnnotationStore::replace(std::string_view id, Result<Annotation> updated) {
    if (updated.is_ok()) {
        by_id_.at(std::string(id)) = updated.unwrap();
    }
    return updated;
}

Error AnnotationStore::not_found(std::string_view id) const {
    return Error::validation("not_found", "No annotation with id " + std::string(id) +
                                              " in book " + book_id_);
}

} // namespace marginalia
