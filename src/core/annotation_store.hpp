#pragma once

#include "core/annotation.hpp"
#include "core/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace marginalia {

/**
 * AnnotationStore - The annotations of one book, keyed by id.
 *
 * Single local mutation model: CRUD events from the reader are applied here,
 * and the query engine and exporters work on snapshot() copies so that a
 * sort or filter never observes a mutation mid-pass. Not thread-safe.
 */
class AnnotationStore {
public:
    explicit AnnotationStore(std::string book_id);

    [[nodiscard]] const std::string& book_id() const noexcept { return book_id_; }
    [[nodiscard]] size_t size() const noexcept { return order_.size(); }
    [[nodiscard]] bool empty() const noexcept { return order_.empty(); }

    /**
     * Insert a validated annotation. Rejects duplicate ids and annotations
     * belonging to another book.
     */
    Result<void> add(Annotation annotation);

    [[nodiscard]] std::optional<Annotation> find(std::string_view id) const;

    Result<Annotation> update_note(std::string_view id, std::optional<std::string> note, Timestamp now);
    Result<Annotation> update_color(std::string_view id, HighlightColor color, Timestamp now);
    Result<Annotation> set_public(std::string_view id, bool is_public, Timestamp now);
    Result<Annotation> toggle_like(std::string_view id);

    /**
     * Remove by id. Returns false when no such annotation exists.
     */
    bool remove(std::string_view id);

    /**
     * Copy of all annotations in insertion order.
     */
    [[nodiscard]] std::vector<Annotation> snapshot() const;

private:
    Result<Annotation> replace(std::string_view id, Result<Annotation> updated);
    [[nodiscard]] Error not_found(std::string_view id) const;

    std::string book_id_;
    std::vector<std::string> order_;
    std::unordered_map<std::string, Annotation> by_id_;
};

} // namespace marginalia
