#pragma once

#include "core/annotation.hpp"
#include "core/result.hpp"

#include <QByteArray>
#include <QJsonObject>

#include <vector>

namespace marginalia::storage {

/**
 * Decode one annotation object. Every field goes through the validating
 * factories, so an invalid range or unknown color is an error.
 */
[[nodiscard]] Result<Annotation> annotation_from_json(const QJsonObject& obj);

[[nodiscard]] QJsonObject annotation_to_json(const Annotation& a);

/**
 * Decode a document that is either an array of annotations or an object
 * with an "annotations" array. Duplicate ids are rejected.
 */
[[nodiscard]] Result<std::vector<Annotation>> parse_annotations(const QByteArray& json);

[[nodiscard]] QByteArray serialize_annotations(const std::vector<Annotation>& annotations);

} // namespace marginalia::storage
