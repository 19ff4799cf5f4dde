#pragma once

#include "core/annotation_query.hpp"
#include "core/result.hpp"

#include <QString>

#include <vector>

namespace marginalia::ui {

// "150-260 h1,h2" per merged paint region.
[[nodiscard]] QString format_merged_ranges(const std::vector<query::MergedRange>& ranges);

[[nodiscard]] Result<QString> run_merge_command(const QString& input_path);

} // namespace marginalia::ui
