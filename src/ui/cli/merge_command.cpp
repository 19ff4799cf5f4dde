#include "ui/cli/merge_command.hpp"

#include "ui/cli/cli_common.hpp"

#include <QStringList>

namespace marginalia::ui {

QString format_merged_ranges(const std::vector<query::MergedRange>& ranges) {
    QString out;
    for (const auto& range : ranges) {
        QStringList ids;
        for (const auto& id : range.annotation_ids) {
            ids.append(QString::fromStdString(id));
        }
        out += QStringLiteral("%1-%2 %3\n").arg(range.start_offset).arg(range.end_offset).arg(ids.join(QLatin1Char(',')));
    }
    return out;
}

Result<QString> run_merge_command(const QString& input_path) {
    return load_annotation_file(input_path).map([](const std::vector<Annotation>& annotations) {
        const auto merged = query::merge_overlapping_ranges(annotations);
        qCDebug(marginaliaCliLog) << "merged" << annotations.size() << "annotations into" << merged.size() << "ranges";
        return format_merged_ranges(merged);
    });
}

} // namespace marginalia::ui
