#include <QCommandLineParser>
#include <QGuiApplication>
#include <QLoggingCategory>
#include <QTextStream>

#include "core/types.hpp"
#include "storage/panel_settings_store.hpp"
#include "ui/cli/cli_common.hpp"
#include "ui/cli/export_command.hpp"
#include "ui/cli/list_command.hpp"
#include "ui/cli/merge_command.hpp"
#include "ui/logging.hpp"

namespace {

int print_result(const marginalia::Result<QString>& result) {
    if (result.is_err()) {
        QTextStream(stderr) << QString::fromStdString(result.unwrap_err().describe()) << QLatin1Char('\n');
        return 1;
    }
    QTextStream(stdout) << result.unwrap();
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    // QPdfWriter needs a GUI application for fonts; no window is ever shown.
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QGuiApplication app(argc, argv);

    app.setApplicationName("Marginalia");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Marginalia");
    app.setOrganizationDomain("marginalia.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Marginalia annotation tools"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption verboseOption(
        QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
        QStringLiteral("Enable debug logging for all marginalia categories."));
    parser.addOption(verboseOption);

    const QCommandLineOption settingsOption(
        QStringList{QStringLiteral("settings")},
        QStringLiteral("Read and write panel settings in this INI file."),
        QStringLiteral("path"));
    parser.addOption(settingsOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Write the log to this file instead of the app data directory."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    // export
    const QCommandLineOption formatOption(
        QStringList{QStringLiteral("format")},
        QStringLiteral("Export format: markdown or pdf."),
        QStringLiteral("format"), QStringLiteral("markdown"));
    parser.addOption(formatOption);

    const QCommandLineOption titleOption(
        QStringList{QStringLiteral("title")},
        QStringLiteral("Book title (required for 'export')."),
        QStringLiteral("title"));
    parser.addOption(titleOption);

    const QCommandLineOption authorOption(
        QStringList{QStringLiteral("author")},
        QStringLiteral("Book author."),
        QStringLiteral("author"));
    parser.addOption(authorOption);

    const QCommandLineOption typesOption(
        QStringList{QStringLiteral("types")},
        QStringLiteral("Only export these types (HIGHLIGHT,NOTE,BOOKMARK)."),
        QStringLiteral("list"));
    parser.addOption(typesOption);

    const QCommandLineOption colorsOption(
        QStringList{QStringLiteral("colors")},
        QStringLiteral("Only export highlights of these colors."),
        QStringLiteral("list"));
    parser.addOption(colorsOption);

    const QCommandLineOption publicOnlyOption(
        QStringList{QStringLiteral("public-only")},
        QStringLiteral("Only export public annotations."));
    parser.addOption(publicOnlyOption);

    const QCommandLineOption noTocOption(
        QStringList{QStringLiteral("no-toc")},
        QStringLiteral("Omit the table of contents."));
    parser.addOption(noTocOption);

    const QCommandLineOption noStatsOption(
        QStringList{QStringLiteral("no-stats")},
        QStringLiteral("Omit the summary block."));
    parser.addOption(noStatsOption);

    const QCommandLineOption dateFormatOption(
        QStringList{QStringLiteral("date-format")},
        QStringLiteral("Date style: short, long or iso."),
        QStringLiteral("style"), QStringLiteral("long"));
    parser.addOption(dateFormatOption);

    const QCommandLineOption outOption(
        QStringList{QStringLiteral("out")},
        QStringLiteral("Directory to write the export into."),
        QStringLiteral("dir"), QStringLiteral("."));
    parser.addOption(outOption);

    const QCommandLineOption htmlOption(
        QStringList{QStringLiteral("html")},
        QStringLiteral("Also write an HTML preview of a markdown export."));
    parser.addOption(htmlOption);

    // list
    const QCommandLineOption presetOption(
        QStringList{QStringLiteral("preset")},
        QStringLiteral("Filter preset: all, notes-only, with-notes, recent."),
        QStringLiteral("preset"));
    parser.addOption(presetOption);

    const QCommandLineOption searchOption(
        QStringList{QStringLiteral("search")},
        QStringLiteral("Case-insensitive search in notes and highlighted text."),
        QStringLiteral("text"));
    parser.addOption(searchOption);

    const QCommandLineOption sortOption(
        QStringList{QStringLiteral("sort")},
        QStringLiteral("Sort field: createdAt, updatedAt, startOffset, type."),
        QStringLiteral("field"));
    parser.addOption(sortOption);

    const QCommandLineOption directionOption(
        QStringList{QStringLiteral("direction")},
        QStringLiteral("Sort direction: asc or desc."),
        QStringLiteral("direction"));
    parser.addOption(directionOption);

    const QCommandLineOption atOption(
        QStringList{QStringLiteral("at")},
        QStringLiteral("Show the annotation at this offset."),
        QStringLiteral("offset"));
    parser.addOption(atOption);

    const QCommandLineOption rangeOption(
        QStringList{QStringLiteral("range")},
        QStringLiteral("Show annotations overlapping start:end."),
        QStringLiteral("range"));
    parser.addOption(rangeOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("Command to run: export, list or merge."));
    parser.addPositionalArgument(QStringLiteral("file"),
                                 QStringLiteral("JSON file with the book's annotations."));
    parser.process(app);

    marginalia::ui::LogOptions logOptions;
    logOptions.file_path = parser.value(logFileOption);
    logOptions.verbose = parser.isSet(verboseOption);
    const auto logging = marginalia::ui::install_logging(logOptions);
    if (logging.is_err()) {
        qCWarning(marginaliaCliLog) << "file logging disabled:"
                                    << QString::fromStdString(logging.unwrap_err().describe());
    }

    const auto positional = parser.positionalArguments();
    if (positional.size() != 2) {
        QTextStream(stderr) << "usage: marginalia <export|list|merge> <file.json> [options]\n";
        return 2;
    }

    const auto& command = positional.at(0);
    const auto& input = positional.at(1);
    const auto now = marginalia::Timestamp::now();

    if (command == QStringLiteral("export")) {
        marginalia::ui::ExportCommandOptions options;
        options.input_path = input;
        options.format = parser.value(formatOption);
        options.title = parser.value(titleOption);
        options.author = parser.value(authorOption);
        options.types = parser.value(typesOption);
        options.colors = parser.value(colorsOption);
        options.public_only = parser.isSet(publicOnlyOption);
        options.no_toc = parser.isSet(noTocOption);
        options.no_stats = parser.isSet(noStatsOption);
        options.date_format = parser.value(dateFormatOption);
        options.out_dir = parser.value(outOption);
        options.html = parser.isSet(htmlOption);
        return print_result(marginalia::ui::run_export_command(options, now));
    }

    if (command == QStringLiteral("list")) {
        marginalia::ui::ListCommandOptions options;
        options.input_path = input;
        options.preset = parser.value(presetOption);
        options.search = parser.value(searchOption);
        options.sort_field = parser.value(sortOption);
        options.direction = parser.value(directionOption);
        options.at = parser.value(atOption);
        options.range = parser.value(rangeOption);

        const auto store = parser.isSet(settingsOption)
            ? marginalia::storage::PanelSettingsStore(parser.value(settingsOption))
            : marginalia::storage::PanelSettingsStore();
        return print_result(marginalia::ui::run_list_command(options, store, now));
    }

    if (command == QStringLiteral("merge")) {
        return print_result(marginalia::ui::run_merge_command(input));
    }

    QTextStream(stderr) << "Unknown command: " << command << '\n';
    return 2;
}
