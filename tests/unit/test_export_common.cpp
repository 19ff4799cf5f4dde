#include <catch2/catch_test_macros.hpp>
#include "export/export_common.hpp"
#include "support/fixtures.hpp"

using namespace marginalia;
using namespace marginalia::exporting;
using namespace marginalia::testing;

namespace {

const Timestamp kNow = at(2024, 1, 5, 10);

ExportOptions options_for(std::string title = "Moby Dick") {
    ExportOptions options;
    options.book_title = std::move(title);
    return options;
}

} // namespace

TEST_CASE("Export: filtering by type keeps only that type", "[export][filter]") {
    const std::vector<Annotation> list = {
        note("n1", 0, 0, "First"),
        highlight("h1", 150, 200, HighlightColor::Blue, "Important"),
    };
    ExportFilters filters;
    filters.types = {AnnotationType::Highlight};

    const auto out = filter_for_export(list, filters);
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].id == "h1");
    REQUIRE(highlight_color(out[0]) == HighlightColor::Blue);
}

TEST_CASE("Export: color filter implies highlights only", "[export][filter]") {
    const std::vector<Annotation> list = {
        highlight("blue", 0, 5, HighlightColor::Blue),
        highlight("green", 5, 9, HighlightColor::Green),
        note("n", 0, 0, "a note"),
        bookmark("b", 3),
    };
    ExportFilters filters;
    filters.colors = {HighlightColor::Blue, HighlightColor::Pink};

    const auto out = filter_for_export(list, filters);
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].id == "blue");
}

TEST_CASE("Export: public-only filter", "[export][filter]") {
    auto shared = bookmark("shared", 1);
    shared.is_public = true;
    const std::vector<Annotation> list = {bookmark("private", 0), shared};

    ExportFilters filters;
    filters.public_only = true;
    const auto out = filter_for_export(list, filters);
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].id == "shared");

    REQUIRE(filter_for_export(list, std::nullopt).size() == 2);
}

TEST_CASE("Export: annotations are put in document order", "[export]") {
    const std::vector<Annotation> list = {
        bookmark("late", 900),
        highlight("first", 10, 20),
        note("tie-a", 300, 310, "a"),
        highlight("tie-b", 300, 305),
    };
    const auto sorted = sort_for_export(list);
    REQUIRE(sorted[0].id == "first");
    REQUIRE(sorted[1].id == "tie-a");
    REQUIRE(sorted[2].id == "tie-b");
    REQUIRE(sorted[3].id == "late");
}

TEST_CASE("Export: statistics over the export set", "[export][stats]") {
    auto shared = note("n2", 30, 40, "second note");
    shared.is_public = true;
    const std::vector<Annotation> list = {
        highlight("h1", 0, 10),
        highlight("h2", 10, 20, HighlightColor::Green, "with a note"),
        note("n1", 20, 30, "first note"),
        shared,
        bookmark("b1", 50, "remember"),
    };

    const auto stats = calculate_export_stats(list, kNow);
    REQUIRE(stats.total_annotations == 5);
    REQUIRE(stats.highlights == 2);
    REQUIRE(stats.notes == 2);
    REQUIRE(stats.bookmarks == 1);
    REQUIRE(stats.with_notes == 4);
    REQUIRE(stats.public_annotations == 1);
    REQUIRE(stats.export_date == kNow);
}

TEST_CASE("Export: filenames are slugged and dated", "[export][filename]") {
    const auto name = generate_export_filename("Book: A Story!", ExportFormat::Markdown, kNow);
    REQUIRE(name.find(':') == std::string::npos);
    REQUIRE(name.find('!') == std::string::npos);
    REQUIRE(name == "book-a-story-annotations-2024-01-05.md");

    REQUIRE(generate_export_filename("Dune", ExportFormat::Pdf, kNow) == "dune-annotations-2024-01-05.pdf");
}

TEST_CASE("Export: slug rules", "[export][filename]") {
    REQUIRE(slugify("  --Hello,   World--  ") == "hello-world");
    REQUIRE(slugify("Ärger über Öl") == "rger-ber-l");
    REQUIRE(slugify("!!!").empty());
    REQUIRE(slugify(std::string(80, 'a')).size() == 50);

    REQUIRE(generate_export_filename("???", ExportFormat::Markdown, kNow) ==
            "untitled-annotations-2024-01-05.md");
}

TEST_CASE("Export: date formats", "[export][date]") {
    REQUIRE(format_export_date(kNow, DateFormat::Short) == "01/05/2024");
    REQUIRE(format_export_date(kNow, DateFormat::Long) == "January 5, 2024");
    REQUIRE(format_export_date(kNow, DateFormat::Iso) == "2024-01-05");

    const auto december = at(2023, 12, 31, 23, 59, 59);
    REQUIRE(format_export_date(december, DateFormat::Long) == "December 31, 2023");
}

TEST_CASE("Export: truncate_text", "[export]") {
    REQUIRE(truncate_text("short", 10) == "short");
    REQUIRE(truncate_text("a longer sentence", 10) == "a longe...");
    REQUIRE(truncate_text("a longer sentence", 10).size() == 10);
}

TEST_CASE("Export: grouping assigns 1-based indices per bucket", "[export][group]") {
    const std::vector<Annotation> list = {
        highlight("h1", 0, 5),
        note("n1", 6, 9, "n"),
        highlight("h2", 10, 15),
        bookmark("b1", 20),
    };

    const auto groups = group_for_export(list);
    REQUIRE(groups.highlights.size() == 2);
    REQUIRE(groups.highlights[0].index == 1);
    REQUIRE(groups.highlights[1].index == 2);
    REQUIRE(groups.highlights[1].annotation.id == "h2");
    REQUIRE(groups.notes.size() == 1);
    REQUIRE(groups.notes[0].index == 1);
    REQUIRE(groups.bookmarks[0].index == 1);
}

TEST_CASE("Export: prepare validates options first", "[export][options]") {
    const std::vector<Annotation> list = {bookmark("b", 1)};

    auto blank = prepare_export(list, options_for("   "), kNow);
    REQUIRE(blank.is_err());
    REQUIRE(blank.unwrap_err().kind == ErrorKind::ExportOptions);
    REQUIRE(blank.unwrap_err().code == "invalid_title");

    auto ready = prepare_export(list, options_for(), kNow);
    REQUIRE(ready.is_ok());
    REQUIRE(ready.unwrap().stats.total_annotations == 1);
    REQUIRE(ready.unwrap().groups.bookmarks.size() == 1);
}

TEST_CASE("Export: option parsing", "[export][options]") {
    REQUIRE(parse_export_format("pdf").unwrap() == ExportFormat::Pdf);
    REQUIRE(parse_export_format("epub").unwrap_err().code == "invalid_format");
    REQUIRE(parse_date_format("iso").unwrap() == DateFormat::Iso);
    REQUIRE(parse_date_format("medium").unwrap_err().kind == ErrorKind::Configuration);

    const ExportOptions defaults;
    REQUIRE(defaults.include_toc);
    REQUIRE(defaults.include_stats);
    REQUIRE(defaults.date_format == DateFormat::Long);
    REQUIRE(file_extension(ExportFormat::Markdown) == "md");
}
