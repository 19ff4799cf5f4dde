#include <catch2/catch_test_macros.hpp>
#include "export/markdown_export.hpp"
#include "support/fixtures.hpp"

using namespace marginalia;
using namespace marginalia::exporting;
using namespace marginalia::testing;

namespace {

const Timestamp kNow = at(2024, 1, 5, 10);

ExportOptions moby_dick() {
    ExportOptions options;
    options.book_title = "Moby Dick";
    options.book_author = "Herman Melville";
    return options;
}

std::vector<Annotation> mixed() {
    return {
        note("n1", 0, 0, "First"),
        highlight("h1", 150, 200, HighlightColor::Blue, "Important", "Call me Ishmael."),
        bookmark("b1", 400),
    };
}

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("Markdown: type filter drops empty sections", "[markdown]") {
    auto options = moby_dick();
    options.filters = ExportFilters{{AnnotationType::Highlight}, false, {}};

    auto result = generate_markdown_export(mixed(), options, kNow);
    REQUIRE(result.is_ok());
    const auto& md = result.unwrap();

    REQUIRE(contains(md, "## Highlights"));
    REQUIRE_FALSE(contains(md, "## Notes"));
    REQUIRE_FALSE(contains(md, "## Bookmarks"));
    REQUIRE_FALSE(contains(md, "[Notes](#notes)"));
}

TEST_CASE("Markdown: blank title is rejected", "[markdown]") {
    auto options = moby_dick();
    options.book_title = "";
    auto result = generate_markdown_export(mixed(), options, kNow);
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().code == "invalid_title");
}

TEST_CASE("Markdown: escaping", "[markdown]") {
    REQUIRE(escape_markdown("plain words") == "plain words");
    REQUIRE(escape_markdown("*bold* _it_") == "\\*bold\\* \\_it\\_");
    REQUIRE(escape_markdown("a.b!c#d") == "a\\.b\\!c\\#d");
    REQUIRE(escape_markdown("[x](y)") == "\\[x\\]\\(y\\)");
    REQUIRE(escape_markdown("\\") == "\\\\");
    REQUIRE(escape_markdown("`{+-}`") == "\\`\\{\\+\\-\\}\\`");
}

TEST_CASE("Markdown: header with and without author", "[markdown]") {
    auto options = moby_dick();
    REQUIRE(markdown_header(options) == "# Moby Dick\n**Author:** Herman Melville\n\n---\n\n");

    options.book_author.reset();
    REQUIRE(markdown_header(options) == "# Moby Dick\n\n---\n\n");
}

TEST_CASE("Markdown: highlight item", "[markdown]") {
    const ExportItem item{1, highlight("h1", 150, 200, HighlightColor::Blue, "Important", "Call me Ishmael.")};
    REQUIRE(markdown_item(item, DateFormat::Long) ==
            "### 1. Highlight\n"
            "\n"
            "> Call me Ishmael\\.\n"
            "\n"
            "**Color:** Blue | **Date:** January 5, 2024\n"
            "\n"
            "**Note:** Important\n"
            "\n");
}

TEST_CASE("Markdown: note item carries its context", "[markdown]") {
    const ExportItem item{2, note("n1", 10, 20, "Think about this", "the whale")};
    REQUIRE(markdown_item(item, DateFormat::Iso) ==
            "### 2. Note\n"
            "\n"
            "Think about this\n"
            "\n"
            "> *the whale*\n"
            "\n"
            "**Date:** 2024-01-05\n"
            "\n");
}

TEST_CASE("Markdown: bookmark item", "[markdown]") {
    const ExportItem plain{1, bookmark("b1", 400)};
    REQUIRE(markdown_item(plain, DateFormat::Short) ==
            "### 1. Bookmark\n"
            "\n"
            "**Position:** 400 | **Date:** 01/05/2024\n"
            "\n");

    const ExportItem noted{3, bookmark("b2", 12, "Chapter 2")};
    REQUIRE(contains(markdown_item(noted, DateFormat::Short), "**Note:** Chapter 2\n"));
}

TEST_CASE("Markdown: summary and table of contents", "[markdown]") {
    auto result = generate_markdown_export(mixed(), moby_dick(), kNow);
    REQUIRE(result.is_ok());
    const auto& md = result.unwrap();

    REQUIRE(contains(md, "## Summary\n\n- **Total Annotations:** 3\n- **Highlights:** 1\n"
                         "- **Notes:** 1\n- **Bookmarks:** 1\n- **Exported:** January 5, 2024\n"));
    REQUIRE(contains(md, "- [Highlights](#highlights) (1)\n- [Notes](#notes) (1)\n"
                         "- [Bookmarks](#bookmarks) (1)\n"));

    // Sections follow the fixed order regardless of document order.
    const auto highlights = md.find("## Highlights");
    const auto notes = md.find("## Notes");
    const auto bookmarks = md.find("## Bookmarks");
    REQUIRE(highlights < notes);
    REQUIRE(notes < bookmarks);
}

TEST_CASE("Markdown: optional blocks can be switched off", "[markdown]") {
    auto options = moby_dick();
    options.include_stats = false;
    options.include_toc = false;

    const auto md = generate_markdown_export(mixed(), options, kNow).unwrap();
    REQUIRE_FALSE(contains(md, "## Summary"));
    REQUIRE_FALSE(contains(md, "## Table of Contents"));
    REQUIRE(md.rfind("# Moby Dick\n", 0) == 0);
}

TEST_CASE("Markdown: footer closes the document", "[markdown]") {
    const auto md = generate_markdown_export({}, moby_dick(), kNow).unwrap();
    const std::string footer = "\n---\n*Exported from Marginalia on January 5, 2024*";
    REQUIRE(md.size() >= footer.size());
    REQUIRE(md.compare(md.size() - footer.size(), footer.size(), footer) == 0);
    REQUIRE_FALSE(contains(md, "## Highlights"));
}

TEST_CASE("Markdown: whitespace-only notes are not rendered", "[markdown]") {
    const ExportItem h{1, highlight("h1", 0, 5, HighlightColor::Yellow, "   ", "text")};
    REQUIRE_FALSE(contains(markdown_item(h, DateFormat::Iso), "**Note:**"));

    const ExportItem b{2, bookmark("b1", 7, "\t\n")};
    REQUIRE(markdown_item(b, DateFormat::Iso) ==
            "### 2. Bookmark\n"
            "\n"
            "**Position:** 7 | **Date:** 2024-01-05\n"
            "\n");
}

TEST_CASE("Markdown: multi-line selections stay quoted", "[markdown]") {
    const ExportItem h{1, highlight("h1", 0, 30, HighlightColor::Green, std::nullopt, "first line\nsecond line")};
    REQUIRE(contains(markdown_item(h, DateFormat::Iso), "> first line\n> second line\n\n**Color:** Green"));

    const ExportItem n{2, note("n1", 0, 30, "thought", std::string("quoted\ncontext"))};
    REQUIRE(contains(markdown_item(n, DateFormat::Iso), "> *quoted\n> context*\n"));
}
