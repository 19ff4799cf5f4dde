#include <catch2/catch_test_macros.hpp>

#include "storage/annotation_json.hpp"
#include "qt/sample_data.hpp"
#include "support/fixtures.hpp"

#include <QString>

using namespace marginalia;
using namespace marginalia::storage;

TEST_CASE("JSON: parses an annotation array", "[qt][json]") {
    auto parsed = parse_annotations(testing::SAMPLE_ANNOTATIONS_JSON);
    REQUIRE(parsed.is_ok());
    const auto& list = parsed.unwrap();
    REQUIRE(list.size() == 4);

    REQUIRE(list[0].id == "h1");
    REQUIRE(is_highlight(list[0]));
    REQUIRE(highlight_color(list[0]) == HighlightColor::Blue);
    REQUIRE(selected_text(list[0]) == std::optional<std::string>("Call me Ishmael."));
    REQUIRE(list[0].note == std::optional<std::string>("Important"));
    REQUIRE(list[0].updated_at == list[0].created_at);

    REQUIRE(is_note(list[1]));
    REQUIRE(is_bookmark(list[3]));
    REQUIRE(list[2].is_public);
    REQUIRE_FALSE(list[3].is_public);
}

TEST_CASE("JSON: accepts a wrapping object", "[qt][json]") {
    const QByteArray doc = R"({"annotations": [
        {"id": "b", "bookId": "x", "type": "BOOKMARK", "startOffset": 3, "endOffset": 3}
    ]})";
    auto parsed = parse_annotations(doc);
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.unwrap().size() == 1);
    REQUIRE(parsed.unwrap()[0].created_at == Timestamp{});
}

TEST_CASE("JSON: highlight color defaults to yellow", "[qt][json]") {
    const QByteArray doc = R"([{"id": "h", "bookId": "x", "type": "HIGHLIGHT",
        "startOffset": 1, "endOffset": 4, "selectedText": "abc"}])";
    REQUIRE(highlight_color(parse_annotations(doc).unwrap()[0]) == HighlightColor::Yellow);
}

namespace {

Result<Annotation> bookmark_created_at(const QString& created) {
    const QString doc = QStringLiteral(
        R"([{"id": "b", "bookId": "x", "type": "BOOKMARK", "startOffset": 1, "endOffset": 1, "createdAt": "%1"}])")
        .arg(created);
    auto parsed = parse_annotations(doc.toUtf8());
    if (parsed.is_err()) return Result<Annotation>::err(parsed.unwrap_err());
    return Result<Annotation>::ok(parsed.unwrap()[0]);
}

} // namespace

TEST_CASE("JSON: timestamps resolve to UTC instants", "[qt][json]") {
    const auto noon = testing::at(2024, 3, 1, 12);

    REQUIRE(bookmark_created_at(QStringLiteral("2024-03-01T12:00:00Z")).unwrap().created_at == noon);
    REQUIRE(bookmark_created_at(QStringLiteral("2024-03-01T14:00:00+02:00")).unwrap().created_at == noon);
    REQUIRE(bookmark_created_at(QStringLiteral("2024-03-01T07:00:00-05:00")).unwrap().created_at == noon);

    SECTION("missing zone designator reads as UTC") {
        REQUIRE(bookmark_created_at(QStringLiteral("2024-03-01T12:00:00")).unwrap().created_at == noon);
    }
    SECTION("milliseconds survive") {
        const auto ts = bookmark_created_at(QStringLiteral("2024-03-01T12:00:00.250Z")).unwrap().created_at;
        REQUIRE(ts.millis() - noon.millis() == 250);
    }
}

TEST_CASE("JSON: rejects impossible timestamps", "[qt][json][error]") {
    for (const auto* text : {"2024-01-05T10:00:00+99:99", "2024-13-01T00:00:00Z",
                             "2024-02-30T00:00:00Z", "2024-01-05T25:00:00Z"}) {
        INFO(text);
        auto parsed = bookmark_created_at(QString::fromLatin1(text));
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.unwrap_err().code == "invalid_json");
    }
}

TEST_CASE("JSON: rejects invalid input", "[qt][json][error]") {
    SECTION("malformed document") {
        auto parsed = parse_annotations("[{");
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.unwrap_err().code == "invalid_json");
    }
    SECTION("scalar document") {
        REQUIRE(parse_annotations("42").unwrap_err().code == "invalid_json");
    }
    SECTION("unknown type") {
        auto parsed = parse_annotations(R"([{"id": "q", "type": "QUOTE", "startOffset": 0, "endOffset": 0}])");
        REQUIRE(parsed.unwrap_err().code == "invalid_json");
        REQUIRE(parsed.unwrap_err().message.rfind("Entry 0: ", 0) == 0);
    }
    SECTION("unknown color") {
        auto parsed = parse_annotations(R"([{"id": "h", "bookId": "x", "type": "HIGHLIGHT",
            "startOffset": 0, "endOffset": 2, "selectedText": "ab", "color": "teal"}])");
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.unwrap_err().kind == ErrorKind::Validation);
    }
    SECTION("inverted range") {
        auto parsed = parse_annotations(R"([{"id": "n", "bookId": "x", "type": "NOTE",
            "startOffset": 9, "endOffset": 2, "note": "hm"}])");
        REQUIRE(parsed.unwrap_err().code == "inverted_range");
    }
    SECTION("bad timestamp") {
        auto parsed = parse_annotations(R"([{"id": "b", "bookId": "x", "type": "BOOKMARK",
            "startOffset": 1, "endOffset": 1, "createdAt": "yesterday"}])");
        REQUIRE(parsed.unwrap_err().code == "invalid_json");
    }
    SECTION("duplicate id") {
        auto parsed = parse_annotations(R"([
            {"id": "b", "bookId": "x", "type": "BOOKMARK", "startOffset": 1, "endOffset": 1},
            {"id": "b", "bookId": "x", "type": "BOOKMARK", "startOffset": 2, "endOffset": 2}])");
        REQUIRE(parsed.unwrap_err().code == "duplicate_id");
    }
}

TEST_CASE("JSON: serialized annotations parse back unchanged", "[qt][json]") {
    const auto original = parse_annotations(testing::SAMPLE_ANNOTATIONS_JSON).unwrap();
    const auto again = parse_annotations(serialize_annotations(original));
    REQUIRE(again.is_ok());
    REQUIRE(again.unwrap() == original);
}
