#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/annotation_query.hpp"
#include "property/generators.hpp"

#include <algorithm>
#include <set>

using namespace marginalia;
using namespace marginalia::query;
using namespace marginalia::testing;

namespace rc {

template<>
struct Arbitrary<SortSpec> {
    static Gen<SortSpec> arbitrary() {
        return gen::exec([] {
            SortSpec spec;
            spec.field = *gen::element(SortField::CreatedAt, SortField::UpdatedAt,
                                       SortField::StartOffset, SortField::Type);
            spec.direction = *gen::element(SortDirection::Asc, SortDirection::Desc);
            return spec;
        });
    }
};

template<>
struct Arbitrary<FilterCriteria> {
    static Gen<FilterCriteria> arbitrary() {
        return gen::exec([] {
            FilterCriteria c;
            if (*gen::arbitrary<bool>()) {
                c.type = *gen::element(AnnotationType::Highlight, AnnotationType::Note,
                                       AnnotationType::Bookmark);
            }
            if (*gen::arbitrary<bool>()) c.has_note = *gen::arbitrary<bool>();
            if (*gen::arbitrary<bool>()) c.is_public = *gen::arbitrary<bool>();
            if (*gen::arbitrary<bool>()) c.search = *gen::element(std::string("WHALE"), std::string("sea"),
                                                                   std::string("words"), std::string());
            return c;
        });
    }
};

} // namespace rc

TEST_CASE("Property: sort is stable", "[property][query]") {
    REQUIRE(rc::check("equal keys keep their input order", [](const SortSpec& spec) {
        const auto list = *annotation_lists();
        const auto sorted = sort(list, spec);
        RC_ASSERT(sorted.size() == list.size());

        const auto same_key = [&spec](const Annotation& a, const Annotation& b) {
            switch (spec.field) {
                case SortField::CreatedAt: return a.created_at == b.created_at;
                case SortField::UpdatedAt: return a.updated_at == b.updated_at;
                case SortField::StartOffset: return a.start_offset == b.start_offset;
                case SortField::Type: return get_type(a) == get_type(b);
            }
            return false;
        };

        for (size_t i = 1; i < sorted.size(); ++i) {
            if (same_key(sorted[i - 1], sorted[i])) {
                RC_ASSERT(input_position(sorted[i - 1]) < input_position(sorted[i]));
            }
        }
    }));
}

TEST_CASE("Property: sort orders by the requested key", "[property][query]") {
    REQUIRE(rc::check("start offsets ascend, creation dates descend", [] {
        const auto list = *annotation_lists();

        const auto by_offset = sort(list, SortSpec{SortField::StartOffset, SortDirection::Asc});
        RC_ASSERT(std::is_sorted(by_offset.begin(), by_offset.end(),
            [](const Annotation& a, const Annotation& b) { return a.start_offset < b.start_offset; }));

        const auto newest = sort(list, SortSpec{SortField::CreatedAt, SortDirection::Desc});
        RC_ASSERT(std::is_sorted(newest.begin(), newest.end(),
            [](const Annotation& a, const Annotation& b) { return a.created_at > b.created_at; }));
    }));
}

TEST_CASE("Property: filter is idempotent and order-preserving", "[property][query]") {
    REQUIRE(rc::check("filter(filter(x)) == filter(x)", [](const FilterCriteria& criteria) {
        const auto list = *annotation_lists();
        const auto once = filter(list, criteria);
        RC_ASSERT(filter(once, criteria) == once);
        RC_ASSERT(once.size() <= list.size());
        for (size_t i = 1; i < once.size(); ++i) {
            RC_ASSERT(input_position(once[i - 1]) < input_position(once[i]));
        }
        for (const auto& a : once) {
            RC_ASSERT(matches(a, criteria));
        }
    }));
}

TEST_CASE("Property: range overlap agrees with the interval rule", "[property][query]") {
    REQUIRE(rc::check("hits are exactly the intersecting annotations", [] {
        const auto list = *annotation_lists();
        const int64_t start = *rc::gen::inRange<int64_t>(0, 560);
        const int64_t end = start + *rc::gen::inRange<int64_t>(0, 80);

        const auto hits = range_overlap(list, start, end);
        size_t expected = 0;
        for (const auto& a : list) {
            if (a.start_offset == a.end_offset) {
                if (start == end && a.start_offset == start) ++expected;
            } else if (a.start_offset < end && a.end_offset > start) {
                ++expected;
            }
        }
        RC_ASSERT(hits.size() == expected);
    }));
}

TEST_CASE("Property: point lookup returns the first covering annotation", "[property][query]") {
    REQUIRE(rc::check("no earlier annotation covers the offset", [] {
        const auto list = *annotation_lists();
        const int64_t offset = *rc::gen::inRange<int64_t>(0, 560);

        const auto hit = point_lookup(list, offset);
        const auto covers = [offset](const Annotation& a) {
            return a.start_offset <= offset && offset <= a.end_offset;
        };
        const auto first = std::find_if(list.begin(), list.end(), covers);
        if (first == list.end()) {
            RC_ASSERT(!hit.has_value());
        } else {
            RC_ASSERT(hit.has_value());
            RC_ASSERT(hit->id == first->id);
        }
    }));
}

TEST_CASE("Property: merged ranges cover every highlight exactly once", "[property][query]") {
    REQUIRE(rc::check("merge produces disjoint sorted unions", [] {
        const auto list = *annotation_lists();
        const auto merged = merge_overlapping_ranges(list);

        for (size_t i = 1; i < merged.size(); ++i) {
            RC_ASSERT(merged[i - 1].end_offset < merged[i].start_offset);
        }

        std::set<std::string> seen;
        size_t highlight_count = 0;
        for (const auto& a : list) {
            if (!is_highlight(a)) continue;
            ++highlight_count;
            const auto owner = std::find_if(merged.begin(), merged.end(), [&a](const MergedRange& r) {
                return std::find(r.annotation_ids.begin(), r.annotation_ids.end(), a.id) !=
                       r.annotation_ids.end();
            });
            RC_ASSERT(owner != merged.end());
            RC_ASSERT(owner->start_offset <= a.start_offset);
            RC_ASSERT(a.end_offset <= owner->end_offset);
            seen.insert(a.id);
        }

        size_t total_ids = 0;
        for (const auto& r : merged) total_ids += r.annotation_ids.size();
        RC_ASSERT(total_ids == highlight_count);
        RC_ASSERT(seen.size() == highlight_count);
    }));
}
