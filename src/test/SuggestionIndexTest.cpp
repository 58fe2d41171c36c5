#include <cassert>
#include <iostream>
#include <string>
#include "application/SuggestionIndex.hpp"

using namespace redline;
using redline::application::SuggestionIndex;

namespace {

domain::ResolvedSuggestion Make(const std::string& id, std::size_t start, std::size_t end,
                                domain::SuggestionType kind = domain::SuggestionType::Grammar) {
    domain::ResolvedSuggestion s;
    s.id = id;
    s.span = {start, end};
    s.kind = kind;
    s.priority = domain::SuggestionPriority(kind);
    s.originalLiteral = std::string(end - start, 'x');
    s.suggestedLiteral = "y";
    return s;
}

void TestInsertRules() {
    std::cout << "[Test] Anchors and ids are unique..." << std::endl;
    SuggestionIndex index;
    assert(index.insert(Make("a", 0, 4)));
    assert(!index.insert(Make("b", 0, 6)));  // same anchor
    assert(!index.insert(Make("a", 8, 10))); // same id
    assert(!index.insert(Make("c", 5, 5)));  // empty range
    assert(index.insert(Make("d", 2, 6)));
    assert(index.size() == 2);
    assert(index.at(2)->id == "d");
    assert(index.find("a")->span.end == 4);
    assert(index.remove("a"));
    assert(!index.remove("a"));
    std::cout << "[PASS]" << std::endl;
}

void TestRemoveRangeAndEvict() {
    std::cout << "[Test] Contained suggestions are removed, overlapping ones evicted..." << std::endl;
    SuggestionIndex index;
    index.insert(Make("inside", 2, 5));
    index.insert(Make("overlap", 4, 12));
    index.insert(Make("after", 12, 14));

    auto removed = index.removeRange(0, 10);
    assert(removed.size() == 1 && removed[0] == "inside");

    auto evicted = index.evictOverlapping(0, 10);
    assert(evicted.size() == 1 && evicted[0] == "overlap");
    assert(index.size() == 1);
    assert(index.find("after"));
    std::cout << "[PASS]" << std::endl;
}

void TestInsertionPointEviction() {
    std::cout << "[Test] An insertion point evicts only ranges strictly around it..." << std::endl;
    SuggestionIndex index;
    index.insert(Make("around", 3, 7));
    index.insert(Make("starts", 5, 9));
    index.insert(Make("ends", 1, 5));
    auto evicted = index.evictOverlapping(5, 5);
    assert(evicted.size() == 1 && evicted[0] == "around");
    assert(index.size() == 2);
    std::cout << "[PASS]" << std::endl;
}

void TestShift() {
    std::cout << "[Test] Shift moves suggestions at or after the position..." << std::endl;
    SuggestionIndex index;
    index.insert(Make("before", 0, 3));
    index.insert(Make("at", 10, 12));
    index.insert(Make("later", 20, 25));
    assert(index.shift(10, 3) == 2);
    assert(index.find("before")->span.start == 0);
    assert(index.find("at")->span.start == 13 && index.find("at")->span.end == 15);
    assert(index.find("later")->span.start == 23);
    assert(index.at(23) != nullptr);
    assert(index.shift(0, 0) == 0);

    // A shift that lands on an occupied anchor drops the mover.
    assert(index.shift(13, -13) == 1);
    assert(index.find("before"));
    assert(!index.find("at"));
    assert(index.find("later")->span.start == 10);
    std::cout << "[PASS]" << std::endl;
}

void TestCoveringSegments() {
    std::cout << "[Test] Covering segments pick the lowest priority value..." << std::endl;
    SuggestionIndex index;
    index.insert(Make("grammar", 0, 10, domain::SuggestionType::Grammar));
    index.insert(Make("spelling", 5, 8, domain::SuggestionType::Spelling));
    index.insert(Make("tone", 12, 16, domain::SuggestionType::Tone));

    auto segments = index.coveringSegments(0, 20);
    assert(segments.size() == 6);
    assert(segments[0].span == (domain::TextSpan{0, 5}) && segments[0].primary->id == "grammar");
    assert(segments[1].span == (domain::TextSpan{5, 8}) && segments[1].primary->id == "spelling");
    assert(segments[1].covering.size() == 2);
    assert(segments[2].span == (domain::TextSpan{8, 10}) && segments[2].primary->id == "grammar");
    assert(segments[3].span == (domain::TextSpan{10, 12}) && !segments[3].highlighted());
    assert(segments[4].primary->id == "tone");
    assert(segments[5].span == (domain::TextSpan{16, 20}) && segments[5].covering.empty());

    auto visible = index.coveringSegments(6, 13);
    assert(visible.front().span.start == 6);
    assert(visible.back().span.end == 13);
    assert(index.coveringSegments(5, 5).empty());
    std::cout << "[PASS]" << std::endl;
}

void TestPriorityTie() {
    std::cout << "[Test] Equal priorities go to the lower anchor..." << std::endl;
    SuggestionIndex index;
    index.insert(Make("first", 0, 6));
    index.insert(Make("second", 2, 8));
    auto segments = index.coveringSegments(0, 8);
    assert(segments.size() == 3);
    assert(segments[1].span == (domain::TextSpan{2, 6}));
    assert(segments[1].primary->id == "first");
    assert(segments[2].primary->id == "second");
    std::cout << "[PASS]" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting SuggestionIndex tests..." << std::endl;
    TestInsertRules();
    TestRemoveRangeAndEvict();
    TestInsertionPointEviction();
    TestShift();
    TestCoveringSegments();
    TestPriorityTie();
    std::cout << "[Test] All SuggestionIndex tests passed." << std::endl;
    return 0;
}
