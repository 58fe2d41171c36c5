#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include "application/AnalysisPipeline.hpp"
#include "application/ApplyEngine.hpp"

using namespace redline;
using namespace redline::application;
using namespace std::chrono_literals;

namespace {

struct Fixture {
    domain::TextBuffer buffer;
    SuggestionIndex index;
    EditHistory history;
    ApplyEngine engine;
    domain::Clock::time_point t0 = domain::Clock::now();

    explicit Fixture(const std::string& text)
        : buffer(text), history(1000ms, 50), engine(buffer, index, history) {
        history.reset({text, t0, {}});
    }
};

domain::ResolvedSuggestion Make(const std::string& id, std::size_t start, const std::string& original,
                                const std::string& replacement) {
    domain::ResolvedSuggestion s;
    s.id = id;
    s.span = {start, start + original.size()};
    s.originalLiteral = original;
    s.suggestedLiteral = replacement;
    return s;
}

void TestDoubledWordScenario() {
    std::cout << "[Test] Applying one suggestion shifts the later one..." << std::endl;
    const std::string text = "The the cat sat on the the mat.";
    Fixture f(text);

    AnalysisPipeline pipeline(text);
    auto resolved = pipeline.feed(
        R"({"type":"grammar","originalText":"The the","suggestedText":"The","explanation":"Repeated word"})" "\n"
        R"({"type":"grammar","originalText":"the the","suggestedText":"the","explanation":"Repeated word"})" "\n"
        R"({"type":"grammar","originalText":"the the","suggestedText":"the","explanation":"Repeated word"})" "\n");
    auto tail = pipeline.finish();
    assert(tail.empty());
    assert(resolved.size() == 2);
    assert(pipeline.unresolvedCount() == 1);

    const auto& first = resolved[0];
    const auto& second = resolved[1];
    assert(first.span == (domain::TextSpan{0, 7}));
    assert(second.span == (domain::TextSpan{19, 26}));
    assert(first.id == "grammar-0-The the");
    assert(first.confidence == 95);
    assert(first.title == "Grammar Correction");

    for (const auto& s : resolved) assert(f.index.insert(s));

    auto result = f.engine.apply(first.id, f.t0 + 10ms);
    assert(result.status == ApplyStatus::Applied);
    assert(result.delta == -4);
    assert(result.shifted == 1);
    assert(f.buffer.text() == "The cat sat on the the mat.");
    const auto* moved = f.index.find(second.id);
    assert(moved && moved->span == (domain::TextSpan{15, 22}));
    assert(f.buffer.slice(15, 22) == "the the");

    result = f.engine.apply(second.id, f.t0 + 20ms);
    assert(result.status == ApplyStatus::Applied);
    assert(f.buffer.text() == "The cat sat on the mat.");
    assert(f.index.empty());
    std::cout << "[PASS]" << std::endl;
}

void TestEdgeSpaces() {
    std::cout << "[Test] Leading and trailing spaces of the original survive..." << std::endl;
    assert(ApplyEngine::PreserveEdgeSpaces(" walk ", "walks") == " walks ");
    assert(ApplyEngine::PreserveEdgeSpaces(" walk", " walks") == " walks");
    assert(ApplyEngine::PreserveEdgeSpaces("walk", "walks") == "walks");

    Fixture f("She walk home.");
    f.index.insert(Make("g", 3, " walk ", "walks"));
    auto result = f.engine.apply("g", f.t0 + 1ms);
    assert(result.status == ApplyStatus::Applied);
    assert(result.replacement == " walks ");
    assert(f.buffer.text() == "She walks home.");
    std::cout << "[PASS]" << std::endl;
}

void TestPartialOverlapEvicted() {
    std::cout << "[Test] Partially overlapped suggestions are evicted..." << std::endl;
    Fixture f("abcdefghij");
    f.index.insert(Make("a", 2, "cdef", "X"));
    f.index.insert(Make("b", 4, "efgh", "Y"));
    f.index.insert(Make("c", 8, "ij", "Z"));

    auto result = f.engine.apply("a", f.t0 + 1ms);
    assert(result.status == ApplyStatus::Applied);
    assert(f.buffer.text() == "abXghij");
    assert(result.removed.size() == 1 && result.removed[0] == "a");
    assert(result.evicted.size() == 1 && result.evicted[0] == "b");
    assert(f.index.size() == 1);
    assert(f.index.find("c")->span == (domain::TextSpan{5, 7}));
    assert(f.buffer.slice(5, 7) == "ij");
    std::cout << "[PASS]" << std::endl;
}

void TestStaleAndUnknown() {
    std::cout << "[Test] Stale and unknown suggestions leave the text alone..." << std::endl;
    Fixture f("I has a cat.");
    f.index.insert(Make("g", 2, "has", "have"));

    assert(f.engine.apply("missing", f.t0).status == ApplyStatus::NotFound);

    f.buffer.splice(2, 5, "had");
    auto result = f.engine.apply("g", f.t0);
    assert(result.status == ApplyStatus::Stale);
    assert(f.buffer.text() == "I had a cat.");
    assert(f.index.empty());
    assert(f.history.size() == 1);
    std::cout << "[PASS]" << std::endl;
}

void TestDismiss() {
    std::cout << "[Test] Dismiss removes without editing..." << std::endl;
    Fixture f("I has a cat.");
    f.index.insert(Make("g", 2, "has", "have"));
    assert(f.engine.dismiss("g"));
    assert(!f.engine.dismiss("g"));
    assert(f.buffer.text() == "I has a cat.");
    assert(f.index.empty());
    std::cout << "[PASS]" << std::endl;
}

void TestHistoryCheckpoints() {
    std::cout << "[Test] Apply records the states before and after..." << std::endl;
    Fixture f("I has a cat.");
    f.index.insert(Make("g", 2, "has", "have"));
    f.engine.apply("g", f.t0 + 1ms);

    assert(f.history.size() == 2);
    auto before = f.history.undo();
    assert(before && before->text == "I has a cat.");
    assert(before->suggestions.size() == 1 && before->suggestions[0].id == "g");
    auto after = f.history.redo();
    assert(after && after->text == "I have a cat.");
    assert(after->suggestions.empty());
    std::cout << "[PASS]" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ApplyEngine tests..." << std::endl;
    TestDoubledWordScenario();
    TestEdgeSpaces();
    TestPartialOverlapEvicted();
    TestStaleAndUnknown();
    TestDismiss();
    TestHistoryCheckpoints();
    std::cout << "[Test] All ApplyEngine tests passed." << std::endl;
    return 0;
}
