#include <cassert>
#include <chrono>
#include <iostream>
#include "application/EditHistory.hpp"

using namespace redline;
using namespace redline::application;
using namespace std::chrono_literals;

namespace {

const domain::Clock::time_point t0{};

void TestDebounce() {
    std::cout << "[Test] Bursts of edits become one checkpoint..." << std::endl;
    EditHistory history(1000ms, 10);
    history.reset({"a", t0, {}});

    history.record({"ab", t0 + 100ms, {}});
    assert(!history.poll(t0 + 500ms));
    history.record({"abc", t0 + 900ms, {}});
    assert(!history.poll(t0 + 1500ms));
    assert(history.hasPending());
    assert(history.poll(t0 + 1900ms));
    assert(!history.hasPending());
    assert(history.size() == 2);

    auto undone = history.undo();
    assert(undone && undone->text == "a");
    assert(!history.undo());
    auto redone = history.redo();
    assert(redone && redone->text == "abc");
    assert(!history.redo());
    std::cout << "[PASS]" << std::endl;
}

void TestRedoBranchCleared() {
    std::cout << "[Test] A new step after undo clears redo..." << std::endl;
    EditHistory history(0ms, 10);
    history.reset({"one", t0, {}});
    history.push({"two", t0, {}});
    history.push({"three", t0, {}});
    history.undo();
    assert(history.canRedo());
    history.push({"branch", t0, {}});
    assert(!history.canRedo());
    assert(history.size() == 3);
    assert(history.current()->text == "branch");
    std::cout << "[PASS]" << std::endl;
}

void TestIdenticalTextAmends() {
    std::cout << "[Test] Identical text amends the current step..." << std::endl;
    EditHistory history(0ms, 10);
    history.reset({"same", t0, {}});

    domain::ResolvedSuggestion s;
    s.id = "spelling-0-same";
    s.span = {0, 4};
    history.push({"same", t0, {s}});
    assert(history.size() == 1);
    assert(history.current()->suggestions.size() == 1);

    history.record({"same", t0, {}});
    assert(!history.flush());
    assert(history.size() == 1);

    history.pushStep({"same", t0, {}});
    assert(history.size() == 2);
    assert(history.current()->suggestions.empty());
    auto before = history.undo();
    assert(before && before->suggestions.size() == 1);
    std::cout << "[PASS]" << std::endl;
}

void TestDepthCap() {
    std::cout << "[Test] History keeps at most maxDepth steps..." << std::endl;
    EditHistory history(0ms, 3);
    history.reset({"0", t0, {}});
    for (int i = 1; i <= 5; ++i) {
        history.push({std::to_string(i), t0, {}});
    }
    assert(history.size() == 3);
    assert(history.current()->text == "5");
    history.undo();
    history.undo();
    assert(history.current()->text == "3");
    assert(!history.canUndo());
    std::cout << "[PASS]" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting EditHistory tests..." << std::endl;
    TestDebounce();
    TestRedoBranchCleared();
    TestIdenticalTextAmends();
    TestDepthCap();
    std::cout << "[Test] All EditHistory tests passed." << std::endl;
    return 0;
}
