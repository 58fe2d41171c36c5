#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "application/AnalysisPipeline.hpp"
#include "application/EditingSession.hpp"

using namespace redline;
using namespace redline::application;
using namespace std::chrono_literals;

namespace {

const domain::Clock::time_point t0{};
const std::string kText = "The the cat sat on the the mat.";
const std::string kModelOutput =
    R"({"type":"grammar","originalText":"The the","suggestedText":"The"})" "\n"
    R"({"type":"grammar","originalText":"the the","suggestedText":"the"})" "\n";

/** @brief Runs a pass over the ticket text and merges every result. */
std::size_t RunPass(EditingSession& session, const AnalysisTicket& ticket, const std::string& output) {
    AnalysisPipeline pipeline(ticket.text);
    std::size_t accepted = 0;
    for (const auto& s : pipeline.feed(output)) {
        if (session.acceptSuggestion(ticket, s)) ++accepted;
    }
    session.completeAnalysis(ticket);
    return accepted;
}

class RecordingRenderer : public domain::OverlayRenderer {
public:
    std::vector<std::string> pieces;
    std::vector<bool> highlighted;

    void drawSegment(std::string_view text, const domain::CoveringSegment& segment) override {
        pieces.emplace_back(text);
        highlighted.push_back(segment.highlighted());
    }
};

void TestUndoRedoAfterApply() {
    std::cout << "[Test] Undo after apply restores text and suggestions..." << std::endl;
    EditingSession session(kText, {}, t0);
    auto ticket = session.beginAnalysis();
    assert(RunPass(session, ticket, kModelOutput) == 2);

    auto result = session.apply("grammar-0-The the", t0 + 1s);
    assert(result.status == ApplyStatus::Applied);
    assert(session.text() == "The cat sat on the the mat.");
    assert(session.suggestions().size() == 1);

    assert(session.undo());
    assert(session.text() == kText);
    assert(session.suggestions().size() == 2);
    assert(session.suggestions().find("grammar-0-The the"));
    assert(session.suggestions().find("grammar-19-the the")->span == (domain::TextSpan{19, 26}));

    assert(session.redo());
    assert(session.text() == "The cat sat on the the mat.");
    assert(session.suggestions().size() == 1);
    assert(session.suggestions().find("grammar-19-the the")->span == (domain::TextSpan{15, 22}));
    assert(!session.redo());
    std::cout << "[PASS]" << std::endl;
}

void TestApplyKeepsOwnStepWhenTextUnchanged() {
    std::cout << "[Test] An apply that leaves the text unchanged is still one undo step..." << std::endl;
    EditingSession session("Hello world", {}, t0);
    session.replaceRange(11, 0, "!", t0 + 1s);
    session.tick(t0 + 3s);
    assert(session.history().size() == 2);

    RunPass(session, session.beginAnalysis(),
            R"({"type":"grammar","originalText":" world","suggestedText":"world"})");
    assert(session.suggestions().size() == 1);
    const std::string id = session.suggestions().all().front().id;

    auto result = session.apply(id, t0 + 4s);
    assert(result.status == ApplyStatus::Applied);
    assert(result.replacement == " world");
    assert(session.text() == "Hello world!");
    assert(session.suggestions().empty());

    assert(session.undo());
    assert(session.text() == "Hello world!");
    assert(session.suggestions().find(id));

    assert(session.undo());
    assert(session.text() == "Hello world");

    assert(session.redo());
    assert(session.redo());
    assert(session.text() == "Hello world!");
    assert(session.suggestions().empty());
    assert(!session.redo());
    std::cout << "[PASS]" << std::endl;
}

void TestResultsDoNotCutTypingShort() {
    std::cout << "[Test] Streamed results keep the typing checkpoint debounced..." << std::endl;
    EditingSession session("Fix teh bug", {}, t0);
    session.replaceRange(11, 0, "s", t0 + 1s);
    RunPass(session, session.beginAnalysis(),
            R"({"type":"spelling","originalText":"teh","suggestedText":"the"})");
    assert(session.suggestions().size() == 1);
    assert(session.history().hasPending());
    assert(session.history().size() == 1);

    session.tick(t0 + 1500ms);
    assert(session.history().hasPending());

    session.tick(t0 + 2s);
    assert(!session.history().hasPending());
    assert(session.history().size() == 2);
    assert(session.history().current()->text == "Fix teh bugs");
    assert(session.history().current()->suggestions.size() == 1);
    std::cout << "[PASS]" << std::endl;
}

void TestEditClearsRedo() {
    std::cout << "[Test] Typing after undo clears the redo branch..." << std::endl;
    EditingSession session(kText, {}, t0);
    auto ticket = session.beginAnalysis();
    RunPass(session, ticket, kModelOutput);
    session.apply("grammar-0-The the", t0 + 1s);
    assert(session.undo());
    assert(session.canRedo());

    session.replaceRange(session.text().size(), 0, "!", t0 + 2s);
    assert(!session.canRedo());
    session.tick(t0 + 4s);
    assert(!session.redo());
    assert(session.text() == kText + "!");
    std::cout << "[PASS]" << std::endl;
}

void TestStaleTickets() {
    std::cout << "[Test] Results of stale or superseded passes are discarded..." << std::endl;
    EditingSession session(kText, {}, t0);

    auto edited = session.beginAnalysis();
    session.replaceRange(0, 0, "So ", t0 + 1s);
    assert(!session.isCurrent(edited));
    assert(RunPass(session, edited, kModelOutput) == 0);
    assert(session.suggestions().empty());

    auto older = session.beginAnalysis();
    auto newer = session.beginAnalysis();
    assert(!session.isCurrent(older));
    assert(RunPass(session, older, kModelOutput) == 0);
    assert(RunPass(session, newer, kModelOutput) == 2);
    assert(session.suggestions().find("grammar-3-The the"));
    std::cout << "[PASS]" << std::endl;
}

void TestNewPassReplacesOld() {
    std::cout << "[Test] A new pass replaces the previous suggestions..." << std::endl;
    EditingSession session(kText, {}, t0);
    RunPass(session, session.beginAnalysis(), kModelOutput);
    assert(session.suggestions().size() == 2);

    auto second = session.beginAnalysis();
    RunPass(session, second, R"({"type":"spelling","originalText":"mat","suggestedText":"mat"})");
    assert(session.suggestions().size() == 1);
    assert(session.suggestions().find("spelling-27-mat"));

    RunPass(session, session.beginAnalysis(), "");
    assert(session.suggestions().empty());
    std::cout << "[PASS]" << std::endl;
}

void TestEditsMoveAndEvict() {
    std::cout << "[Test] Edits shift later suggestions and evict touched ones..." << std::endl;
    EditingSession session("Fix teh bug", {}, t0);
    RunPass(session, session.beginAnalysis(), R"({"type":"spelling","originalText":"teh","suggestedText":"the"})");
    assert(session.suggestions().find("spelling-4-teh"));

    session.replaceRange(0, 0, "Please ", t0 + 1s);
    assert(session.text() == "Please Fix teh bug");
    assert(session.suggestions().find("spelling-4-teh")->span == (domain::TextSpan{11, 14}));

    session.setText("Please fix teh bug", t0 + 2s);
    assert(session.suggestions().size() == 1);

    session.setText("Please fix tech bug", t0 + 3s);
    assert(session.suggestions().empty());
    std::cout << "[PASS]" << std::endl;
}

void TestAnalysisSchedule() {
    std::cout << "[Test] Analysis is due after the input pause..." << std::endl;
    SessionSettings settings;
    settings.analysisDebounce = 2000ms;
    EditingSession session("abc", settings, t0);
    assert(!session.tick(t0 + 10s));

    session.replaceRange(3, 0, "d", t0 + 1s);
    assert(!session.tick(t0 + 2999ms));
    assert(session.tick(t0 + 3s));
    assert(!session.tick(t0 + 4s));
    assert(session.history().size() == 2);
    std::cout << "[PASS]" << std::endl;
}

void TestStylePassOverlapsGrammar() {
    std::cout << "[Test] A style pass resolves overlapping grammar and style records..." << std::endl;
    const std::string text = "The report were written by the team.";
    EditingSession session(text, {}, t0);
    auto ticket = session.beginAnalysis(domain::AnalysisLevel::Style);
    assert(ticket.level == domain::AnalysisLevel::Style);
    assert(RunPass(session, ticket,
                   R"({"type":"passive-voice","originalText":"The report were written by the team",)"
                   R"("suggestedText":"The team wrote the report"})" "\n"
                   R"({"type":"grammar","originalText":"were","suggestedText":"was"})" "\n"
                   R"({"type":"conciseness","originalText":"the team.","suggestedText":"them."})") == 3);

    const auto* passive = session.suggestions().find("passive-voice-0-The report were written by the team");
    assert(passive && passive->span == (domain::TextSpan{0, 35}));
    assert(session.suggestions().find("grammar-11-were")->span == (domain::TextSpan{11, 15}));

    std::vector<std::pair<std::string, domain::SuggestionType>> painted;
    class KindRenderer : public domain::OverlayRenderer {
    public:
        explicit KindRenderer(std::vector<std::pair<std::string, domain::SuggestionType>>& out) : m_out(out) {}
        void drawSegment(std::string_view text, const domain::CoveringSegment& segment) override {
            assert(segment.primary);
            m_out.emplace_back(std::string(text), segment.primary->kind);
        }
    private:
        std::vector<std::pair<std::string, domain::SuggestionType>>& m_out;
    } renderer(painted);
    session.render(renderer);

    using domain::SuggestionType;
    assert((painted == std::vector<std::pair<std::string, SuggestionType>>{
        {"The report ", SuggestionType::PassiveVoice},
        {"were", SuggestionType::Grammar},
        {" written by ", SuggestionType::PassiveVoice},
        {"the team", SuggestionType::PassiveVoice},
        {".", SuggestionType::Conciseness},
    }));

    auto result = session.apply("grammar-11-were", t0 + 1s);
    assert(result.status == ApplyStatus::Applied);
    assert(session.text() == "The report was written by the team.");
    assert(session.suggestions().size() == 1);
    assert(session.suggestions().find("conciseness-27-the team.")->span == (domain::TextSpan{26, 35}));
    std::cout << "[PASS]" << std::endl;
}

void TestRender() {
    std::cout << "[Test] Render walks the covering segments..." << std::endl;
    EditingSession session("Fix teh bug", {}, t0);
    RunPass(session, session.beginAnalysis(), R"({"type":"spelling","originalText":"teh","suggestedText":"the"})");

    RecordingRenderer renderer;
    session.render(renderer);
    assert((renderer.pieces == std::vector<std::string>{"Fix ", "teh", " bug"}));
    assert((renderer.highlighted == std::vector<bool>{false, true, false}));

    RecordingRenderer partial;
    session.render(partial, 5, 9);
    assert((partial.pieces == std::vector<std::string>{"eh", " b"}));

    bool threw = false;
    try {
        session.replaceRange(50, 1, "x", t0);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS]" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting EditingSession tests..." << std::endl;
    TestUndoRedoAfterApply();
    TestApplyKeepsOwnStepWhenTextUnchanged();
    TestResultsDoNotCutTypingShort();
    TestEditClearsRedo();
    TestStaleTickets();
    TestNewPassReplacesOld();
    TestEditsMoveAndEvict();
    TestAnalysisSchedule();
    TestStylePassOverlapsGrammar();
    TestRender();
    std::cout << "[Test] All EditingSession tests passed." << std::endl;
    return 0;
}
