#include <cassert>
#include <iostream>
#include <string>
#include <vector>
#include "application/StreamDecoder.hpp"

using namespace redline;
using redline::application::StreamDecoder;

namespace {

const std::string kStream =
    R"({"type":"grammar","originalText":"The the","suggestedText":"The","explanation":"Repeated word {sic}"})" "\n"
    R"({"type":"spelling","originalText":"recieve","suggestedText":"receive","explanation":"close } and \" quote"})" "\n";

std::vector<domain::CorrectionCandidate> DecodeAll(const std::vector<std::string>& parts) {
    StreamDecoder decoder;
    std::vector<domain::CorrectionCandidate> out;
    for (const auto& part : parts) {
        auto batch = decoder.feed(part);
        out.insert(out.end(), batch.begin(), batch.end());
    }
    auto tail = decoder.finish();
    out.insert(out.end(), tail.begin(), tail.end());
    return out;
}

void CheckExpected(const std::vector<domain::CorrectionCandidate>& got) {
    assert(got.size() == 2);
    assert(got[0].kind == domain::SuggestionType::Grammar);
    assert(got[0].originalLiteral == "The the");
    assert(got[0].suggestedLiteral == "The");
    assert(got[0].explanation == "Repeated word {sic}");
    assert(got[1].kind == domain::SuggestionType::Spelling);
    assert(got[1].originalLiteral == "recieve");
    assert(got[1].explanation == "close } and \" quote");
}

void TestWholeStream() {
    std::cout << "[Test] Whole stream in one chunk..." << std::endl;
    StreamDecoder decoder;
    auto out = decoder.feed(kStream);
    CheckExpected(out);
    assert(decoder.emittedCount() == 2);
    assert(decoder.state() == StreamDecoder::State::Scanning);
    std::cout << "[PASS]" << std::endl;
}

void TestEverySplit() {
    std::cout << "[Test] Every three-way split yields the same candidates..." << std::endl;
    for (std::size_t i = 0; i <= kStream.size(); ++i) {
        for (std::size_t j = i; j <= kStream.size(); ++j) {
            CheckExpected(DecodeAll({kStream.substr(0, i), kStream.substr(i, j - i), kStream.substr(j)}));
        }
    }
    std::vector<std::string> bytes;
    for (char ch : kStream) bytes.emplace_back(1, ch);
    CheckExpected(DecodeAll(bytes));
    std::cout << "[PASS]" << std::endl;
}

void TestFences() {
    std::cout << "[Test] Markdown fences around and inside records..." << std::endl;
    CheckExpected(DecodeAll({"```json\n" + kStream + "```\n"}));

    const std::string fencedInside =
        "{\"type\":\"spelling\",\n```json\n\"originalText\":\"teh\",\"suggestedText\":\"the\"}";
    for (std::size_t i = 0; i <= fencedInside.size(); ++i) {
        auto out = DecodeAll({fencedInside.substr(0, i), fencedInside.substr(i)});
        assert(out.size() == 1);
        assert(out[0].originalLiteral == "teh");
        assert(out[0].suggestedLiteral == "the");
    }

    // Backticks inside a string are content, not a fence.
    auto quoted = DecodeAll({R"({"type":"grammar","originalText":"use ```code```","suggestedText":"use code"})"});
    assert(quoted.size() == 1);
    assert(quoted[0].originalLiteral == "use ```code```");
    std::cout << "[PASS]" << std::endl;
}

void TestRecovery() {
    std::cout << "[Test] Malformed records are skipped..." << std::endl;
    StreamDecoder decoder;
    auto out = decoder.feed(R"({bad} {"type":"spelling","originalText":"teh","suggestedText":"the"})");
    assert(out.size() == 1);
    assert(out[0].originalLiteral == "teh");
    assert(decoder.malformedCount() == 1);

    // An unbalanced prefix swallows the next record until the stream ends.
    StreamDecoder unbalanced;
    out = unbalanced.feed(R"({"type": "grammar", broken {"type":"spelling","originalText":"teh","suggestedText":"the"})");
    assert(out.empty());
    assert(unbalanced.state() == StreamDecoder::State::Accumulating);
    out = unbalanced.finish();
    assert(out.size() == 1);
    assert(out[0].originalLiteral == "teh");
    assert(unbalanced.malformedCount() == 1);
    std::cout << "[PASS]" << std::endl;
}

void TestValidation() {
    std::cout << "[Test] Records missing fields or with unknown types are rejected..." << std::endl;
    StreamDecoder decoder;
    auto out = decoder.feed(
        R"({"type":"grammar","originalText":"x"})"
        R"({"type":"style","originalText":"a","suggestedText":"b"})"
        R"({"type":"grammar","originalText":"","suggestedText":"b"})"
        R"({"type":"clarity","originalText":"in order to","suggestedText":"to"})");
    assert(out.size() == 1);
    assert(out[0].kind == domain::SuggestionType::Clarity);
    assert(out[0].explanation.empty());
    assert(decoder.rejectedCount() == 3);
    assert(decoder.emittedCount() == 1);
    std::cout << "[PASS]" << std::endl;
}

void TestNestedObjects() {
    std::cout << "[Test] Nested objects stay inside their record..." << std::endl;
    StreamDecoder decoder;
    auto out = decoder.feed(R"(noise {"type":"tone","originalText":"ASAP","suggestedText":"soon","meta":{"a":{"b":1}}} trailing)");
    assert(out.size() == 1);
    assert(out[0].kind == domain::SuggestionType::Tone);
    std::cout << "[PASS]" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting StreamDecoder tests..." << std::endl;
    TestWholeStream();
    TestEverySplit();
    TestFences();
    TestRecovery();
    TestValidation();
    TestNestedObjects();
    std::cout << "[Test] All StreamDecoder tests passed." << std::endl;
    return 0;
}
