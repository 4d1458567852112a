#include "corpus/CorpusJson.hpp"

#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace MT;

namespace {

constexpr char const* kCorpus = R"json({
  "clauses": [
    {"id": 427566, "slots_start": 31, "slots_end": 36, "label": "and God saw the light that it was good",
     "book": "Genesis", "chapter": 1, "verse": 4, "original_mother": null, "typ": "Way0",
     "core_functions": ["Pred", "Subj"]},
    {"id": 427567, "slotsStart": 37, "slotsEnd": 40, "label": "that it was good",
     "book": "Genesis", "chapter": 1, "verse": 4, "mother": 427566, "rela": "Objc"},
    {"id": 427568, "slotsStart": 41, "slotsEnd": 45, "label": "and God separated",
     "containerId": "custom", "book": "Genesis", "chapter": 1, "verse": 4, "originalMother": 427566,
     "reference": "Gen 1:4 (c)"}
  ]
})json";

} // namespace

TEST_SUITE("corpus.json") {
    TEST_CASE("fixture records are read with both key spellings") {
        auto corpus = parseCorpusJson(kCorpus);
        REQUIRE(corpus.has_value());
        CHECK(corpus->size() == 3);

        auto const* head = corpus->find(427566);
        REQUIRE(head != nullptr);
        CHECK(head->slotsStart == 31);
        CHECK(head->slotCount == 6);
        CHECK(head->containerId == "Genesis.1.4");
        CHECK(head->typ == std::optional<std::string>{"Way0"});
        CHECK(head->coreFunctions == std::vector<std::string>{"Pred", "Subj"});
        CHECK(head->isClause());
        // Six words are kept, the rest becomes an ellipsis.
        CHECK(head->label == "and God saw the light that \xE2\x80\xA6");

        auto const* object = corpus->find(427567);
        REQUIRE(object != nullptr);
        CHECK(object->originalMother == MotherRef{427566});
        CHECK(object->rela == std::optional<std::string>{"Objc"});
        CHECK(object->label == "that it was good");

        CHECK(corpus->find(427568)->containerId == "custom");
    }

    TEST_CASE("references get a per verse letter in id order") {
        auto corpus = parseCorpusJson(kCorpus);
        REQUIRE(corpus.has_value());
        CHECK(corpus->find(427566)->reference == "Genesis 1:4a");
        CHECK(corpus->find(427567)->reference == "Genesis 1:4b");
        // Provided references are kept as they are.
        CHECK(corpus->find(427568)->reference == "Gen 1:4 (c)");
    }

    TEST_CASE("a bare array is accepted") {
        auto clauses = parseCorpusClauses(
            R"([{"id": 1, "slotsStart": 1, "book": "1_Samuel", "chapter": 2, "verse": 3}])");
        REQUIRE(clauses.has_value());
        REQUIRE(clauses->size() == 1);
        CHECK(clauses->front().containerId == "1 Samuel.2.3");
        CHECK(clauses->front().reference == "1 Samuel 2:3a");
        CHECK_FALSE(clauses->front().originalMother.has_value());
    }

    TEST_CASE("malformed input is reported") {
        CHECK(parseCorpusJson("not json").error().code == Error::Code::MalformedInput);
        CHECK(parseCorpusJson(R"({"items": []})").error().code == Error::Code::MalformedInput);
        CHECK(parseCorpusJson(R"([{"slotsStart": 1, "book": "Genesis", "chapter": 1, "verse": 1}])")
                  .error()
                  .code
              == Error::Code::MalformedInput);
        CHECK(parseCorpusJson(R"([{"id": "x", "slotsStart": 1, "book": "Genesis", "chapter": 1, "verse": 1}])")
                  .error()
                  .code
              == Error::Code::MalformedInput);
        CHECK(parseCorpusJson(R"([{"id": 1, "slotsStart": 1, "chapter": 1, "verse": 1}])").error().code
              == Error::Code::MalformedInput);
        CHECK(parseCorpusJson(
                  R"([{"id": 1, "slotsStart": 1, "book": "Genesis", "chapter": 1, "verse": 1, "mother": 7}])")
                  .error()
                  .code
              == Error::Code::MalformedInput);
    }

    TEST_CASE("chapter and verse outside int range are rejected") {
        auto chapter = parseCorpusJson(
            R"([{"id": 1, "slotsStart": 1, "book": "Genesis", "chapter": 4294967297, "verse": 1}])");
        REQUIRE_FALSE(chapter.has_value());
        CHECK(chapter.error().code == Error::Code::MalformedInput);

        auto verse = parseCorpusJson(
            R"([{"id": 1, "slotsStart": 1, "book": "Genesis", "chapter": 1, "verse": -2147483649}])");
        REQUIRE_FALSE(verse.has_value());
        CHECK(verse.error().code == Error::Code::MalformedInput);
    }

    TEST_CASE("label truncation") {
        CHECK(truncateLabel("one two three", 6) == "one two three");
        CHECK(truncateLabel("  one   two  ", 6) == "one two");
        CHECK(truncateLabel("one two three", 2) == "one two \xE2\x80\xA6");
        CHECK(truncateLabel("one two three", 0) == "one \xE2\x80\xA6");
        CHECK(truncateLabel("", 3).empty());
    }

    TEST_CASE("loading from disk") {
        auto path = std::filesystem::temp_directory_path() / "mothertree_corpus_test.json";
        {
            std::ofstream out(path);
            out << kCorpus;
        }
        auto corpus = loadCorpusJson(path, CorpusLoadOptions{.labelMaxWords = 2});
        std::filesystem::remove(path);
        REQUIRE(corpus.has_value());
        CHECK(corpus->find(427567)->label == "that it \xE2\x80\xA6");

        auto missing = loadCorpusJson(std::filesystem::temp_directory_path() / "mothertree_no_such_file.json");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::NotFound);
    }
}
