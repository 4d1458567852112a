#include "corpus/CorpusJson.hpp"

#include "log/TaggedLogger.hpp"
#include "util/Utils.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <limits>
#include <map>
#include <sstream>
#include <string>
#include <tuple>
#include <utility>

#include <nlohmann/json.hpp>

namespace MT {
namespace {

using Json = nlohmann::json;

constexpr std::string_view Ellipsis = "\xE2\x80\xA6";

auto findKey(Json const& object, std::initializer_list<std::string_view> keys) -> Json const* {
    for (auto key : keys) {
        auto it = object.find(std::string{key});
        if (it != object.end()) {
            return &*it;
        }
    }
    return nullptr;
}

auto malformed(std::size_t index, std::string_view field, std::string_view problem) -> Error {
    std::string message = "clause #" + std::to_string(index) + " field '";
    message.append(field);
    message.append("' ");
    message.append(problem);
    return Error{Error::Code::MalformedInput, std::move(message)};
}

auto readInteger(Json const& object,
                 std::size_t index,
                 std::initializer_list<std::string_view> keys,
                 bool required) -> Expected<std::optional<std::int64_t>> {
    auto const* value = findKey(object, keys);
    if (value == nullptr || value->is_null()) {
        if (required) {
            return std::unexpected(malformed(index, *keys.begin(), "is missing"));
        }
        return std::optional<std::int64_t>{};
    }
    if (!value->is_number_integer()) {
        return std::unexpected(malformed(index, *keys.begin(), "must be an integer"));
    }
    return std::optional<std::int64_t>{value->get<std::int64_t>()};
}

auto readInt32(Json const& object,
               std::size_t index,
               std::initializer_list<std::string_view> keys) -> Expected<int> {
    auto value = readInteger(object, index, keys, true);
    if (!value)
        return std::unexpected(value.error());
    if (**value < std::numeric_limits<int>::min() || **value > std::numeric_limits<int>::max()) {
        return std::unexpected(malformed(index, *keys.begin(), "is out of range"));
    }
    return static_cast<int>(**value);
}

auto readString(Json const& object,
                std::size_t index,
                std::initializer_list<std::string_view> keys) -> Expected<std::optional<std::string>> {
    auto const* value = findKey(object, keys);
    if (value == nullptr || value->is_null()) {
        return std::optional<std::string>{};
    }
    if (!value->is_string()) {
        return std::unexpected(malformed(index, *keys.begin(), "must be a string"));
    }
    auto text = value->get<std::string>();
    if (text.empty()) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{std::move(text)};
}

auto titleCase(std::string_view book) -> std::string {
    std::string title;
    title.reserve(book.size());
    bool startOfWord = true;
    for (char ch : book) {
        if (ch == '_')
            ch = ' ';
        auto const uch = static_cast<unsigned char>(ch);
        if (std::isalpha(uch)) {
            title.push_back(static_cast<char>(startOfWord ? std::toupper(uch) : std::tolower(uch)));
            startOfWord = false;
        } else {
            title.push_back(ch);
            startOfWord = true;
        }
    }
    return title;
}

auto defaultContainerId(ClauseNode const& clause) -> std::string {
    std::string book = clause.book;
    std::replace(book.begin(), book.end(), '_', ' ');
    return book + "." + std::to_string(clause.chapter) + "." + std::to_string(clause.verse);
}

auto parseClause(Json const& object, std::size_t index, CorpusLoadOptions const& options) -> Expected<ClauseNode> {
    if (!object.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput,
                                     "clause #" + std::to_string(index) + " is not an object"});
    }

    ClauseNode clause;

    auto id = readInteger(object, index, {"id"}, true);
    if (!id)
        return std::unexpected(id.error());
    clause.id = **id;

    auto slotsStart = readInteger(object, index, {"slotsStart", "slots_start"}, true);
    if (!slotsStart)
        return std::unexpected(slotsStart.error());
    clause.slotsStart = **slotsStart;

    auto slotsEnd = readInteger(object, index, {"slotsEnd", "slots_end"}, false);
    if (!slotsEnd)
        return std::unexpected(slotsEnd.error());
    clause.slotsEnd = slotsEnd->value_or(clause.slotsStart);
    if (clause.slotsEnd < clause.slotsStart) {
        return std::unexpected(malformed(index, "slotsEnd", "is smaller than slotsStart"));
    }

    auto slotCount = readInteger(object, index, {"slotCount", "slot_count"}, false);
    if (!slotCount)
        return std::unexpected(slotCount.error());
    clause.slotCount = slotCount->value_or(0);

    auto mother = readInteger(object, index, {"originalMother", "original_mother", "mother"}, false);
    if (!mother)
        return std::unexpected(mother.error());
    clause.originalMother = *mother;

    auto chapter = readInt32(object, index, {"chapter"});
    if (!chapter)
        return std::unexpected(chapter.error());
    clause.chapter = *chapter;

    auto verse = readInt32(object, index, {"verse"});
    if (!verse)
        return std::unexpected(verse.error());
    clause.verse = *verse;

    auto book = readString(object, index, {"book"});
    if (!book)
        return std::unexpected(book.error());
    if (!*book) {
        return std::unexpected(malformed(index, "book", "is missing"));
    }
    clause.book = std::move(**book);

    auto label = readString(object, index, {"label"});
    if (!label)
        return std::unexpected(label.error());
    clause.label = truncateLabel(label->value_or(std::string{}), options.labelMaxWords);

    auto container = readString(object, index, {"containerId", "container_id"});
    if (!container)
        return std::unexpected(container.error());
    clause.containerId = container->has_value() ? std::move(**container) : defaultContainerId(clause);

    auto kind = readString(object, index, {"kind", "otype"});
    if (!kind)
        return std::unexpected(kind.error());
    if (*kind)
        clause.kind = std::move(**kind);

    struct TagField {
        std::optional<std::string>* target;
        std::string_view            key;
    };
    for (auto const& field : {TagField{&clause.typ, "typ"},
                              TagField{&clause.rela, "rela"},
                              TagField{&clause.code, "code"},
                              TagField{&clause.txt, "txt"},
                              TagField{&clause.domain, "domain"},
                              TagField{&clause.instruction, "instruction"}}) {
        auto value = readString(object, index, {field.key});
        if (!value)
            return std::unexpected(value.error());
        *field.target = std::move(*value);
    }

    if (auto const* functions = findKey(object, {"coreFunctions", "core_functions"});
        functions != nullptr && !functions->is_null()) {
        if (!functions->is_array()) {
            return std::unexpected(malformed(index, "coreFunctions", "must be an array"));
        }
        for (auto const& function : *functions) {
            if (!function.is_string()) {
                return std::unexpected(malformed(index, "coreFunctions", "must contain strings"));
            }
            clause.coreFunctions.push_back(function.get<std::string>());
        }
    }

    auto reference = readString(object, index, {"reference"});
    if (!reference)
        return std::unexpected(reference.error());
    if (*reference)
        clause.reference = std::move(**reference);

    return clause;
}

// "Genesis 1:4a", "Genesis 1:4b", ... in id order within each verse.
void assignMissingReferences(std::vector<ClauseNode>& clauses) {
    std::vector<std::size_t> byId(clauses.size());
    for (std::size_t i = 0; i < clauses.size(); ++i)
        byId[i] = i;
    std::sort(byId.begin(), byId.end(), [&](std::size_t lhs, std::size_t rhs) {
        return clauses[lhs].id < clauses[rhs].id;
    });

    std::map<std::tuple<std::string, int, int>, int> verseCounters;
    for (auto index : byId) {
        auto& clause  = clauses[index];
        auto& counter = verseCounters[{clause.book, clause.chapter, clause.verse}];
        auto  suffix  = static_cast<char>('a' + std::min(counter, 25));
        counter += 1;
        if (!clause.reference.empty())
            continue;
        std::ostringstream oss;
        oss << titleCase(clause.book) << ' ' << clause.chapter << ':' << clause.verse << suffix;
        clause.reference = oss.str();
    }
}

} // namespace

auto truncateLabel(std::string_view label, std::size_t maxWords) -> std::string {
    auto const limit = std::max<std::size_t>(1, maxWords);

    std::vector<std::string> words;
    std::istringstream       stream{std::string{label}};
    for (std::string word; stream >> word;) {
        words.push_back(std::move(word));
    }

    std::string result;
    auto const  kept = std::min(limit, words.size());
    for (std::size_t i = 0; i < kept; ++i) {
        if (i > 0)
            result.push_back(' ');
        result += words[i];
    }
    if (words.size() > limit) {
        result.push_back(' ');
        result.append(Ellipsis);
    }
    return result;
}

auto parseCorpusClauses(std::string_view text, CorpusLoadOptions const& options)
    -> Expected<std::vector<ClauseNode>> {
    auto document = Json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "corpus is not valid JSON"});
    }

    Json const* clauses = nullptr;
    if (document.is_array()) {
        clauses = &document;
    } else if (document.is_object()) {
        clauses = findKey(document, {"clauses", "nodes"});
    }
    if (clauses == nullptr || !clauses->is_array()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "corpus must contain a 'clauses' array"});
    }

    std::vector<ClauseNode> result;
    result.reserve(clauses->size());
    std::size_t index = 0;
    for (auto const& entry : *clauses) {
        auto clause = parseClause(entry, index, options);
        if (!clause) {
            return std::unexpected(clause.error());
        }
        result.push_back(std::move(*clause));
        ++index;
    }
    assignMissingReferences(result);
    return result;
}

auto parseCorpusJson(std::string_view text, CorpusLoadOptions const& options) -> Expected<CorpusSnapshot> {
    auto clauses = parseCorpusClauses(text, options);
    if (!clauses) {
        return std::unexpected(clauses.error());
    }
    return CorpusSnapshot::build(std::move(*clauses));
}

auto loadCorpusJson(std::filesystem::path const& path, CorpusLoadOptions const& options) -> Expected<CorpusSnapshot> {
    auto text = Utils::readTextFile(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    mt_log("Loading corpus fixture " + path.string(), "Corpus", "INFO");
    return parseCorpusJson(*text, options);
}

} // namespace MT
