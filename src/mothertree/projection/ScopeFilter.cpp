#include "projection/ScopeFilter.hpp"

#include <charconv>
#include <vector>

namespace MT {
namespace {

auto trim(std::string_view text) -> std::string_view {
    auto const first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    auto const last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

auto splitDots(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> parts;
    std::size_t                   start = 0;
    while (true) {
        auto const dot = text.find('.', start);
        if (dot == std::string_view::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

auto parseNumber(std::string_view text) -> std::optional<int> {
    text = trim(text);
    if (!text.empty() && text.front() == '+')
        text.remove_prefix(1);
    int  value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size())
        return std::nullopt;
    return value;
}

auto invalidScope(std::string message) -> Error {
    return Error{Error::Code::InvalidScope, std::move(message)};
}

} // namespace

auto ScopeFilter::matches(ClauseNode const& node) const -> bool {
    if (node.book != book)
        return false;
    if (chapter && node.chapter != *chapter)
        return false;
    if (verseStart) {
        auto const last = verseEnd.value_or(*verseStart);
        if (node.verse < *verseStart || node.verse > last)
            return false;
    }
    return true;
}

auto parseScope(std::string_view text, CorpusSnapshot const& corpus) -> Expected<ScopeFilter> {
    text = trim(text);
    if (text.empty()) {
        return std::unexpected(invalidScope("empty scope"));
    }

    // Parts after the verse are ignored.
    auto const parts = splitDots(text);

    ScopeFilter filter;
    auto        book = corpus.resolveBook(parts[0]);
    if (!book) {
        return std::unexpected(invalidScope("unknown book: " + std::string{parts[0]}));
    }
    filter.book = std::move(*book);

    if (parts.size() >= 2 && !parts[1].empty()) {
        auto chapter = parseNumber(parts[1]);
        if (!chapter)
            return std::unexpected(invalidScope("invalid chapter"));
        filter.chapter = *chapter;
    }

    if (parts.size() >= 3 && !parts[2].empty()) {
        auto const verse = parts[2];
        if (auto dash = verse.find('-'); dash != std::string_view::npos) {
            auto start = parseNumber(verse.substr(0, dash));
            auto end   = parseNumber(verse.substr(dash + 1));
            if (!start || !end)
                return std::unexpected(invalidScope("invalid verse range"));
            if (*end < *start)
                return std::unexpected(invalidScope("invalid verse range ordering"));
            filter.verseStart = *start;
            filter.verseEnd   = *end;
        } else {
            auto single = parseNumber(verse);
            if (!single)
                return std::unexpected(invalidScope("invalid verse"));
            filter.verseStart = *single;
            filter.verseEnd   = *single;
        }
    }
    return filter;
}

} // namespace MT
