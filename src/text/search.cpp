// src/text/search.cpp
// @brief Phrase search over a buffer with cyclic navigation.
// @invariant Matches within a line never overlap; scanning resumes after each match.
// @ownership SearchData owns only its result list.

#include "quill/text/search.hpp"

#include "quill/text/buffer.hpp"

namespace quill::text
{

std::optional<Position> SearchData::findResults(std::string_view phrase, Buffer &buffer)
{
    buffer.retokenize();

    results_.clear();
    index_ = 0;
    if (phrase.empty())
    {
        return std::nullopt;
    }

    for (std::size_t row = 0; row < buffer.lineCount(); ++row)
    {
        std::size_t start = 0;
        while (auto col = buffer.findPhrase(phrase, row, start))
        {
            results_.push_back({*col, row});
            start = *col + phrase.size();
        }
    }

    for (const auto &match : results_)
    {
        buffer.markSearchResult(match.y, match.x, phrase.size());
    }

    if (results_.empty())
    {
        return std::nullopt;
    }
    return results_.front();
}

std::optional<Position> SearchData::next()
{
    if (results_.empty())
    {
        return std::nullopt;
    }
    index_ = (index_ + 1) % results_.size();
    return results_[index_];
}

std::optional<Position> SearchData::previous()
{
    if (results_.empty())
    {
        return std::nullopt;
    }
    index_ = (index_ + results_.size() - 1) % results_.size();
    return results_[index_];
}

} // namespace quill::text
