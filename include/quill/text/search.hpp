//===----------------------------------------------------------------------===//
//
// Part of the Quill project, under the GNU GPL v3.
// SPDX-License-Identifier: GPL-3.0-only
//
//===----------------------------------------------------------------------===//
//
// File: include/quill/text/search.hpp
// Purpose: Incremental phrase search: indexes every non-overlapping match of
//          a phrase and cycles through them.
// Key invariants: results() is ordered by line then column; index() is a valid
//                 position in results() whenever results() is non-empty.
// Ownership/Lifetime: SearchData owns its match list; buffers are borrowed.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "quill/text/cursor.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace quill::text
{

class Buffer;

/// @brief Match index for the phrase currently being searched.
class SearchData
{
  public:
    /// @brief Rescan @p buffer for @p phrase and overlay the matches.
    /// @details Retokenizes first so a previous overlay disappears; an empty
    ///          phrase therefore clears both the results and the overlay.
    /// @return Start of the first match, if any.
    std::optional<Position> findResults(std::string_view phrase, Buffer &buffer);

    /// @brief Advance to the next match, wrapping after the last.
    std::optional<Position> next();

    /// @brief Step back to the previous match, wrapping before the first.
    std::optional<Position> previous();

    [[nodiscard]] const std::vector<Position> &results() const
    {
        return results_;
    }

    [[nodiscard]] std::size_t index() const
    {
        return index_;
    }

  private:
    std::vector<Position> results_;
    std::size_t index_{0};
};

} // namespace quill::text
