// include/quill/views/text_view.hpp
// @brief Paints the visible window of a buffer in highlight colours.
// @invariant Only bytes inside the cursor's viewport are emitted.
// @ownership TextView borrows the buffer and cursor; both must outlive it.
#pragma once

#include "quill/render/display_sink.hpp"
#include "quill/text/buffer.hpp"
#include "quill/text/cursor.hpp"

namespace quill::views
{

/// @brief Column where text starts, leaving room for the '~' gutter.
inline constexpr int kMarginCols = 2;
/// @brief Row where text starts, below the header and a spacer row.
inline constexpr int kMarginRows = 2;

/// @brief Stateless painter for the editing area.
class TextView
{
  public:
    TextView(const text::Buffer &buffer, const text::Cursor &cursor);

    /// @brief Draw every viewport row: the gutter mark and the visible slice.
    /// @details Consecutive bytes sharing a colour are printed as one run.
    void paint(render::DisplaySink &sink) const;

    /// @brief Screen cell of the cursor, margin included.
    [[nodiscard]] text::Position cursorScreenPosition() const;

  private:
    void paintLine(render::DisplaySink &sink, std::size_t lineIndex, int row) const;

    const text::Buffer &buffer_;
    const text::Cursor &cursor_;
};

} // namespace quill::views
