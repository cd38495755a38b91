//===----------------------------------------------------------------------===//
//
// Part of the Quill project, under the GNU GPL v3.
// SPDX-License-Identifier: GPL-3.0-only
//
//===----------------------------------------------------------------------===//
//
// File: include/quill/text/storage.hpp
// Purpose: Storage collaborator used by the buffer to read and persist
//          documents, with a filesystem and an in-memory implementation.
// Key invariants: write() leaves the target holding exactly the given bytes;
//                 failures are reported, never retried.
// Ownership/Lifetime: Storage objects are borrowed by buffers and editors.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "quill/support/expected.hpp"

#include <map>
#include <string>
#include <string_view>

namespace quill::text
{

/// @brief Abstract byte-level document store.
class Storage
{
  public:
    virtual ~Storage() = default;

    /// @brief Read the entire document at @p path.
    virtual support::Expected<std::string> read(const std::string &path) = 0;

    /// @brief Replace the document at @p path with @p bytes, creating it if absent.
    virtual support::Expected<void> write(const std::string &path, std::string_view bytes) = 0;
};

/// @brief Storage backed by the local filesystem.
class FileStorage final : public Storage
{
  public:
    support::Expected<std::string> read(const std::string &path) override;
    support::Expected<void> write(const std::string &path, std::string_view bytes) override;
};

/// @brief Storage keeping documents in a map; used headless and in tests.
class MemoryStorage final : public Storage
{
  public:
    support::Expected<std::string> read(const std::string &path) override;
    support::Expected<void> write(const std::string &path, std::string_view bytes) override;

    /// @brief Seed or overwrite a document.
    void put(std::string path, std::string bytes);

    /// @brief Make every subsequent write to @p path fail.
    void denyWrites(std::string path);

    [[nodiscard]] const std::map<std::string, std::string> &files() const
    {
        return files_;
    }

  private:
    std::map<std::string, std::string> files_;
    std::map<std::string, bool> readOnly_;
};

} // namespace quill::text
