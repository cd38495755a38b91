//===----------------------------------------------------------------------===//
//
// Part of the Quill project, under the GNU GPL v3.
// SPDX-License-Identifier: GPL-3.0-only
//
//===----------------------------------------------------------------------===//
//
// File: src/text/storage.cpp
// Purpose: Filesystem and in-memory implementations of the storage
//          collaborator.
// Key invariants: A successful write leaves exactly the provided bytes behind;
//                 there is no atomic rename and no partial-write recovery.
// Ownership/Lifetime: FileStorage holds no state; MemoryStorage owns its map.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "quill/text/storage.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace quill::text
{

namespace
{
std::string lastErrorMessage()
{
    const int err = errno;
    if (err == 0)
        return "unknown I/O error";
    return std::error_code(err, std::generic_category()).message();
}
} // namespace

/// @brief Slurp the whole file in binary mode so offsets stay raw bytes.
support::Expected<std::string> FileStorage::read(const std::string &path)
{
    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return support::makeError(path, "cannot open for reading: " + lastErrorMessage());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
    {
        return support::makeError(path, "read failed: " + lastErrorMessage());
    }
    return ss.str();
}

/// @brief Create or truncate @p path, then write @p bytes in one go.
support::Expected<void> FileStorage::write(const std::string &path, std::string_view bytes)
{
    errno = 0;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        return support::makeError(path, "cannot open for writing: " + lastErrorMessage());
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out)
    {
        return support::makeError(path, "write failed: " + lastErrorMessage());
    }
    return {};
}

support::Expected<std::string> MemoryStorage::read(const std::string &path)
{
    auto it = files_.find(path);
    if (it == files_.end())
    {
        return support::makeError(path, "no such file");
    }
    return it->second;
}

support::Expected<void> MemoryStorage::write(const std::string &path, std::string_view bytes)
{
    auto ro = readOnly_.find(path);
    if (ro != readOnly_.end() && ro->second)
    {
        return support::makeError(path, "permission denied");
    }
    files_[path] = std::string(bytes);
    return {};
}

void MemoryStorage::put(std::string path, std::string bytes)
{
    files_[std::move(path)] = std::move(bytes);
}

void MemoryStorage::denyWrites(std::string path)
{
    readOnly_[std::move(path)] = true;
}

} // namespace quill::text
