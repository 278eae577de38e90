// src/io/AtomicFile.h
//
// Durable, atomic file writes and whole-file reads.
//
//  - Data is written to a sibling "<final>.tmp", flushed and closed, then
//    renamed over the destination. rename() within one directory replaces
//    the target atomically on POSIX and NTFS, so readers see either the old
//    file or the complete new one.
//  - Parent directories are created as needed.

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace fractal::io {

namespace fs = std::filesystem;

/// Atomically replace `final_path` with `bytes`.
/// @return true on success; false on error (with `err` populated if provided).
[[nodiscard]] bool write_atomic(const fs::path& final_path,
                                std::string_view bytes,
                                std::string* err = nullptr);

/// Read the entire file at `path` into `out`.
[[nodiscard]] bool read_all(const fs::path& path,
                            std::string& out,
                            std::string* err = nullptr);

/// Sibling temp path used by write_atomic: "<final>.tmp".
[[nodiscard]] inline fs::path temp_path_for(const fs::path& final_path)
{
    fs::path p = final_path;
    p += ".tmp";
    return p;
}

} // namespace fractal::io
