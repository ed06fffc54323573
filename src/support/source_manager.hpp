//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Maps numeric file identifiers to normalized listing paths.
// Key invariants: File id 0 is invalid; ids are assigned in registration order.
// Ownership/Lifetime: Owns stored path strings; views stay valid for the
//                     manager's lifetime.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace jade::support
{

/// @brief Tracks the `.jbc` listings a run has loaded.
/// @details Registering the same path twice returns the original identifier so
///          diagnostics from a reloaded listing share one file id.
class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id.
    /// @return New file identifier (>0 on success, 0 when the id space is exhausted).
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id, or an empty view when unknown.
    std::string_view getPath(uint32_t file_id) const;

  private:
    std::deque<std::string> files_;
    uint64_t next_file_id_ = 1;
    std::unordered_map<std::string, uint32_t> path_to_id_;
};

} // namespace jade::support
