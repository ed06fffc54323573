//===----------------------------------------------------------------------===//
//
// Part of the Jade project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bc/ClassInfo.hpp
// Purpose: Class metadata consumed by the VM: declared fields and the source
//          file the class came from.
// Key invariants: Field names are unique within a class.
// Ownership/Lifetime: Value types owned by the suite.
// Links: docs/jbc-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bc/Instr.hpp"
#include "bc/Type.hpp"

#include <optional>
#include <string>
#include <vector>

namespace jade::bc
{

/// @brief One declared field; static fields may carry an initial constant.
struct FieldInfo
{
    std::string name;
    Type type;
    bool isStatic = false;
    std::optional<Constant> value;
};

struct ClassInfo
{
    std::string name;
    std::optional<std::string> sourceFile;
    std::vector<FieldInfo> fields;

    /// @brief Find field @p fieldName, or nullptr.
    const FieldInfo *findField(std::string_view fieldName) const
    {
        for (const auto &f : fields)
        {
            if (f.name == fieldName)
                return &f;
        }
        return nullptr;
    }
};

} // namespace jade::bc
