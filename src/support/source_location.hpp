//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the lightweight source location carried by MIR statements
//          and diagnostics.
// Key invariants: file_id == 0 denotes an unknown location; line/column are
//                 1-based when present.
// Ownership/Lifetime: Value type with no dynamic ownership.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace mir::support
{

/// @brief Position within a source file, as recorded by lowering.
/// @invariant file_id == 0 indicates an unknown location.
struct SourceLoc
{
    /// @brief Identifier assigned by the front end; 0 denotes unknown.
    uint32_t file_id = 0;
    /// @brief One-based line number; 0 when unknown.
    uint32_t line = 0;
    /// @brief One-based column number; 0 when unknown.
    uint32_t column = 0;

    /// @brief Check whether the location references a known file.
    [[nodiscard]] bool isValid() const;

    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }

    bool operator==(const SourceLoc &) const = default;
};

} // namespace mir::support
