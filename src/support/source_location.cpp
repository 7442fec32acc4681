//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line validity query for SourceLoc.  Locations synthesized by passes
// (cloned or hoisted statements keep their original location, fresh ones get
// the default) report as invalid so printers can omit them.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace mir::support
{

/// @brief Determine whether the location carries a real source attachment.
/// @return True when the location originated from a tracked source file.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}

} // namespace mir::support
