//===----------------------------------------------------------------------===//
//
// Part of the Shgo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line validity query for SourceLoc.  A location is valid when it names
// a file registered with the SourceManager; line and column are optional.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace shgo::support
{
/// @brief Determine whether the location carries a real source attachment.
/// @return True when the location originated from a tracked script.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}
} // namespace shgo::support
