//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Profile-guided optimization: call-edge inline decisions and hot/cold block
// layout derived from execution counts, applied as real inlining and block
// reordering.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mir/transform/PassRegistry.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mir::profile
{
struct ProfileData;
} // namespace mir::profile

namespace mir::transform
{

struct ProfileConfig
{
    /// Function count above which a callee is hot.
    uint64_t hotFunction = 1000;

    /// Block count above which a block is hot.
    uint64_t hotBlock = 500;

    /// Count below which a function or block is cold.
    uint64_t cold = 10;
};

enum class InlineDecision
{
    AlwaysInline,
    InlineHot,
    NeverInline,
    Default,
};

const char *toString(InlineDecision decision);

/// @brief Classify the call edge @p caller -> @p callee.
/// @details The call frequency is the edge count divided by the caller's
///          count (0 when the caller never ran).
InlineDecision decideInlining(const profile::ProfileData &profile,
                              const std::string &caller,
                              const std::string &callee,
                              const ProfileConfig &config = {});

struct BlockLayout
{
    std::vector<core::BlockId> order;
    std::vector<core::BlockId> hot;
    std::vector<core::BlockId> cold;
};

/// @brief Hot-first layout of @p fn.
/// @details The entry stays first. Profiled blocks follow by descending
///          count, then unprofiled blocks in their current order, then cold
///          blocks. A block whose branch is taken with probability above 0.8
///          is followed directly by its first SwitchInt target.
BlockLayout decideLayout(const profile::ProfileData &profile,
                         const core::Function &fn,
                         const ProfileConfig &config = {});

/// @brief Permute the blocks of @p fn into @p order; blocks missing from
///        @p order keep their relative order at the end.
bool applyLayout(core::Function &fn, const std::vector<core::BlockId> &order);

struct ProfileApplication
{
    bool changed = false;
    unsigned inlinedSites = 0;
    unsigned reorderedFunctions = 0;
    std::vector<std::string> warnings;
};

/// @brief Apply layout and inline decisions of @p profile to @p program.
/// @details Decisions naming functions or blocks the program does not have
///          become warnings.
ProfileApplication applyProfile(core::Program &program,
                                const profile::ProfileData &profile,
                                const ProfileConfig &config = {},
                                support::DiagnosticEngine *diags = nullptr);

class ProfileGuidedPass : public ProgramPass
{
  public:
    explicit ProfileGuidedPass(ProfileConfig config = {}) : config_(config) {}

    std::string_view id() const override;

    PassResult run(core::Program &program, PassContext &ctx) override;

  private:
    ProfileConfig config_;
};

void registerProfileGuidedPass(PassRegistry &registry, const ProfileConfig *config);

} // namespace mir::transform
