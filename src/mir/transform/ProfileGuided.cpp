//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the profile-guided pass. Block layout is applied first so that
// the block ids in the profile still name the blocks they were recorded for;
// hot call edges are inlined afterwards with the splice used by the inliner.
//
//===----------------------------------------------------------------------===//

#include "mir/transform/ProfileGuided.hpp"

#include "mir/analysis/CallGraph.hpp"
#include "mir/core/Program.hpp"
#include "mir/profile/ProfileData.hpp"
#include "mir/transform/Inline.hpp"
#include "support/trace.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <set>

using namespace mir::core;

namespace mir::transform
{

const char *toString(InlineDecision decision)
{
    switch (decision)
    {
        case InlineDecision::AlwaysInline:
            return "always-inline";
        case InlineDecision::InlineHot:
            return "inline-hot";
        case InlineDecision::NeverInline:
            return "never-inline";
        case InlineDecision::Default:
            return "default";
    }
    return "default";
}

InlineDecision decideInlining(const profile::ProfileData &profile,
                              const std::string &caller,
                              const std::string &callee,
                              const ProfileConfig &config)
{
    uint64_t calls = 0;
    if (auto it = profile.callCounts.find(caller); it != profile.callCounts.end())
        if (auto edge = it->second.find(callee); edge != it->second.end())
            calls = edge->second;
    const uint64_t callerCount = profile.functionCount(caller);
    const uint64_t calleeCount = profile.functionCount(callee);
    const double frequency =
        callerCount == 0 ? 0.0 : static_cast<double>(calls) / static_cast<double>(callerCount);

    if (calleeCount > config.hotFunction && frequency > 0.8)
        return InlineDecision::AlwaysInline;
    if (calleeCount > config.hotFunction / 2 && frequency > 0.5)
        return InlineDecision::InlineHot;
    if (calleeCount < config.cold || frequency < 0.01)
        return InlineDecision::NeverInline;
    return InlineDecision::Default;
}

BlockLayout decideLayout(const profile::ProfileData &profile,
                         const Function &fn,
                         const ProfileConfig &config)
{
    BlockLayout layout;
    std::map<BlockId, uint64_t> counts;
    if (auto it = profile.blockCounts.find(fn.name); it != profile.blockCounts.end())
        for (const auto &[id, count] : it->second)
            if (fn.findBlock(id))
                counts.emplace(id, count);

    std::vector<BlockId> profiled;
    std::vector<BlockId> unprofiled;
    for (const auto &bb : fn.blocks)
    {
        auto it = counts.find(bb.id);
        if (it == counts.end())
        {
            if (bb.id != fn.entry)
                unprofiled.push_back(bb.id);
            continue;
        }
        profiled.push_back(bb.id);
        if (it->second > config.hotBlock)
            layout.hot.push_back(bb.id);
        else if (it->second < config.cold)
            layout.cold.push_back(bb.id);
    }
    std::stable_sort(profiled.begin(),
                     profiled.end(),
                     [&](BlockId a, BlockId b) { return counts.at(a) > counts.at(b); });
    const std::set<BlockId> cold(layout.cold.begin(), layout.cold.end());

    std::vector<BlockId> base;
    base.push_back(fn.entry);
    for (BlockId b : profiled)
        if (b != fn.entry && !cold.count(b))
            base.push_back(b);
    base.insert(base.end(), unprofiled.begin(), unprofiled.end());
    for (BlockId b : profiled)
        if (b != fn.entry && cold.count(b))
            base.push_back(b);

    std::map<BlockId, BlockId> likelyTarget;
    if (auto it = profile.branches.find(fn.name); it != profile.branches.end())
        for (const auto &[id, branch] : it->second)
        {
            if (branch.probability <= 0.8)
                continue;
            const BasicBlock *bb = fn.findBlock(id);
            const auto *sw = bb ? std::get_if<term::SwitchInt>(&bb->terminator.kind) : nullptr;
            if (!sw || sw->targets.empty())
                continue;
            BlockId target = sw->targets.front();
            if (target != fn.entry && fn.findBlock(target) && !cold.count(target))
                likelyTarget.emplace(id, target);
        }

    std::set<BlockId> placed;
    for (BlockId b : base)
    {
        if (!placed.insert(b).second)
            continue;
        layout.order.push_back(b);
        for (auto it = likelyTarget.find(b); it != likelyTarget.end(); it = likelyTarget.find(it->second))
        {
            if (!placed.insert(it->second).second)
                break;
            layout.order.push_back(it->second);
        }
    }
    return layout;
}

bool applyLayout(Function &fn, const std::vector<BlockId> &order)
{
    std::vector<BlockId> before;
    for (const auto &bb : fn.blocks)
        before.push_back(bb.id);

    std::vector<BlockId> after;
    std::set<BlockId> placed;
    if (fn.findBlock(fn.entry))
    {
        after.push_back(fn.entry);
        placed.insert(fn.entry);
    }
    for (BlockId id : order)
        if (fn.findBlock(id) && placed.insert(id).second)
            after.push_back(id);
    for (BlockId id : before)
        if (placed.insert(id).second)
            after.push_back(id);
    if (after == before)
        return false;

    std::vector<BasicBlock> blocks;
    blocks.reserve(fn.blocks.size());
    for (BlockId id : after)
        blocks.push_back(std::move(*fn.findBlock(id)));
    fn.blocks = std::move(blocks);
    return true;
}

ProfileApplication applyProfile(Program &program,
                                const profile::ProfileData &profile,
                                const ProfileConfig &config,
                                support::DiagnosticEngine *diags)
{
    ProfileApplication out;
    auto warn = [&](const std::string &message)
    {
        out.warnings.push_back(message);
        if (diags)
            diags->warn(message);
    };
    std::set<std::string> reported;
    auto known = [&](const std::string &name)
    {
        if (program.findFunction(name))
            return true;
        if (!program.externalFunctions.count(name) && reported.insert(name).second)
            warn("profile-guided: unknown function '" + name + "'");
        return false;
    };
    auto checkBlocks = [&](const Function &fn, const auto &table)
    {
        for (const auto &entry : table)
            if (!fn.findBlock(entry.first))
                warn("profile-guided: unknown block bb" + std::to_string(entry.first) + " in '" +
                     fn.name + "'");
    };

    for (const auto &[name, count] : profile.functionCounts)
        known(name);
    for (const auto &[name, table] : profile.branches)
        if (known(name))
            checkBlocks(*program.findFunction(name), table);

    for (const auto &[name, table] : profile.blockCounts)
    {
        if (!known(name))
            continue;
        Function &fn = *program.findFunction(name);
        checkBlocks(fn, table);
        BlockLayout layout = decideLayout(profile, fn, config);
        if (applyLayout(fn, layout.order))
        {
            ++out.reorderedFunctions;
            if (support::traceEnabled())
                std::cerr << "[pgo] " << name << ": blocks reordered (" << layout.hot.size()
                          << " hot, " << layout.cold.size() << " cold)\n";
        }
    }

    analysis::CallGraph cg = analysis::CallGraph::build(program);
    for (const auto &[caller, callees] : profile.callCounts)
    {
        for (const auto &[callee, count] : callees)
        {
            InlineDecision decision = decideInlining(profile, caller, callee, config);
            if (decision != InlineDecision::AlwaysInline && decision != InlineDecision::InlineHot)
                continue;
            if (!known(caller) || !known(callee) || caller == callee || cg.isRecursive(callee))
                continue;
            unsigned n = inlineCalls(*program.findFunction(caller),
                                     program,
                                     [&](const std::string &name) { return name == callee; },
                                     diags);
            out.inlinedSites += n;
            if (n > 0 && support::traceEnabled())
                std::cerr << "[pgo] " << caller << " -> " << callee << ": " << toString(decision)
                          << ", " << n << " site(s) inlined\n";
        }
    }

    out.changed = out.reorderedFunctions > 0 || out.inlinedSites > 0;
    return out;
}

std::string_view ProfileGuidedPass::id() const
{
    return "profile-guided";
}

PassResult ProfileGuidedPass::run(Program &program, PassContext &ctx)
{
    if (!ctx.profile)
    {
        ctx.diags.warn("profile-guided: no profile data loaded; pass skipped");
        return PassResult::unchanged();
    }
    return PassResult::from(applyProfile(program, *ctx.profile, config_, &ctx.diags).changed);
}

void registerProfileGuidedPass(PassRegistry &registry, const ProfileConfig *config)
{
    registry.registerProgramPass("profile-guided",
                                 PassRegistry::ProgramPassFactory(
                                     [config]() -> std::unique_ptr<ProgramPass>
                                     {
                                         return std::make_unique<ProfileGuidedPass>(
                                             config ? *config : ProfileConfig{});
                                     }));
}

} // namespace mir::transform
