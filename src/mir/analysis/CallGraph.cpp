//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
/// @file
/// @brief Implements direct-call graph construction and Tarjan's SCC
///        algorithm. Nodes are visited in name order so the component and
///        topological orders are deterministic.
//
//===----------------------------------------------------------------------===//

#include "mir/analysis/CallGraph.hpp"

#include "mir/utils/Uses.hpp"

#include <algorithm>

namespace mir::analysis
{

using namespace core;

namespace
{
const std::set<std::string> kNoNames;

struct TarjanState
{
    const std::map<std::string, std::set<std::string>> &edges;
    const std::set<std::string> &nodes;
    std::map<std::string, unsigned> index;
    std::map<std::string, unsigned> lowlink;
    std::set<std::string> onStack;
    std::vector<std::string> stack;
    std::vector<std::vector<std::string>> components;
    unsigned next = 0;

    void visit(const std::string &v)
    {
        index[v] = lowlink[v] = next++;
        stack.push_back(v);
        onStack.insert(v);

        if (auto it = edges.find(v); it != edges.end())
        {
            for (const auto &w : it->second)
            {
                if (!nodes.count(w))
                    continue;
                if (!index.count(w))
                {
                    visit(w);
                    lowlink[v] = std::min(lowlink[v], lowlink[w]);
                }
                else if (onStack.count(w))
                {
                    lowlink[v] = std::min(lowlink[v], index[w]);
                }
            }
        }

        if (lowlink[v] != index[v])
            return;
        std::vector<std::string> component;
        std::string w;
        do
        {
            w = stack.back();
            stack.pop_back();
            onStack.erase(w);
            component.push_back(w);
        } while (w != v);
        std::sort(component.begin(), component.end());
        components.push_back(std::move(component));
    }
};
} // namespace

CallGraph CallGraph::build(const Program &program)
{
    CallGraph cg;
    for (const auto &[name, fn] : program.functions)
    {
        cg.nodes_.insert(name);
        cg.callees_[name];
        cg.callers_[name];
    }

    for (const auto &[name, fn] : program.functions)
    {
        auto record = [&](const Operand &func, BlockId block, std::optional<size_t> stmt)
        {
            auto callee = util::directCallee(func);
            if (!callee)
            {
                ++cg.indirect_;
                return;
            }
            cg.callees_[name].insert(*callee);
            cg.callers_[*callee].insert(name);
            ++cg.siteCounts_[*callee];
            cg.sites_.push_back(CallSite{name, *callee, block, stmt});
        };
        for (const auto &bb : fn.blocks)
        {
            for (size_t i = 0; i < bb.statements.size(); ++i)
                if (const auto *a = bb.statements[i].asAssign())
                    if (const auto *call = std::get_if<rv::Call>(&a->rvalue))
                        record(call->func, bb.id, i);
            if (const auto *call = std::get_if<term::Call>(&bb.terminator.kind))
                record(call->func, bb.id, std::nullopt);
        }
    }

    cg.computeSccs();
    return cg;
}

void CallGraph::computeSccs()
{
    TarjanState state{callees_, nodes_};
    for (const auto &n : nodes_)
        if (!state.index.count(n))
            state.visit(n);

    sccs_ = std::move(state.components);
    for (size_t i = 0; i < sccs_.size(); ++i)
    {
        for (const auto &name : sccs_[i])
        {
            sccOf_[name] = i;
            topo_.push_back(name);
        }
    }
}

const std::set<std::string> &CallGraph::callees(const std::string &name) const
{
    auto it = callees_.find(name);
    return it == callees_.end() ? kNoNames : it->second;
}

const std::set<std::string> &CallGraph::callers(const std::string &name) const
{
    auto it = callers_.find(name);
    return it == callers_.end() ? kNoNames : it->second;
}

std::optional<size_t> CallGraph::sccIndex(const std::string &name) const
{
    auto it = sccOf_.find(name);
    if (it == sccOf_.end())
        return std::nullopt;
    return it->second;
}

bool CallGraph::isRecursive(const std::string &name) const
{
    if (callees(name).count(name))
        return true;
    auto idx = sccIndex(name);
    return idx && sccs_[*idx].size() > 1;
}

unsigned CallGraph::callSiteCount(const std::string &name) const
{
    auto it = siteCounts_.find(name);
    return it == siteCounts_.end() ? 0 : it->second;
}

std::vector<CallSite> CallGraph::callSitesOf(const std::string &name) const
{
    std::vector<CallSite> out;
    for (const auto &site : sites_)
        if (site.callee == name)
            out.push_back(site);
    return out;
}

std::set<std::string> CallGraph::reachableFrom(const std::vector<std::string> &roots) const
{
    std::set<std::string> seen;
    std::vector<std::string> work;
    for (const auto &r : roots)
        if (nodes_.count(r) && seen.insert(r).second)
            work.push_back(r);
    while (!work.empty())
    {
        std::string cur = work.back();
        work.pop_back();
        for (const auto &callee : callees(cur))
            if (nodes_.count(callee) && seen.insert(callee).second)
                work.push_back(callee);
    }
    return seen;
}

} // namespace mir::analysis
