//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Direct-call graph over a MIR program. Edges come from Call rvalues and Call
// terminators whose callee operand names a function; indirect calls are
// counted but produce no edge. Strongly-connected components (Tarjan) give
// recursion detection, and their emission order yields a topological order
// with callees before callers.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mir/core/Program.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mir::analysis
{

/// @brief One direct call site.
struct CallSite
{
    std::string caller;
    std::string callee;
    core::BlockId block = 0;
    std::optional<size_t> statement; ///< Statement index; empty for a Call terminator.
};

/// @brief Direct-call graph of a program.
class CallGraph
{
  public:
    /// @brief Scan every function of @p program.
    static CallGraph build(const core::Program &program);

    /// @brief Functions and external names called directly by @p name.
    [[nodiscard]] const std::set<std::string> &callees(const std::string &name) const;

    /// @brief Functions that call @p name directly.
    [[nodiscard]] const std::set<std::string> &callers(const std::string &name) const;

    /// @brief Strongly-connected components, callees' components first.
    [[nodiscard]] const std::vector<std::vector<std::string>> &sccs() const
    {
        return sccs_;
    }

    /// @brief Program functions with callees before callers; every
    ///        component is contiguous.
    [[nodiscard]] const std::vector<std::string> &topoOrder() const
    {
        return topo_;
    }

    /// @brief Index into sccs() of the component holding @p name.
    [[nodiscard]] std::optional<size_t> sccIndex(const std::string &name) const;

    /// @brief Self-recursive or part of a cycle.
    [[nodiscard]] bool isRecursive(const std::string &name) const;

    /// @brief Number of direct call sites targeting @p name.
    [[nodiscard]] unsigned callSiteCount(const std::string &name) const;

    [[nodiscard]] const std::vector<CallSite> &callSites() const
    {
        return sites_;
    }

    /// @brief Call sites whose callee is @p name, in caller/layout order.
    [[nodiscard]] std::vector<CallSite> callSitesOf(const std::string &name) const;

    /// @brief Program functions reachable from @p roots, roots included.
    [[nodiscard]] std::set<std::string> reachableFrom(const std::vector<std::string> &roots) const;

    /// @brief Number of calls through a non-constant callee operand.
    [[nodiscard]] unsigned indirectCallCount() const
    {
        return indirect_;
    }

  private:
    void computeSccs();

    std::set<std::string> nodes_;
    std::map<std::string, std::set<std::string>> callees_;
    std::map<std::string, std::set<std::string>> callers_;
    std::map<std::string, unsigned> siteCounts_;
    std::vector<CallSite> sites_;
    std::vector<std::vector<std::string>> sccs_;
    std::map<std::string, size_t> sccOf_;
    std::vector<std::string> topo_;
    unsigned indirect_ = 0;
};

} // namespace mir::analysis
