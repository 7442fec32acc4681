//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file mir/transform/AnalysisIDs.hpp
/// @brief Named constants for the analysis identifiers registered by the
///        PassManager.
///
/// @details Analysis results are cached in the @ref AnalysisManager under a
///          string key. A misspelled literal would miss the cache on every
///          query, so passes spell keys through these constants instead.
///
//===----------------------------------------------------------------------===//

#pragma once

namespace mir::transform
{

//===----------------------------------------------------------------------===//
// Function-level analysis identifiers
//===----------------------------------------------------------------------===//

/// @see mir::analysis::CFGInfo
inline constexpr const char *kAnalysisCFG = "cfg";

/// @see mir::analysis::DomTree
inline constexpr const char *kAnalysisDominators = "dominators";

/// @see mir::analysis::LoopForest
inline constexpr const char *kAnalysisLoops = "loops";

/// @see mir::dataflow::LivenessResult
inline constexpr const char *kAnalysisLiveness = "liveness";

//===----------------------------------------------------------------------===//
// Program-level analysis identifiers
//===----------------------------------------------------------------------===//

/// @see mir::analysis::CallGraph
inline constexpr const char *kAnalysisCallGraph = "call-graph";

/// @see mir::analysis::SummaryMap
inline constexpr const char *kAnalysisEffects = "effects";

} // namespace mir::transform
