#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "repertoire/study/study_types.hpp"
#include "repertoire/study/token_sequence.hpp"

namespace repertoire::study
{
  struct BranchNode
  {
    std::string token; // core::END_TOKEN when the line stops here
    std::size_t count{0};
    std::vector<std::string> exampleNames; // ascending, at most MAX_BRANCH_EXAMPLES

    bool isEnd() const;
  };

  struct TreeNode
  {
    BranchNode branch;
    std::size_t position{0}; // ply index the branch token sits at
    std::vector<TreeNode> children;
  };

  struct OpeningTree
  {
    TokenSequence commonPrefix;
    std::vector<TreeNode> roots;
  };

  // Groups lines by their token at `position`. Most common continuation
  // first, ties by ascending token.
  std::vector<BranchNode> branch(const std::vector<OpeningLine> &lines, std::size_t position);

  // Branches after the global common prefix, descending at most maxDepth
  // levels. Only non-END branches shared by more than one line are expanded.
  OpeningTree buildTree(const std::vector<OpeningLine> &lines, std::size_t maxDepth);

} // namespace repertoire::study
