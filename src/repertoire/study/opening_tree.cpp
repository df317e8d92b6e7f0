#include "repertoire/study/opening_tree.hpp"

#include <algorithm>
#include <map>

#include "repertoire/constants.hpp"

namespace repertoire::study
{
  namespace
  {
    std::string tokenAt(const OpeningLine &line, std::size_t position)
    {
      return position < line.tokens.size() ? line.tokens[position] : std::string(core::END_TOKEN);
    }

    std::vector<TreeNode> grow(const std::vector<OpeningLine> &lines, std::size_t position, std::size_t depth)
    {
      std::vector<TreeNode> nodes;
      if (depth == 0)
        return nodes;

      for (auto &br : branch(lines, position))
      {
        TreeNode node;
        node.position = position;

        if (!br.isEnd() && br.count > 1 && depth > 1)
        {
          std::vector<OpeningLine> sub;
          sub.reserve(br.count);
          for (const auto &ln : lines)
            if (tokenAt(ln, position) == br.token)
              sub.push_back(ln);
          node.children = grow(sub, position + 1, depth - 1);
        }

        node.branch = std::move(br);
        nodes.push_back(std::move(node));
      }
      return nodes;
    }
  } // namespace

  bool BranchNode::isEnd() const
  {
    return token == core::END_TOKEN;
  }

  std::vector<BranchNode> branch(const std::vector<OpeningLine> &lines, std::size_t position)
  {
    std::map<std::string, std::vector<std::string>> buckets;
    for (const auto &ln : lines)
      buckets[tokenAt(ln, position)].push_back(ln.name);

    std::vector<BranchNode> out;
    out.reserve(buckets.size());
    for (auto &[token, names] : buckets)
    {
      std::sort(names.begin(), names.end());

      BranchNode node;
      node.token = token;
      node.count = names.size();
      const auto keep = std::min(names.size(), core::MAX_BRANCH_EXAMPLES);
      node.exampleNames.assign(names.begin(), names.begin() + static_cast<std::ptrdiff_t>(keep));
      out.push_back(std::move(node));
    }

    std::stable_sort(out.begin(), out.end(), [](const BranchNode &a, const BranchNode &b)
                     {
      if (a.count != b.count)
        return a.count > b.count;
      return a.token < b.token; });
    return out;
  }

  OpeningTree buildTree(const std::vector<OpeningLine> &lines, std::size_t maxDepth)
  {
    OpeningTree tree;
    if (lines.empty())
      return tree;

    std::vector<TokenSequence> seqs;
    seqs.reserve(lines.size());
    for (const auto &ln : lines)
      seqs.push_back(ln.tokens);

    tree.commonPrefix = longestCommonPrefix(seqs);
    tree.roots = grow(lines, tree.commonPrefix.size(), maxDepth);
    return tree;
  }

} // namespace repertoire::study
