#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "tree_sitter/api.h"

#include "syntax_node.hpp"

namespace dfixxer::pascal
{
    /**
     * @brief SyntaxNode view of a tree-sitter node.
     *
     * Children are wrapped once when the tree is built so that child() and
     * parent() hand out stable pointers. The wrapped TSNode stays valid as long
     * as the owning PascalSyntaxTree lives.
     */
    class TreeSitterNode : public SyntaxNode
    {
    protected:
        TSNode _node;
        const TreeSitterNode* _parent;
        std::vector<std::unique_ptr<TreeSitterNode>> _children;

    public:
        TreeSitterNode(TSNode node, const TreeSitterNode* parent);

        std::string_view kind() const override;
        std::size_t start_byte() const override;
        std::size_t end_byte() const override;
        SourcePoint start_point() const override;
        SourcePoint end_point() const override;
        bool has_error() const override;
        std::size_t child_count() const override { return _children.size(); };
        const SyntaxNode* child(std::size_t index) const override;
        const SyntaxNode* parent() const override { return _parent; };
    };

    /**
     * @brief Owner of a source text and of the tree-sitter-pascal tree built from it.
     */
    class PascalSyntaxTree
    {
    protected:
        struct TreeDeleter
        {
            void operator()(TSTree* tree) const { ts_tree_delete(tree); };
        };

        std::string _source;
        std::unique_ptr<TSTree, TreeDeleter> _tree;
        std::unique_ptr<TreeSitterNode> _root;

        PascalSyntaxTree() = default;

    public:
        /**
         * @brief Parse @p source with the Pascal grammar.
         * @return The tree, or nullptr when tree-sitter could not load the
         * grammar or produce a tree at all.
         */
        static std::unique_ptr<PascalSyntaxTree> parse(std::string_view source);

        inline const SyntaxNode& root() const { return *_root; };
        inline std::string_view source() const { return _source; };

        /**
         * @brief True when the text is not blank and nothing in it could be recognized.
         */
        bool is_unparseable() const;
    };
}
