#pragma once

#include <cstddef>
#include <string_view>

namespace dfixxer::pascal
{
    /**
     * @brief Row/column position in a source text. Both values are 0-based and
     * the column is counted in bytes.
     */
    struct SourcePoint
    {
        std::size_t row;
        std::size_t column;
    };

    /**
     * @brief Read-only view of a concrete syntax tree node.
     *
     * The section extractor only walks the tree through this interface, so any
     * parser able to expose {kind, span, error flag, children, parent} can feed it.
     */
    class SyntaxNode
    {
    public:
        virtual ~SyntaxNode() = default;

        virtual std::string_view kind() const = 0;

        virtual std::size_t start_byte() const = 0;
        virtual std::size_t end_byte() const = 0;
        virtual SourcePoint start_point() const = 0;
        virtual SourcePoint end_point() const = 0;

        /**
         * @brief True if this node or any of its descendants holds a syntax error.
         */
        virtual bool has_error() const = 0;

        virtual std::size_t child_count() const = 0;
        virtual const SyntaxNode* child(std::size_t index) const = 0;
        virtual const SyntaxNode* parent() const = 0;

        inline bool is_leaf() const { return child_count() == 0; };
        inline std::string_view text(std::string_view source) const 
        {
            return source.substr(start_byte(), end_byte() - start_byte());
        };
    };
}
