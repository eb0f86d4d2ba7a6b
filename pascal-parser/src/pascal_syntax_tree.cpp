#include "pascal_syntax_tree.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>

#include "tree_sitter/tree-sitter-pascal.h"

namespace dfixxer::pascal
{
	TreeSitterNode::TreeSitterNode(TSNode node, const TreeSitterNode* parent) :
		_node(node),
		_parent(parent)
	{
		uint32_t count = ts_node_child_count(_node);
		_children.reserve(count);
		for(uint32_t i = 0; i < count; i++)
			_children.push_back(std::make_unique<TreeSitterNode>(ts_node_child(_node, i), this));
	}

	std::string_view TreeSitterNode::kind() const
	{
		return ts_node_type(_node);
	}

	std::size_t TreeSitterNode::start_byte() const
	{
		return ts_node_start_byte(_node);
	}

	std::size_t TreeSitterNode::end_byte() const
	{
		return ts_node_end_byte(_node);
	}

	SourcePoint TreeSitterNode::start_point() const
	{
		TSPoint p = ts_node_start_point(_node);
		return SourcePoint{p.row, p.column};
	}

	SourcePoint TreeSitterNode::end_point() const
	{
		TSPoint p = ts_node_end_point(_node);
		return SourcePoint{p.row, p.column};
	}

	bool TreeSitterNode::has_error() const
	{
		return ts_node_has_error(_node) || ts_node_is_missing(_node);
	}

	const SyntaxNode* TreeSitterNode::child(std::size_t index) const
	{
		if(index >= _children.size())
			throw std::out_of_range("Child index " + std::to_string(index) + " out of range for node " + std::string(kind()));
		return _children[index].get();
	}

	std::unique_ptr<PascalSyntaxTree> PascalSyntaxTree::parse(std::string_view source)
	{
		std::unique_ptr<TSParser, void (*)(TSParser*)> parser(ts_parser_new(), ts_parser_delete);
		if(! ts_parser_set_language(parser.get(), tree_sitter_pascal()))
			return nullptr;

		std::unique_ptr<PascalSyntaxTree> tree(new PascalSyntaxTree());
		tree->_source = std::string(source);
		tree->_tree.reset(ts_parser_parse_string(parser.get(), nullptr, tree->_source.data(),
												 static_cast<uint32_t>(tree->_source.size())));
		if(! tree->_tree)
			return nullptr;

		tree->_root = std::make_unique<TreeSitterNode>(ts_tree_root_node(tree->_tree.get()), nullptr);
		return tree;
	}

	bool PascalSyntaxTree::is_unparseable() const
	{
		bool blank = std::all_of(_source.cbegin(), _source.cend(),
								 [](unsigned char c) { return std::isspace(c); });
		if(blank)
			return false;
		if(_root->kind() == "ERROR")
			return true;
		if(_root->child_count() == 0)
			return false;

		for(std::size_t i = 0; i < _root->child_count(); i++)
		{
			if(_root->child(i)->kind() != "ERROR")
				return false;
		}
		return true;
	}
}
