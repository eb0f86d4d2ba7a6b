#include "ast_print.hpp"

using namespace dfixxer;

void print_tree_elt(std::ostream& out, const std::string_view elt_title, const std::string_view elt_value, const int level, const std::string lead)
{
    std::string title = "";
    for(int i = 0; i < level; i++)
        title += "| ";
    title += lead;
    title += elt_title;

    if(elt_value == "")
        out << title << std::endl;
    else
        out << fmt::format("{:.<70s}: {}",title,elt_value) << std::endl;
}

static std::string escape_leaf(std::string_view text)
{
    std::string ret;
    for(char c : text)
    {
        switch(c)
        {
            case '\n': ret += "\\n"; break;
            case '\r': ret += "\\r"; break;
            case '\t': ret += "\\t"; break;
            default: ret += c;
        }
    }
    return ret;
}

void print_pascal_cst(std::ostream& out, const pascal::SyntaxNode* node, std::string_view source, int level)
{
    std::string title(node->kind());
    if(node->has_error() && node->kind() != "ERROR")
        title += " [ERROR]";

    if(node->is_leaf())
    {
        print_tree_elt(out, title, escape_leaf(node->text(source)), level, "-");
        return;
    }

    print_tree_elt(out, title, "", level, ">");
    for(std::size_t i = 0; i < node->child_count(); i++)
    {
        const pascal::SyntaxNode* next = node->child(i);
        if(next != nullptr)
            print_pascal_cst(out, next, source, level + 1);
    }
}
