#include "cartograph/adapters.hpp"
#include <cctype>
#include <cstring>

namespace cartograph {

namespace {

// `crate::a::b` -> `a.b`; module paths are matched by suffix so the crate
// root prefix carries no information.
std::string normalize_path(std::string path) {
    std::string out;
    out.reserve(path.size());
    for (size_t i = 0; i < path.size(); ++i) {
        if (path[i] == ':' && i + 1 < path.size() && path[i + 1] == ':') {
            out.push_back('.');
            ++i;
        } else if (path[i] != ' ' && path[i] != '\n') {
            out.push_back(path[i]);
        }
    }
    while (!out.empty() && out.front() == '.') out.erase(out.begin());
    for (const char* prefix : {"crate.", "self.", "super."}) {
        size_t len = strlen(prefix);
        while (out.compare(0, len, prefix) == 0) out.erase(0, len);
    }
    return out;
}

std::string join(const std::string& prefix, const std::string& rest) {
    if (prefix.empty()) return rest;
    if (rest.empty()) return prefix;
    return prefix + "." + rest;
}

// Attributes directly above an item: #[get("/")], #[derive(..)]
std::vector<std::string> attributes_of(TSNode node, const LanguageParser& ast) {
    std::vector<std::string> attrs;
    TSNode prev = ts_node_prev_named_sibling(node);
    while (!ts_node_is_null(prev)) {
        const char* type = ts_node_type(prev);
        if (strcmp(type, "attribute_item") == 0) {
            attrs.insert(attrs.begin(), ast.node_text(prev));
        } else if (strcmp(type, "line_comment") != 0 && strcmp(type, "block_comment") != 0) {
            break;
        }
        prev = ts_node_prev_named_sibling(prev);
    }
    return attrs;
}

} // namespace

const LanguageAdapter::KindTable& RustAdapter::kind_table() const {
    static const KindTable table = {
        {"use_declaration", NodeKind::Import},
        {"struct_item", NodeKind::TypeDefinition},
        {"enum_item", NodeKind::TypeDefinition},
        {"union_item", NodeKind::TypeDefinition},
        {"trait_item", NodeKind::TypeDefinition},
        {"impl_item", NodeKind::TypeDefinition},
        {"function_item", NodeKind::FunctionDefinition},
        {"function_signature_item", NodeKind::FunctionDefinition},
        {"mod_item", NodeKind::ModuleDefinition},
        {"call_expression", NodeKind::Call},
        {"arguments", NodeKind::Arguments},
        {"identifier", NodeKind::Identifier},
        {"let_declaration", NodeKind::TypedBinding},
        {"closure_expression", NodeKind::Lambda},
        {"string_literal", NodeKind::StringLiteral},
        {"raw_string_literal", NodeKind::StringLiteral},
        {"integer_literal", NodeKind::Literal},
        {"float_literal", NodeKind::Literal},
        {"boolean_literal", NodeKind::Literal},
        {"char_literal", NodeKind::Literal},
        {"self", NodeKind::Literal},
    };
    return table;
}

std::vector<ImportEntry> RustAdapter::read_import(TSNode node, const ParseContext& ctx) const {
    const auto& ast = ctx.ast();
    std::vector<ImportEntry> entries;

    // Expand use trees: a::{b, c::d as e, f::*}
    std::vector<std::pair<TSNode, std::string>> stack;
    stack.push_back({field(node, "argument"), ""});
    while (!stack.empty()) {
        auto [current, prefix] = stack.back();
        stack.pop_back();
        if (ts_node_is_null(current)) continue;

        if (is_type(current, "use_as_clause")) {
            ImportEntry entry;
            entry.path = join(prefix, normalize_path(ast.node_text(field(current, "path"))));
            entry.alias = ast.node_text(field(current, "alias"));
            if (!entry.path.empty()) entries.push_back(entry);
        } else if (is_type(current, "use_wildcard")) {
            std::string text = ast.node_text(current);
            size_t star = text.rfind("::*");
            ImportEntry entry;
            entry.path = join(prefix, normalize_path(star == std::string::npos ? "" : text.substr(0, star)));
            entry.alias = "*";
            entry.wildcard = true;
            if (!entry.path.empty()) entries.push_back(entry);
        } else if (is_type(current, "scoped_use_list")) {
            std::string path = join(prefix, normalize_path(ast.node_text(field(current, "path"))));
            stack.push_back({field(current, "list"), path});
        } else if (is_type(current, "use_list")) {
            auto children = named_children(current);
            for (auto it = children.rbegin(); it != children.rend(); ++it) stack.push_back({*it, prefix});
        } else if (is_type(current, "self")) {
            // `use a::{self}` imports the module itself
            if (!prefix.empty()) entries.push_back({last_segment(prefix), prefix, false});
        } else {
            ImportEntry entry;
            entry.path = join(prefix, normalize_path(ast.node_text(current)));
            entry.alias = last_segment(entry.path);
            if (!entry.path.empty()) entries.push_back(entry);
        }
    }
    return entries;
}

std::optional<Definition> RustAdapter::describe(TSNode node, const ParseContext& ctx) const {
    const auto& ast = ctx.ast();
    Definition def;

    auto attrs = attributes_of(node, ast);
    if (!attrs.empty()) def.metadata["attributes"] = attrs;
    if (!ts_node_is_null(first_child_of_type(node, {"visibility_modifier"}))) def.metadata["public"] = true;

    if (is_type(node, "impl_item")) {
        std::string type = strip_generics(ast.node_text(field(node, "type")));
        type = last_segment(normalize_path(type));
        if (type.empty()) return std::nullopt;
        def.name = type;
        def.kind = SymbolKind::Impl;
        def.member_scope = type;
        def.metadata["impl_type"] = type;
        std::string trait = ast.node_text(field(node, "trait"));
        if (!trait.empty()) {
            def.bases.push_back(normalize_path(trait));
            def.metadata["trait"] = trait;
        }
        def.signature = declaration_header(ast, node, field(node, "body"));
        return def;
    }

    def.name = ast.node_text(field(node, "name"));
    if (def.name.empty()) return std::nullopt;

    if (is_type(node, "mod_item")) {
        if (ts_node_is_null(field(node, "body"))) return std::nullopt;
        def.kind = SymbolKind::Module;
        def.signature = "mod " + def.name;
        return def;
    }

    if (is_type(node, "function_item") || is_type(node, "function_signature_item")) {
        def.kind = SymbolKind::Function;
        json parameters = json::array();
        for (TSNode param : named_children(field(node, "parameters"))) {
            if (is_type(param, "self_parameter")) {
                def.metadata["has_self"] = true;
                continue;
            }
            if (!is_type(param, "parameter")) continue;
            std::string type = ast.node_text(field(param, "type"));
            parameters.push_back({{"name", ast.node_text(field(param, "pattern"))}, {"type", type}});
            def.param_types.push_back(type);
        }
        if (!parameters.empty()) def.metadata["parameters"] = parameters;
        std::string return_type = ast.node_text(field(node, "return_type"));
        if (!return_type.empty()) def.metadata["return_type"] = return_type;
        def.signature = declaration_header(ast, node, field(node, "body"));
        return def;
    }

    if (is_type(node, "trait_item")) {
        def.kind = SymbolKind::Trait;
        TSNode bounds = field(node, "bounds");
        for (TSNode bound : named_children(bounds)) {
            if (is_type(bound, "type_identifier") || is_type(bound, "scoped_type_identifier")) {
                def.bases.push_back(normalize_path(ast.node_text(bound)));
            }
        }
    } else if (is_type(node, "enum_item")) {
        def.kind = SymbolKind::Enum;
    } else {
        def.kind = SymbolKind::Struct;
    }
    def.signature = declaration_header(ast, node, field(node, "body"));
    return def;
}

std::vector<Binding> RustAdapter::bindings(TSNode node, NodeKind kind, const ParseContext& ctx) const {
    std::vector<Binding> out;
    const auto& ast = ctx.ast();

    if (kind == NodeKind::TypedBinding) {
        TSNode pattern = field(node, "pattern");
        if (!is_type(pattern, "identifier")) return out;
        std::string type = ast.node_text(field(node, "type"));
        if (type.empty()) {
            TSNode value = field(node, "value");
            if (is_type(value, "call_expression")) {
                // Foo::new(..) / Foo::with_x(..)
                std::string callee = normalize_path(ast.node_text(field(value, "function")));
                size_t dot = callee.rfind('.');
                if (dot != std::string::npos) type = last_segment(callee.substr(0, dot));
            } else if (is_type(value, "struct_expression")) {
                type = last_segment(normalize_path(ast.node_text(field(value, "name"))));
            }
        }
        if (!type.empty() && !std::isupper(static_cast<unsigned char>(strip_generics(type)[0]))) type.clear();
        out.push_back({ast.node_text(pattern), type, false});
        return out;
    }

    if (kind == NodeKind::FunctionDefinition) {
        for (TSNode param : named_children(field(node, "parameters"))) {
            if (!is_type(param, "parameter")) continue;
            TSNode pattern = field(param, "pattern");
            if (!is_type(pattern, "identifier")) continue;
            out.push_back({ast.node_text(pattern), ast.node_text(field(param, "type")), false});
        }
        return out;
    }

    if (is_type(node, "struct_item")) {
        for (TSNode member : named_children(field(node, "body"))) {
            if (!is_type(member, "field_declaration")) continue;
            out.push_back({ast.node_text(field(member, "name")), ast.node_text(field(member, "type")), true});
        }
    }
    return out;
}

std::optional<CallTarget> RustAdapter::call_target(TSNode node, const ParseContext& ctx) const {
    TSNode function = field(node, "function");
    if (ts_node_is_null(function)) return std::nullopt;

    CallTarget target;
    target.callee = ctx.ast().node_text(function);
    TSNode args = field(node, "arguments");
    if (!ts_node_is_null(args)) target.arguments.push_back(args);
    return target;
}

} // namespace cartograph
