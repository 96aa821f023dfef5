#include "cartograph/adapters.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>

namespace cartograph {

namespace {

bool one_of(TSNode node, std::initializer_list<const char*> types) {
    if (ts_node_is_null(node)) return false;
    const char* type = ts_node_type(node);
    for (const char* t : types) {
        if (strcmp(type, t) == 0) return true;
    }
    return false;
}

TSNode direct_child(TSNode node, std::initializer_list<const char*> types) {
    if (ts_node_is_null(node)) return TSNode{};
    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_child(node, i);
        if (one_of(child, types)) return child;
    }
    return TSNode{};
}

// Name leaf, whichever grammar produced the tree
TSNode name_of(TSNode node) {
    return direct_child(node, {"identifier", "simple_identifier", "type_identifier"});
}

TSNode type_of(TSNode node) {
    return direct_child(node, {"user_type", "nullable_type", "type", "function_type", "non_nullable_type"});
}

// First user_type (or bare type identifier) below a node
TSNode find_user_type(TSNode node) {
    std::vector<TSNode> stack{node};
    while (!stack.empty()) {
        TSNode current = stack.back();
        stack.pop_back();
        if (one_of(current, {"user_type", "type_identifier"})) return current;
        uint32_t count = ts_node_named_child_count(current);
        for (uint32_t i = count; i > 0; --i) stack.push_back(ts_node_named_child(current, i - 1));
    }
    return TSNode{};
}

// Type named by a constructor call used as an initializer: `Foo(...)`
std::string constructed_type(TSNode value, const LanguageParser& ast) {
    if (!one_of(value, {"call_expression"})) return "";
    TSNode callee = ts_node_named_child(value, 0);
    if (!one_of(callee, {"identifier", "simple_identifier"})) return "";
    std::string name = ast.node_text(callee);
    return !name.empty() && std::isupper(static_cast<unsigned char>(name[0])) ? name : "";
}

} // namespace

const LanguageAdapter::KindTable& KotlinAdapter::kind_table() const {
    static const KindTable table = {
        {"package_header", NodeKind::Package},
        {"import", NodeKind::Import},
        {"import_header", NodeKind::Import},
        {"class_declaration", NodeKind::TypeDefinition},
        {"object_declaration", NodeKind::TypeDefinition},
        {"companion_object", NodeKind::TypeDefinition},
        {"function_declaration", NodeKind::FunctionDefinition},
        {"call_expression", NodeKind::Call},
        {"value_arguments", NodeKind::Arguments},
        {"identifier", NodeKind::Identifier},
        {"simple_identifier", NodeKind::Identifier},
        {"property_declaration", NodeKind::TypedBinding},
        {"lambda_literal", NodeKind::Lambda},
        {"annotated_lambda", NodeKind::Lambda},
        {"anonymous_function", NodeKind::Lambda},
        {"string_literal", NodeKind::StringLiteral},
        {"line_string_literal", NodeKind::StringLiteral},
        {"multi_line_string_literal", NodeKind::StringLiteral},
        {"integer_literal", NodeKind::Literal},
        {"long_literal", NodeKind::Literal},
        {"hex_literal", NodeKind::Literal},
        {"real_literal", NodeKind::Literal},
        {"boolean_literal", NodeKind::Literal},
        {"character_literal", NodeKind::Literal},
        {"null_literal", NodeKind::Literal},
        {"this_expression", NodeKind::Literal},
        {"super_expression", NodeKind::Literal},
    };
    return table;
}

std::string KotlinAdapter::package_name(TSNode node, const ParseContext& ctx) const {
    return ctx.ast().node_text(direct_child(node, {"qualified_identifier", "identifier"}));
}

std::vector<ImportEntry> KotlinAdapter::read_import(TSNode node, const ParseContext& ctx) const {
    const auto& ast = ctx.ast();
    TSNode path = direct_child(node, {"qualified_identifier", "identifier"});
    if (ts_node_is_null(path)) return {};

    ImportEntry entry;
    entry.path = ast.node_text(path);
    std::string text = trim(ast.node_text(node));
    entry.wildcard = !ts_node_is_null(direct_child(node, {"wildcard_import"})) ||
                     (!text.empty() && text.back() == '*');

    // kotlin-ng: `as` is followed by a bare identifier; fwcd wraps it in import_alias
    std::string alias;
    TSNode alias_node = direct_child(node, {"import_alias"});
    if (!ts_node_is_null(alias_node)) {
        alias = ast.node_text(name_of(alias_node));
    } else if (is_type(path, "qualified_identifier")) {
        alias = ast.node_text(direct_child(node, {"identifier"}));
    }
    entry.alias = entry.wildcard ? "*" : (alias.empty() ? last_segment(entry.path) : alias);
    return {entry};
}

std::optional<Definition> KotlinAdapter::describe(TSNode node, const ParseContext& ctx) const {
    const auto& ast = ctx.ast();
    Definition def;
    def.name = ast.node_text(name_of(node));
    if (def.name.empty()) {
        if (!is_type(node, "companion_object")) return std::nullopt;
        def.name = "Companion";
    }

    json annotations = json::array();
    std::vector<std::string> modifiers;
    TSNode mods = direct_child(node, {"modifiers"});
    uint32_t mod_count = ts_node_is_null(mods) ? 0 : ts_node_named_child_count(mods);
    for (uint32_t i = 0; i < mod_count; ++i) {
        TSNode mod = ts_node_named_child(mods, i);
        if (is_type(mod, "annotation")) {
            std::string text = ast.node_text(mod);
            if (text.empty() || text[0] != '@') text = "@" + text;
            annotations.push_back(text);
        } else {
            std::istringstream words(ast.node_text(mod));
            std::string word;
            while (words >> word) modifiers.push_back(word);
        }
    }
    if (!annotations.empty()) def.metadata["annotations"] = annotations;
    if (!modifiers.empty()) def.metadata["modifiers"] = modifiers;

    if (is_type(node, "function_declaration")) {
        def.kind = SymbolKind::Function;
        TSNode params = direct_child(node, {"function_value_parameters"});
        json parameters = json::array();
        for (TSNode param : named_children(params)) {
            if (!is_type(param, "parameter")) continue;
            std::string name = ast.node_text(name_of(param));
            std::string type = ast.node_text(type_of(param));
            parameters.push_back({{"name", name}, {"type", type}});
            def.param_types.push_back(type);
        }
        if (!parameters.empty()) def.metadata["parameters"] = parameters;

        // Return type follows the parameter list
        if (!ts_node_is_null(params)) {
            TSNode next = ts_node_next_named_sibling(params);
            if (one_of(next, {"user_type", "nullable_type", "type", "function_type"})) {
                def.metadata["return_type"] = ast.node_text(next);
            }
        }
        def.signature = declaration_header(ast, node, direct_child(node, {"function_body"}));
        return def;
    }

    bool is_interface = false;
    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        if (is_type(ts_node_child(node, i), "interface")) is_interface = true;
    }
    bool is_enum = std::find(modifiers.begin(), modifiers.end(), "enum") != modifiers.end() ||
                   !ts_node_is_null(direct_child(node, {"enum_class_body"}));
    if (is_interface) {
        def.kind = SymbolKind::Interface;
    } else if (is_enum) {
        def.kind = SymbolKind::Enum;
    } else {
        def.kind = SymbolKind::Class;
    }
    if (is_type(node, "object_declaration")) def.metadata["is_object"] = true;
    if (is_type(node, "companion_object")) def.metadata["is_companion"] = true;

    // delegation_specifiers (kotlin-ng) or delegation_specifier children (fwcd)
    std::vector<TSNode> specifiers;
    for (TSNode child : named_children(node)) {
        if (is_type(child, "delegation_specifier")) {
            specifiers.push_back(child);
        } else if (is_type(child, "delegation_specifiers")) {
            for (TSNode spec : named_children(child)) specifiers.push_back(spec);
        }
    }
    for (TSNode spec : specifiers) {
        std::string base = ast.node_text(find_user_type(spec));
        if (!base.empty()) def.bases.push_back(base);
    }

    def.signature = declaration_header(ast, node, direct_child(node, {"class_body", "enum_class_body"}));
    return def;
}

std::vector<Binding> KotlinAdapter::bindings(TSNode node, NodeKind kind, const ParseContext& ctx) const {
    std::vector<Binding> out;
    const auto& ast = ctx.ast();

    auto property = [&](TSNode prop, bool member) {
        TSNode var = direct_child(prop, {"variable_declaration"});
        if (ts_node_is_null(var)) return;
        std::string name = ast.node_text(name_of(var));
        std::string type = ast.node_text(type_of(var));
        if (type.empty()) {
            // `val x = Foo()`: the initializer follows the `=` token
            uint32_t count = ts_node_named_child_count(prop);
            for (uint32_t i = 0; i < count && type.empty(); ++i) {
                type = constructed_type(ts_node_named_child(prop, i), ast);
            }
        }
        out.push_back({name, type, member});
    };

    if (kind == NodeKind::TypedBinding) {
        property(node, ctx.inside_type());
        return out;
    }

    if (kind == NodeKind::FunctionDefinition) {
        for (TSNode param : named_children(direct_child(node, {"function_value_parameters"}))) {
            if (!is_type(param, "parameter")) continue;
            out.push_back({ast.node_text(name_of(param)), ast.node_text(type_of(param)), false});
        }
        return out;
    }

    // Primary constructor parameters and body properties belong to the type
    TSNode ctor = direct_child(node, {"primary_constructor"});
    std::vector<TSNode> params;
    for (TSNode child : named_children(ctor)) {
        if (is_type(child, "class_parameter")) {
            params.push_back(child);
        } else if (is_type(child, "class_parameters")) {
            for (TSNode p : named_children(child)) {
                if (is_type(p, "class_parameter")) params.push_back(p);
            }
        }
    }
    for (TSNode param : params) {
        out.push_back({ast.node_text(name_of(param)), ast.node_text(type_of(param)), true});
    }
    for (TSNode member : named_children(direct_child(node, {"class_body", "enum_class_body"}))) {
        if (is_type(member, "property_declaration")) property(member, true);
    }
    return out;
}

std::optional<CallTarget> KotlinAdapter::call_target(TSNode node, const ParseContext& ctx) const {
    if (ts_node_named_child_count(node) == 0) return std::nullopt;
    TSNode callee = ts_node_named_child(node, 0);

    CallTarget target;
    target.callee = ctx.ast().node_text(callee);
    if (target.callee.empty()) return std::nullopt;

    TSNode args = direct_child(node, {"value_arguments"});
    if (ts_node_is_null(args)) {
        args = direct_child(direct_child(node, {"call_suffix"}), {"value_arguments"});
    }
    if (!ts_node_is_null(args)) target.arguments.push_back(args);
    return target;
}

} // namespace cartograph
