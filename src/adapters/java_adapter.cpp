#include "cartograph/adapters.hpp"
#include <cstring>

namespace cartograph {

namespace {

// Annotations and modifier keywords from a `modifiers` child
void read_modifiers(TSNode node, const LanguageParser& ast, Definition& def) {
    TSNode mods = TSNode{};
    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_child(node, i);
        if (strcmp(ts_node_type(child), "modifiers") == 0) {
            mods = child;
            break;
        }
    }
    if (ts_node_is_null(mods)) return;

    json annotations = json::array();
    json modifiers = json::array();
    uint32_t mod_count = ts_node_child_count(mods);
    for (uint32_t i = 0; i < mod_count; ++i) {
        TSNode child = ts_node_child(mods, i);
        const char* type = ts_node_type(child);
        if (strcmp(type, "annotation") == 0 || strcmp(type, "marker_annotation") == 0) {
            annotations.push_back(ast.node_text(child));
        } else if (!ts_node_is_named(child)) {
            modifiers.push_back(ast.node_text(child));
        }
    }
    if (!annotations.empty()) def.metadata["annotations"] = annotations;
    if (!modifiers.empty()) def.metadata["modifiers"] = modifiers;
}

} // namespace

const LanguageAdapter::KindTable& JavaAdapter::kind_table() const {
    static const KindTable table = {
        {"package_declaration", NodeKind::Package},
        {"import_declaration", NodeKind::Import},
        {"class_declaration", NodeKind::TypeDefinition},
        {"interface_declaration", NodeKind::TypeDefinition},
        {"enum_declaration", NodeKind::TypeDefinition},
        {"record_declaration", NodeKind::TypeDefinition},
        {"annotation_type_declaration", NodeKind::TypeDefinition},
        {"method_declaration", NodeKind::FunctionDefinition},
        {"constructor_declaration", NodeKind::FunctionDefinition},
        {"method_invocation", NodeKind::Call},
        {"object_creation_expression", NodeKind::Call},
        {"argument_list", NodeKind::Arguments},
        {"identifier", NodeKind::Identifier},
        {"local_variable_declaration", NodeKind::TypedBinding},
        {"lambda_expression", NodeKind::Lambda},
        {"string_literal", NodeKind::StringLiteral},
        {"text_block", NodeKind::StringLiteral},
        {"decimal_integer_literal", NodeKind::Literal},
        {"hex_integer_literal", NodeKind::Literal},
        {"decimal_floating_point_literal", NodeKind::Literal},
        {"character_literal", NodeKind::Literal},
        {"true", NodeKind::Literal},
        {"false", NodeKind::Literal},
        {"null_literal", NodeKind::Literal},
        {"this", NodeKind::Literal},
        {"super", NodeKind::Literal},
    };
    return table;
}

std::string JavaAdapter::package_name(TSNode node, const ParseContext& ctx) const {
    TSNode name = first_child_of_type(node, {"scoped_identifier", "identifier"});
    return ctx.ast().node_text(name);
}

std::vector<ImportEntry> JavaAdapter::read_import(TSNode node, const ParseContext& ctx) const {
    TSNode name = first_child_of_type(node, {"scoped_identifier", "identifier"});
    if (ts_node_is_null(name)) return {};

    ImportEntry entry;
    entry.path = ctx.ast().node_text(name);
    entry.wildcard = !ts_node_is_null(first_child_of_type(node, {"asterisk"}));
    entry.alias = entry.wildcard ? "*" : last_segment(entry.path);
    return {entry};
}

std::optional<Definition> JavaAdapter::describe(TSNode node, const ParseContext& ctx) const {
    const auto& ast = ctx.ast();
    TSNode name_node = field(node, "name");
    if (ts_node_is_null(name_node)) return std::nullopt;

    Definition def;
    def.name = ast.node_text(name_node);
    read_modifiers(node, ast, def);
    TSNode body = field(node, "body");
    def.signature = declaration_header(ast, node, body);

    if (is_type(node, "method_declaration") || is_type(node, "constructor_declaration")) {
        def.kind = SymbolKind::Function;
        json parameters = json::array();
        for (TSNode param : named_children(field(node, "parameters"))) {
            if (!is_type(param, "formal_parameter") && !is_type(param, "spread_parameter")) continue;
            std::string type = ast.node_text(field(param, "type"));
            if (type.empty()) type = ast.node_text(first_child_of_type(param, {"type_identifier", "generic_type"}));
            std::string name = ast.node_text(field(param, "name"));
            if (name.empty()) name = ast.node_text(first_child_of_type(param, {"variable_declarator"}));
            parameters.push_back({{"name", name}, {"type", type}});
            def.param_types.push_back(type);
        }
        if (!parameters.empty()) def.metadata["parameters"] = parameters;
        std::string return_type = ast.node_text(field(node, "type"));
        if (!return_type.empty()) def.metadata["return_type"] = return_type;
        if (is_type(node, "constructor_declaration")) def.metadata["constructor"] = true;
        return def;
    }

    if (is_type(node, "interface_declaration") || is_type(node, "annotation_type_declaration")) {
        def.kind = SymbolKind::Interface;
    } else if (is_type(node, "enum_declaration")) {
        def.kind = SymbolKind::Enum;
    } else {
        def.kind = SymbolKind::Class;
        if (is_type(node, "record_declaration")) def.metadata["record"] = true;
    }

    // superclass, super_interfaces, extends_interfaces all wrap plain types
    std::vector<TSNode> stack;
    for (TSNode child : named_children(node)) {
        if (is_type(child, "superclass") || is_type(child, "super_interfaces") ||
            is_type(child, "extends_interfaces")) {
            stack.push_back(child);
        }
    }
    while (!stack.empty()) {
        TSNode current = stack.back();
        stack.pop_back();
        if (is_type(current, "type_identifier") || is_type(current, "scoped_type_identifier") ||
            is_type(current, "generic_type")) {
            def.bases.push_back(ast.node_text(current));
            continue;
        }
        auto children = named_children(current);
        for (auto it = children.rbegin(); it != children.rend(); ++it) stack.push_back(*it);
    }
    return def;
}

std::vector<Binding> JavaAdapter::bindings(TSNode node, NodeKind kind, const ParseContext& ctx) const {
    std::vector<Binding> out;
    const auto& ast = ctx.ast();

    // `Type a = ..., b = ...;` with `var` falling back to the constructed type
    auto declarators = [&](TSNode decl, bool member) {
        std::string type = ast.node_text(field(decl, "type"));
        for (TSNode child : named_children(decl)) {
            if (!is_type(child, "variable_declarator")) continue;
            std::string declared = type;
            if (declared == "var") {
                TSNode value = field(child, "value");
                declared = is_type(value, "object_creation_expression") ? ast.node_text(field(value, "type")) : "";
            }
            out.push_back({ast.node_text(field(child, "name")), declared, member});
        }
    };

    if (kind == NodeKind::TypedBinding) {
        declarators(node, false);
        return out;
    }

    if (kind == NodeKind::FunctionDefinition) {
        for (TSNode param : named_children(field(node, "parameters"))) {
            if (!is_type(param, "formal_parameter")) continue;
            out.push_back({ast.node_text(field(param, "name")), ast.node_text(field(param, "type")), false});
        }
        return out;
    }

    // Fields, record components and enum bodies are members of the type
    for (TSNode param : named_children(field(node, "parameters"))) {
        if (!is_type(param, "formal_parameter")) continue;
        out.push_back({ast.node_text(field(param, "name")), ast.node_text(field(param, "type")), true});
    }
    TSNode body = field(node, "body");
    for (TSNode member : named_children(body)) {
        if (is_type(member, "field_declaration") || is_type(member, "constant_declaration")) {
            declarators(member, true);
        } else if (is_type(member, "enum_body_declarations")) {
            for (TSNode inner : named_children(member)) {
                if (is_type(inner, "field_declaration")) declarators(inner, true);
            }
        }
    }
    return out;
}

std::optional<CallTarget> JavaAdapter::call_target(TSNode node, const ParseContext& ctx) const {
    const auto& ast = ctx.ast();
    CallTarget target;

    if (is_type(node, "object_creation_expression")) {
        target.callee = ast.node_text(field(node, "type"));
    } else {
        std::string name = ast.node_text(field(node, "name"));
        if (name.empty()) return std::nullopt;
        TSNode object = field(node, "object");
        target.callee = ts_node_is_null(object) ? name : ast.node_text(object) + "." + name;
    }
    if (target.callee.empty()) return std::nullopt;

    TSNode args = field(node, "arguments");
    if (!ts_node_is_null(args)) target.arguments.push_back(args);
    return target;
}

} // namespace cartograph
