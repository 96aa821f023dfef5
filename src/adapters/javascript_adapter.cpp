#include "cartograph/adapters.hpp"
#include <algorithm>
#include <cstring>

namespace cartograph {

namespace {

// Module path for an import specifier, relative to the importing module
std::string resolve_specifier(const std::string& spec, const std::string& module_path) {
    std::string path = spec;
    for (const char* ext : {".js", ".mjs", ".cjs", ".jsx"}) {
        size_t len = strlen(ext);
        if (path.size() > len && path.compare(path.size() - len, len, ext) == 0) {
            path.erase(path.size() - len);
            break;
        }
    }

    if (path.empty() || path[0] != '.') {
        // Package import: `express`, `@scope/pkg/sub`
        if (!path.empty() && path[0] == '@') path.erase(0, 1);
        std::replace(path.begin(), path.end(), '/', '.');
        return path;
    }

    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= module_path.size()) {
        size_t dot = module_path.find('.', start);
        if (dot == std::string::npos) dot = module_path.size();
        if (dot > start) parts.push_back(module_path.substr(start, dot - start));
        start = dot + 1;
    }
    if (!parts.empty()) parts.pop_back(); // the importing file itself

    start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        std::string segment = path.substr(start, slash - start);
        if (segment == "..") {
            if (!parts.empty()) parts.pop_back();
        } else if (!segment.empty() && segment != ".") {
            parts.push_back(segment);
        }
        start = slash + 1;
    }

    std::string out;
    for (const auto& part : parts) {
        if (!out.empty()) out += ".";
        out += part;
    }
    return out;
}

bool is_function_value(TSNode value) {
    if (ts_node_is_null(value)) return false;
    const char* type = ts_node_type(value);
    return strcmp(type, "arrow_function") == 0 || strcmp(type, "function_expression") == 0 ||
           strcmp(type, "function") == 0 || strcmp(type, "generator_function") == 0;
}

} // namespace

const LanguageAdapter::KindTable& JavaScriptAdapter::kind_table() const {
    static const KindTable table = {
        {"import_statement", NodeKind::Import},
        {"class_declaration", NodeKind::TypeDefinition},
        {"class", NodeKind::TypeDefinition},
        {"function_declaration", NodeKind::FunctionDefinition},
        {"generator_function_declaration", NodeKind::FunctionDefinition},
        {"method_definition", NodeKind::FunctionDefinition},
        {"variable_declarator", NodeKind::FunctionDefinition},
        {"call_expression", NodeKind::Call},
        {"new_expression", NodeKind::Call},
        {"arguments", NodeKind::Arguments},
        {"identifier", NodeKind::Identifier},
        {"shorthand_property_identifier", NodeKind::Identifier},
        {"lexical_declaration", NodeKind::TypedBinding},
        {"variable_declaration", NodeKind::TypedBinding},
        {"arrow_function", NodeKind::Lambda},
        {"function_expression", NodeKind::Lambda},
        {"function", NodeKind::Lambda},
        {"generator_function", NodeKind::Lambda},
        {"string", NodeKind::StringLiteral},
        {"template_string", NodeKind::StringLiteral},
        {"number", NodeKind::Literal},
        {"regex", NodeKind::Literal},
        {"true", NodeKind::Literal},
        {"false", NodeKind::Literal},
        {"null", NodeKind::Literal},
        {"undefined", NodeKind::Literal},
        {"this", NodeKind::Literal},
        {"super", NodeKind::Literal},
    };
    return table;
}

std::vector<ImportEntry> JavaScriptAdapter::read_import(TSNode node, const ParseContext& ctx) const {
    const auto& ast = ctx.ast();
    std::string spec = strip_quotes(ast.node_text(field(node, "source")));
    if (spec.empty()) return {};
    std::string module = resolve_specifier(spec, ctx.module_path());

    std::vector<ImportEntry> entries;
    TSNode clause = first_child_of_type(node, {"import_clause"});
    if (ts_node_is_null(clause)) {
        // Side-effect import
        entries.push_back({last_segment(module), module, false});
        return entries;
    }

    for (TSNode child : named_children(clause)) {
        if (is_type(child, "identifier")) {
            entries.push_back({ast.node_text(child), module, false});
        } else if (is_type(child, "namespace_import")) {
            entries.push_back({ast.node_text(first_child_of_type(child, {"identifier"})), module, false});
        } else if (is_type(child, "named_imports")) {
            for (TSNode spec_node : named_children(child)) {
                if (!is_type(spec_node, "import_specifier")) continue;
                std::string name = ast.node_text(field(spec_node, "name"));
                std::string alias = ast.node_text(field(spec_node, "alias"));
                entries.push_back({alias.empty() ? name : alias, module + "." + name, false});
            }
        }
    }
    return entries;
}

std::vector<ImportEntry> JavaScriptAdapter::import_from_call(TSNode node, const ParseContext& ctx) const {
    const auto& ast = ctx.ast();
    if (!is_type(node, "call_expression")) return {};
    TSNode function = field(node, "function");
    if (!is_type(function, "identifier") || ast.node_text(function) != "require") return {};

    TSNode args = field(node, "arguments");
    TSNode first = ts_node_is_null(args) || ts_node_named_child_count(args) == 0 ? TSNode{}
                                                                                 : ts_node_named_child(args, 0);
    if (!is_type(first, "string")) return {};
    std::string module = resolve_specifier(strip_quotes(ast.node_text(first)), ctx.module_path());
    if (module.empty()) return {};

    std::vector<ImportEntry> entries;
    TSNode parent = ts_node_parent(node);
    TSNode target = is_type(parent, "variable_declarator") ? field(parent, "name") : TSNode{};
    if (is_type(target, "identifier")) {
        entries.push_back({ast.node_text(target), module, false});
    } else if (is_type(target, "object_pattern")) {
        // const { a, b: c } = require('m')
        for (TSNode prop : named_children(target)) {
            if (is_type(prop, "shorthand_property_identifier_pattern")) {
                std::string name = ast.node_text(prop);
                entries.push_back({name, module + "." + name, false});
            } else if (is_type(prop, "pair_pattern")) {
                std::string key = ast.node_text(field(prop, "key"));
                std::string value = ast.node_text(field(prop, "value"));
                entries.push_back({value.empty() ? key : value, module + "." + key, false});
            }
        }
    } else {
        entries.push_back({last_segment(module), module, false});
    }
    return entries;
}

std::optional<Definition> JavaScriptAdapter::describe(TSNode node, const ParseContext& ctx) const {
    const auto& ast = ctx.ast();
    Definition def;
    TSNode body = field(node, "body");
    bool bound = is_type(node, "variable_declarator");

    if (bound) {
        TSNode name = field(node, "name");
        TSNode value = field(node, "value");
        if (!is_type(name, "identifier")) return std::nullopt;
        def.name = ast.node_text(name);
        if (is_type(value, "class")) {
            def.kind = SymbolKind::Class;
            node = value;
        } else if (is_function_value(value)) {
            def.kind = SymbolKind::Function;
            body = field(value, "body");
            node = value;
            if (is_type(value, "arrow_function")) def.metadata["arrow"] = true;
        } else {
            return std::nullopt;
        }
    } else {
        def.name = ast.node_text(field(node, "name"));
        if (def.name.empty()) return std::nullopt;
        def.kind = is_type(node, "class_declaration") || is_type(node, "class") ? SymbolKind::Class
                                                                                : SymbolKind::Function;
    }

    if (def.kind == SymbolKind::Class) {
        TSNode heritage = first_child_of_type(node, {"class_heritage"});
        for (TSNode base : named_children(heritage)) {
            def.bases.push_back(ast.node_text(base));
        }
        def.signature = "class " + def.name;
        if (!ts_node_is_null(heritage)) def.signature += " " + ast.node_text(heritage);
        return def;
    }

    TSNode params = field(node, "parameters");
    if (ts_node_is_null(params)) params = field(node, "parameter");
    json parameters = json::array();
    if (is_type(params, "identifier")) {
        parameters.push_back(ast.node_text(params));
    } else {
        for (TSNode param : named_children(params)) {
            std::string text = ast.node_text(param);
            parameters.push_back(text);
            def.param_types.push_back(text);
        }
    }
    if (!parameters.empty()) def.metadata["parameters"] = parameters;

    std::string header = declaration_header(ast, node, body);
    def.signature = bound ? def.name + " = " + header : header;
    if (is_type(ts_node_child(node, 0), "async")) def.metadata["is_async"] = true;
    return def;
}

std::vector<Binding> JavaScriptAdapter::bindings(TSNode node, NodeKind kind, const ParseContext& ctx) const {
    std::vector<Binding> out;
    const auto& ast = ctx.ast();

    auto constructed = [&](TSNode value) -> std::string {
        if (!is_type(value, "new_expression")) return "";
        return ast.node_text(field(value, "constructor"));
    };

    if (kind == NodeKind::TypedBinding) {
        for (TSNode decl : named_children(node)) {
            if (!is_type(decl, "variable_declarator")) continue;
            TSNode name = field(decl, "name");
            if (!is_type(name, "identifier")) continue;
            out.push_back({ast.node_text(name), constructed(field(decl, "value")), false});
        }
        return out;
    }

    if (kind != NodeKind::TypeDefinition && !is_type(node, "variable_declarator")) return out;

    // `this.x = new X()` anywhere in the class, and `x = new X()` field definitions
    TSNode body = field(node, "body");
    if (is_type(node, "variable_declarator")) body = field(field(node, "value"), "body");
    std::vector<TSNode> stack{body};
    while (!stack.empty()) {
        TSNode current = stack.back();
        stack.pop_back();
        if (ts_node_is_null(current) || is_type(current, "class") || is_type(current, "class_declaration")) continue;

        if (is_type(current, "assignment_expression")) {
            TSNode left = field(current, "left");
            if (is_type(left, "member_expression") && ast.node_text(field(left, "object")) == "this") {
                out.push_back({ast.node_text(field(left, "property")), constructed(field(current, "right")), true});
            }
        } else if (is_type(current, "field_definition")) {
            out.push_back({ast.node_text(field(current, "property")), constructed(field(current, "value")), true});
        }
        for (TSNode child : named_children(current)) stack.push_back(child);
    }
    return out;
}

std::optional<CallTarget> JavaScriptAdapter::call_target(TSNode node, const ParseContext& ctx) const {
    const auto& ast = ctx.ast();
    TSNode callee = is_type(node, "new_expression") ? field(node, "constructor") : field(node, "function");
    if (ts_node_is_null(callee)) return std::nullopt;

    CallTarget target;
    target.callee = ast.node_text(callee);
    TSNode args = field(node, "arguments");
    if (is_type(args, "arguments")) target.arguments.push_back(args);
    return target;
}

} // namespace cartograph
