#include "cartograph/adapters.hpp"
#include <cctype>
#include <cstring>

namespace cartograph {

namespace {

bool looks_like_type(const std::string& name) {
    return !name.empty() && std::isupper(static_cast<unsigned char>(name[0]));
}

// Decorators live on the enclosing decorated_definition
std::vector<std::string> decorators_of(TSNode node, const ParseContext& ctx) {
    std::vector<std::string> out;
    TSNode parent = ts_node_parent(node);
    if (ts_node_is_null(parent) || strcmp(ts_node_type(parent), "decorated_definition") != 0) {
        return out;
    }
    for (uint32_t i = 0; i < ts_node_named_child_count(parent); ++i) {
        TSNode child = ts_node_named_child(parent, i);
        if (strcmp(ts_node_type(child), "decorator") != 0) continue;
        std::string text = ctx.ast().node_text(child);
        if (text.empty() || text[0] != '@') text = "@" + text;
        out.push_back(text);
    }
    return out;
}

} // namespace

const LanguageAdapter::KindTable& PythonAdapter::kind_table() const {
    static const KindTable table = {
        {"import_statement", NodeKind::Import},
        {"import_from_statement", NodeKind::Import},
        {"future_import_statement", NodeKind::Import},
        {"class_definition", NodeKind::TypeDefinition},
        {"function_definition", NodeKind::FunctionDefinition},
        {"call", NodeKind::Call},
        {"argument_list", NodeKind::Arguments},
        {"identifier", NodeKind::Identifier},
        {"assignment", NodeKind::TypedBinding},
        {"lambda", NodeKind::Lambda},
        {"string", NodeKind::StringLiteral},
        {"concatenated_string", NodeKind::StringLiteral},
        {"integer", NodeKind::Literal},
        {"float", NodeKind::Literal},
        {"true", NodeKind::Literal},
        {"false", NodeKind::Literal},
        {"none", NodeKind::Literal},
    };
    return table;
}

std::vector<ImportEntry> PythonAdapter::read_import(TSNode node, const ParseContext& ctx) const {
    std::vector<ImportEntry> entries;
    const auto& ast = ctx.ast();

    auto add_name = [&](TSNode name_node, const std::string& prefix) {
        ImportEntry entry;
        if (is_type(name_node, "aliased_import")) {
            std::string path = ast.node_text(field(name_node, "name"));
            entry.path = prefix.empty() ? path : prefix + "." + path;
            entry.alias = ast.node_text(field(name_node, "alias"));
        } else {
            std::string path = ast.node_text(name_node);
            entry.path = prefix + "." + path;
            entry.alias = last_segment(path);
        }
        if (!entry.path.empty()) entries.push_back(entry);
    };

    if (is_type(node, "import_statement")) {
        for (TSNode child : named_children(node)) {
            if (is_type(child, "dotted_name")) {
                // Plain `import a.b` is addressed by its full path
                ImportEntry entry;
                entry.path = ast.node_text(child);
                entry.alias = entry.path;
                entries.push_back(entry);
            } else if (is_type(child, "aliased_import")) {
                add_name(child, "");
            }
        }
        return entries;
    }

    if (!is_type(node, "import_from_statement")) return entries;

    TSNode module = field(node, "module_name");
    std::string prefix;
    if (is_type(module, "relative_import")) {
        TSNode dots = first_child_of_type(module, {"import_prefix"});
        size_t level = ast.node_text(dots).size();
        std::string base = ctx.package();
        for (size_t i = 1; i < level && !base.empty(); ++i) {
            size_t dot = base.rfind('.');
            base = dot == std::string::npos ? "" : base.substr(0, dot);
        }
        std::string rest = ast.node_text(first_child_of_type(module, {"dotted_name"}));
        prefix = base.empty() ? rest : (rest.empty() ? base : base + "." + rest);
    } else {
        prefix = ast.node_text(module);
    }
    if (prefix.empty()) return entries;

    for (TSNode child : named_children(node)) {
        if (ts_node_eq(child, module)) continue;
        if (is_type(child, "wildcard_import")) {
            ImportEntry entry;
            entry.path = prefix;
            entry.alias = "*";
            entry.wildcard = true;
            entries.push_back(entry);
        } else if (is_type(child, "dotted_name") || is_type(child, "aliased_import")) {
            add_name(child, prefix);
        }
    }
    return entries;
}

std::optional<Definition> PythonAdapter::describe(TSNode node, const ParseContext& ctx) const {
    const auto& ast = ctx.ast();
    TSNode name_node = field(node, "name");
    if (ts_node_is_null(name_node)) return std::nullopt;

    Definition def;
    def.name = ast.node_text(name_node);

    auto decorators = decorators_of(node, ctx);
    if (!decorators.empty()) def.metadata["decorators"] = decorators;

    if (is_type(node, "class_definition")) {
        def.kind = SymbolKind::Class;
        TSNode supers = field(node, "superclasses");
        for (TSNode base : named_children(supers)) {
            if (is_type(base, "identifier") || is_type(base, "attribute") || is_type(base, "subscript")) {
                def.bases.push_back(ast.node_text(base));
            }
        }
        def.signature = "class " + def.name;
        if (!ts_node_is_null(supers)) def.signature += ast.node_text(supers);
        return def;
    }

    def.kind = SymbolKind::Function;
    TSNode params = field(node, "parameters");
    json parameters = json::array();
    for (TSNode param : named_children(params)) {
        std::string name;
        std::string type;
        if (is_type(param, "identifier")) {
            name = ast.node_text(param);
        } else if (is_type(param, "typed_parameter")) {
            name = ast.node_text(first_child_of_type(param, {"identifier"}));
            type = ast.node_text(field(param, "type"));
        } else if (is_type(param, "default_parameter") || is_type(param, "typed_default_parameter")) {
            name = ast.node_text(field(param, "name"));
            type = ast.node_text(field(param, "type"));
        } else {
            continue;
        }
        if (name == "self" || name == "cls") continue;
        parameters.push_back({{"name", name}, {"type", type}});
        def.param_types.push_back(type.empty() ? name : type);
    }
    if (!parameters.empty()) def.metadata["parameters"] = parameters;

    std::string return_type = ast.node_text(field(node, "return_type"));
    if (!return_type.empty()) def.metadata["return_type"] = return_type;
    if (is_type(ts_node_child(node, 0), "async")) def.metadata["is_async"] = true;

    def.signature = "def " + def.name + ast.node_text(params);
    if (!return_type.empty()) def.signature += " -> " + return_type;
    return def;
}

std::vector<Binding> PythonAdapter::bindings(TSNode node, NodeKind kind, const ParseContext& ctx) const {
    std::vector<Binding> out;
    const auto& ast = ctx.ast();

    // Single assignment: `x: T = ...`, `x = T(...)`, `self.x = T(...)`
    auto from_assignment = [&](TSNode assign, bool class_level) {
        TSNode left = field(assign, "left");
        TSNode right = field(assign, "right");
        std::string type = ast.node_text(field(assign, "type"));
        if (type.empty() && is_type(right, "call")) {
            std::string callee = last_segment(ast.node_text(field(right, "function")));
            if (looks_like_type(callee)) type = callee;
        }
        if (type.empty()) return;

        if (is_type(left, "identifier")) {
            out.push_back({ast.node_text(left), type, class_level});
        } else if (is_type(left, "attribute")) {
            TSNode object = field(left, "object");
            if (ast.node_text(object) == "self") {
                out.push_back({ast.node_text(field(left, "attribute")), type, true});
            }
        }
    };

    if (kind == NodeKind::TypedBinding) {
        from_assignment(node, false);
        return out;
    }

    if (is_type(node, "function_definition")) {
        TSNode params = field(node, "parameters");
        for (TSNode param : named_children(params)) {
            std::string name;
            if (is_type(param, "typed_parameter")) {
                name = ast.node_text(first_child_of_type(param, {"identifier"}));
            } else if (is_type(param, "typed_default_parameter")) {
                name = ast.node_text(field(param, "name"));
            } else {
                continue;
            }
            out.push_back({name, ast.node_text(field(param, "type")), false});
        }
        return out;
    }

    if (is_type(node, "class_definition")) {
        // Pre-scan the body for class-level annotations and self.x assignments
        TSNode body = field(node, "body");
        std::vector<std::pair<TSNode, bool>> stack;
        for (TSNode child : named_children(body)) stack.push_back({child, true});
        while (!stack.empty()) {
            auto [current, class_level] = stack.back();
            stack.pop_back();
            if (is_type(current, "class_definition")) continue;
            if (is_type(current, "assignment")) {
                from_assignment(current, class_level);
                continue;
            }
            bool nested_scope = is_type(current, "function_definition");
            bool keep_level = class_level && !nested_scope && is_type(current, "expression_statement");
            for (TSNode child : named_children(current)) stack.push_back({child, keep_level});
        }
    }
    return out;
}

std::optional<CallTarget> PythonAdapter::call_target(TSNode node, const ParseContext& ctx) const {
    TSNode function = field(node, "function");
    if (ts_node_is_null(function)) return std::nullopt;

    CallTarget target;
    target.callee = ctx.ast().node_text(function);
    TSNode args = field(node, "arguments");
    if (!ts_node_is_null(args)) target.arguments.push_back(args);
    return target;
}

} // namespace cartograph
