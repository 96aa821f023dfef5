#include "cartograph/parser.hpp"
#include "cartograph/adapters.hpp"
#include "cartograph/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace cartograph {

LanguageParser::LanguageParser(const TSLanguage *grammar) {
    parser_ = ts_parser_new();
    if (!parser_) {
        throw std::runtime_error("Failed to create tree-sitter parser");
    }

    if (!grammar || !ts_parser_set_language(parser_, grammar)) {
        ts_parser_delete(parser_);
        parser_ = nullptr;
        throw std::runtime_error("Failed to set parser language");
    }
}

LanguageParser::~LanguageParser() {
    if (tree_) ts_tree_delete(tree_);
    if (parser_) ts_parser_delete(parser_);
}

LanguageParser::LanguageParser(LanguageParser&& other) noexcept
    : parser_(other.parser_)
    , tree_(other.tree_)
    , source_(std::move(other.source_)) {
    other.parser_ = nullptr;
    other.tree_ = nullptr;
}

LanguageParser& LanguageParser::operator=(LanguageParser&& other) noexcept {
    if (this != &other) {
        if (tree_) ts_tree_delete(tree_);
        if (parser_) ts_parser_delete(parser_);

        parser_ = other.parser_;
        tree_ = other.tree_;
        source_ = std::move(other.source_);

        other.parser_ = nullptr;
        other.tree_ = nullptr;
    }
    return *this;
}

bool LanguageParser::parse(const std::string& source) {
    source_ = source;

    if (tree_) {
        ts_tree_delete(tree_);
        tree_ = nullptr;
    }

    tree_ = ts_parser_parse_string(parser_, nullptr, source_.c_str(),
                                   static_cast<uint32_t>(source_.size()));
    return tree_ != nullptr;
}

TSNode LanguageParser::root() const {
    if (!tree_) {
        return TSNode{};
    }
    return ts_tree_root_node(tree_);
}

std::string LanguageParser::node_text(TSNode node) const {
    if (ts_node_is_null(node)) return "";
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (start < source_.size() && end <= source_.size() && start <= end) {
        return source_.substr(start, end - start);
    }
    return "";
}

double LanguageParser::error_ratio() const {
    if (!tree_) return 1.0;
    TSNode top = root();
    if (!ts_node_has_error(top)) return 0.0;

    uint64_t broken = 0;
    std::vector<TSNode> stack{top};
    while (!stack.empty()) {
        TSNode current = stack.back();
        stack.pop_back();

        if (ts_node_is_error(current)) {
            broken += ts_node_end_byte(current) - ts_node_start_byte(current);
            continue;
        }
        if (ts_node_is_missing(current)) {
            broken += 1;
            continue;
        }
        if (!ts_node_has_error(current)) continue;

        uint32_t child_count = ts_node_child_count(current);
        for (uint32_t i = 0; i < child_count; ++i) {
            stack.push_back(ts_node_child(current, i));
        }
    }
    size_t total = std::max<size_t>(source_.size(), 1);
    return std::min(1.0, static_cast<double>(broken) / static_cast<double>(total));
}

// ============ Free helpers ============

std::string build_param_signature(const std::vector<std::string>& param_types) {
    if (param_types.empty()) {
        return "()";
    }

    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < param_types.size(); ++i) {
        if (i > 0) oss << ", ";
        std::string type = param_types[i];
        size_t start = type.find_first_not_of(" \t\n");
        size_t end = type.find_last_not_of(" \t\n");
        if (start != std::string::npos && end != std::string::npos) {
            type = type.substr(start, end - start + 1);
        }
        // Normalize whitespace runs
        std::string compact;
        bool space = false;
        for (char c : type) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                space = true;
                continue;
            }
            if (space && !compact.empty()) compact.push_back(' ');
            space = false;
            compact.push_back(c);
        }
        oss << compact;
    }
    oss << ")";
    return oss.str();
}

std::string module_path_for(const std::string& relative_path) {
    std::string path = relative_path;
    size_t slash = path.find_last_of("/\\");
    size_t dot = path.rfind('.');
    if (dot != std::string::npos && (slash == std::string::npos || dot > slash + 1)) {
        path.erase(dot);
    }
    std::replace(path.begin(), path.end(), '\\', '/');
    std::replace(path.begin(), path.end(), '/', '.');
    while (!path.empty() && path.front() == '.') path.erase(path.begin());
    return path;
}

std::vector<std::string> split_callee(const std::string& callee) {
    // Drop everything nested in (), [], {} and <> so only the navigation path remains
    std::string cleaned;
    cleaned.reserve(callee.size());
    int depth = 0;
    int angle = 0;
    char quote = 0;
    for (size_t i = 0; i < callee.size(); ++i) {
        char c = callee[i];
        if (quote) {
            if (c == '\\') { ++i; continue; }
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '"' || c == '\'' || c == '`') {
            quote = c;
            continue;
        }
        if (c == '(' || c == '[' || c == '{') { ++depth; continue; }
        if (c == ')' || c == ']' || c == '}') { if (depth > 0) --depth; continue; }
        if (depth > 0) continue;
        if (c == '<') { ++angle; continue; }
        if (c == '>') { if (angle > 0) --angle; continue; }
        if (angle > 0) continue;
        cleaned.push_back(c);
    }

    std::vector<std::string> segments;
    std::string current;
    auto flush = [&]() {
        if (!current.empty()) segments.push_back(current);
        current.clear();
    };
    for (size_t i = 0; i < cleaned.size(); ++i) {
        char c = cleaned[i];
        if (c == '.' || c == ':') {
            flush();
        } else if (c == '?' || c == '!' || c == ' ' || c == '\t' || c == '\n' || c == '\r' ||
                   c == '&' || c == '*' || c == '@') {
            continue;
        } else {
            current.push_back(c);
        }
    }
    flush();
    return segments;
}

// ============ ParseContext ============

ParseContext::ParseContext(const LanguageParser& ast, std::string module_path)
    : ast_(ast), module_path_(std::move(module_path)) {
    size_t dot = module_path_.rfind('.');
    package_ = dot == std::string::npos ? "" : module_path_.substr(0, dot);
    out_.module_path = module_path_;
}

std::string ParseContext::lookup_binding(const std::string& name) const {
    for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
        auto found = it->bindings.find(name);
        if (found != it->bindings.end()) return found->second;
    }
    auto members = type_members_.find(enclosing_type());
    if (members != type_members_.end()) {
        auto found = members->second.find(name);
        if (found != members->second.end()) return found->second;
    }
    return "";
}

std::string ParseContext::enclosing_type() const {
    for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
        if (it->is_type) return it->member_prefix;
    }
    return "";
}

bool ParseContext::inside_type() const {
    return !frames_.empty() && frames_.back().is_type;
}

std::string ParseContext::unique_qualified_name(const std::string& base,
                                                const std::vector<std::string>& param_types) {
    if (used_names_.emplace(base, 1).second) return base;

    // Overload: first definition keeps the plain name, later ones carry their signature
    if (!param_types.empty()) {
        std::string with_sig = base + build_param_signature(param_types);
        if (used_names_.emplace(with_sig, 1).second) return with_sig;
    }
    int& n = used_names_[base];
    while (true) {
        ++n;
        std::string candidate = base + "#" + std::to_string(n);
        if (used_names_.emplace(candidate, 1).second) return candidate;
    }
}

// ============ LanguageAdapter ============

NodeKind LanguageAdapter::classify(TSNode node) const {
    if (ts_node_is_null(node)) return NodeKind::Other;
    const auto& table = kind_table();
    auto it = table.find(ts_node_type(node));
    return it == table.end() ? NodeKind::Other : it->second;
}

std::string LanguageAdapter::package_name(TSNode, const ParseContext&) const { return ""; }

std::vector<ImportEntry> LanguageAdapter::import_from_call(TSNode, const ParseContext&) const {
    return {};
}

bool LanguageAdapter::is_reserved_word(std::string_view word) const {
    static const std::unordered_set<std::string_view> reserved = {
        "true", "false", "null", "this", "it", "super", "self", "Self",
        "None", "True", "False", "undefined", "nil", "_"};
    return reserved.count(word) > 0;
}

TSNode LanguageAdapter::field(TSNode node, const char* name) {
    if (ts_node_is_null(node)) return TSNode{};
    return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(strlen(name)));
}

bool LanguageAdapter::is_type(TSNode node, const char* type) {
    return !ts_node_is_null(node) && strcmp(ts_node_type(node), type) == 0;
}

TSNode LanguageAdapter::first_child_of_type(TSNode node, std::initializer_list<const char*> types) {
    if (ts_node_is_null(node)) return TSNode{};
    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_child(node, i);
        const char* child_type = ts_node_type(child);
        for (const char* t : types) {
            if (strcmp(child_type, t) == 0) return child;
        }
    }
    return TSNode{};
}

std::vector<TSNode> LanguageAdapter::named_children(TSNode node) {
    std::vector<TSNode> out;
    if (ts_node_is_null(node)) return out;
    uint32_t count = ts_node_named_child_count(node);
    out.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        out.push_back(ts_node_named_child(node, i));
    }
    return out;
}

std::string LanguageAdapter::declaration_header(const LanguageParser& ast, TSNode node, TSNode body) {
    std::string text = ast.node_text(node);
    if (!ts_node_is_null(body)) {
        text = text.substr(0, ts_node_start_byte(body) - ts_node_start_byte(node));
    }
    // Drop leading annotations so the signature starts at the declaration
    size_t start = 0;
    while (start < text.size() && text[start] == '@') {
        size_t depth = 0;
        size_t i = start;
        for (; i < text.size(); ++i) {
            char c = text[i];
            if (c == '(') ++depth;
            else if (c == ')' && depth > 0) --depth;
            else if ((c == '\n' || c == ' ') && depth == 0) break;
        }
        start = text.find_first_not_of(" \t\r\n", i);
        if (start == std::string::npos) return "";
    }
    text = text.substr(start);
    std::string compact;
    bool space = false;
    for (char c : text) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            space = true;
            continue;
        }
        if (space && !compact.empty()) compact.push_back(' ');
        space = false;
        compact.push_back(c);
    }
    return compact;
}

std::string LanguageAdapter::strip_generics(std::string type) {
    size_t lt = type.find('<');
    if (lt != std::string::npos) type.erase(lt);
    size_t br = type.find('[');
    if (br != std::string::npos) type.erase(br);
    type.erase(std::remove_if(type.begin(), type.end(),
                              [](char c) { return c == '?' || c == '&' || c == '*' || c == ' ' ||
                                                  c == '\n' || c == '\t' || c == '"' || c == '\''; }),
               type.end());
    // `mut Foo` / `dyn Foo` lose their space above; drop the keyword prefix
    for (const char* prefix : {"mut", "dyn"}) {
        size_t len = strlen(prefix);
        if (type.size() > len && type.compare(0, len, prefix) == 0 &&
            std::isupper(static_cast<unsigned char>(type[len]))) {
            type.erase(0, len);
        }
    }
    return type;
}

std::string LanguageAdapter::strip_quotes(const std::string& text) {
    std::string s = trim(text);
    // Python prefixes such as r"..", f"..", b".."
    while (!s.empty() && std::isalpha(static_cast<unsigned char>(s.front())) && s.size() > 1 &&
           (s[1] == '"' || s[1] == '\'' || std::isalpha(static_cast<unsigned char>(s[1])))) {
        if (s[1] == '"' || s[1] == '\'') {
            s.erase(0, 1);
            break;
        }
        s.erase(0, 1);
    }
    while (s.size() >= 2 && (s.front() == '"' || s.front() == '\'' || s.front() == '`') &&
           s.back() == s.front()) {
        s = s.substr(1, s.size() - 2);
    }
    return s;
}

std::string LanguageAdapter::last_segment(const std::string& path, const char* separators) {
    size_t pos = path.find_last_of(separators);
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string LanguageAdapter::trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

FileAnalysis LanguageAdapter::analyze(const LanguageParser& ast, const std::string& module_path) const {
    ParseContext ctx(ast, module_path);

    TSNode root = ast.root();
    if (ts_node_is_null(root)) {
        throw ParseError("No syntax tree for " + module_path);
    }

    // Module symbol owns top-level calls and imports
    ParsedSymbol module;
    module.name = last_segment(module_path);
    module.qualified_name = module_path;
    module.kind = SymbolKind::Module;
    module.signature = "module " + module_path;
    module.start_line = ts_node_start_point(root).row + 1;
    module.end_line = ts_node_end_point(root).row + 1;
    ctx.used_names_.emplace(module_path, 1);
    ctx.out_.symbols.push_back(std::move(module));

    ScopeFrame frame;
    frame.qualified_name = module_path;
    frame.member_prefix = module_path;
    ctx.frames_.push_back(std::move(frame));

    walk(ctx);

    ctx.out_.package = ctx.package_;
    return std::move(ctx.out_);
}

std::vector<ParsedSymbol> LanguageAdapter::extract_symbols(const LanguageParser& ast,
                                                           const std::string& module_path) const {
    return analyze(ast, module_path).symbols;
}

std::vector<CallSite> LanguageAdapter::extract_calls(const LanguageParser& ast,
                                                     const std::string& module_path) const {
    return analyze(ast, module_path).calls;
}

void LanguageAdapter::walk(ParseContext& ctx) const {
    // Iterative traversal; exit markers pop the scope a definition pushed
    struct Item {
        TSNode node;
        bool exit;
    };
    std::vector<Item> stack;
    stack.reserve(256);

    auto push_children = [&](TSNode node) {
        uint32_t child_count = ts_node_child_count(node);
        for (uint32_t i = child_count; i > 0; --i) {
            stack.push_back({ts_node_child(node, i - 1), false});
        }
    };
    push_children(ctx.ast().root());

    while (!stack.empty()) {
        Item item = stack.back();
        stack.pop_back();

        if (item.exit) {
            ctx.frames_.pop_back();
            continue;
        }

        TSNode node = item.node;
        NodeKind kind = classify(node);
        bool descend = true;

        switch (kind) {
        case NodeKind::Package: {
            std::string package = package_name(node, ctx);
            if (!package.empty()) ctx.set_package(package);
            descend = false;
            break;
        }
        case NodeKind::Import:
            for (const auto& entry : read_import(node, ctx)) {
                add_import(entry, node, ctx);
            }
            descend = false;
            break;
        case NodeKind::TypeDefinition:
        case NodeKind::FunctionDefinition:
        case NodeKind::ModuleDefinition: {
            auto def = describe(node, ctx);
            if (def && !def->name.empty()) {
                enter_definition(node, *def, ctx);
                stack.push_back({node, true});
                add_bindings(bindings(node, kind, ctx), ctx);
            }
            break;
        }
        case NodeKind::Call:
            handle_call(node, ctx);
            break;
        case NodeKind::TypedBinding:
            add_bindings(bindings(node, kind, ctx), ctx);
            break;
        default:
            break;
        }

        if (descend) push_children(node);
    }
}

void LanguageAdapter::enter_definition(TSNode node, const Definition& def, ParseContext& ctx) const {
    const ScopeFrame& parent = ctx.frames_.back();
    bool in_type = parent.is_type;

    SymbolKind kind = def.kind;
    if (kind == SymbolKind::Function && in_type) kind = SymbolKind::Method;

    std::string qualified =
        ctx.unique_qualified_name(parent.member_prefix + "." + def.name, def.param_types);

    ParsedSymbol sym;
    sym.name = def.name;
    sym.qualified_name = qualified;
    sym.parent_qualified_name = parent.qualified_name;
    sym.kind = kind;
    sym.signature = def.signature;
    sym.source_text = ctx.ast().node_text(node);
    TSPoint start = ts_node_start_point(node);
    TSPoint end = ts_node_end_point(node);
    sym.start_line = start.row + 1;
    sym.end_line = end.row + 1;
    sym.start_column = start.column;
    sym.end_column = end.column;
    sym.metadata = def.metadata.is_object() ? def.metadata : json::object();
    if (!def.bases.empty()) sym.metadata["bases"] = def.bases;
    if (!def.param_types.empty()) sym.metadata["parameter_types"] = def.param_types;

    if (in_type) {
        CallSite member;
        member.source = parent.qualified_name;
        member.callee = def.name;
        member.name = def.name;
        member.target_qualified = qualified;
        member.enclosing_type = parent.member_prefix;
        member.type = ReferenceType::Member;
        member.line = sym.start_line;
        ctx.out_.calls.push_back(std::move(member));
    }

    for (const auto& base : def.bases) {
        std::string clean = strip_generics(base);
        if (clean.empty()) continue;
        CallSite inherit;
        inherit.source = qualified;
        inherit.callee = clean;
        inherit.name = last_segment(clean);
        inherit.receiver_type = clean;
        inherit.enclosing_type = ctx.enclosing_type();
        inherit.type = ReferenceType::Inheritance;
        inherit.line = sym.start_line;
        ctx.out_.calls.push_back(std::move(inherit));
    }

    ScopeFrame frame;
    frame.qualified_name = qualified;
    frame.is_type = is_type_kind(kind);
    frame.member_prefix = def.member_scope.empty() ? qualified
                                                   : parent.member_prefix + "." + def.member_scope;
    ctx.out_.symbols.push_back(std::move(sym));
    ctx.frames_.push_back(std::move(frame));
}

void LanguageAdapter::add_bindings(const std::vector<Binding>& found, ParseContext& ctx) const {
    for (const auto& b : found) {
        std::string type = strip_generics(b.type);
        if (b.name.empty() || type.empty()) continue;
        if (b.member) {
            std::string owner = ctx.enclosing_type();
            if (!owner.empty()) {
                ctx.type_members_[owner][b.name] = type;
                continue;
            }
        }
        ctx.frames_.back().bindings[b.name] = type;
    }
}

void LanguageAdapter::add_import(const ImportEntry& entry, TSNode node, ParseContext& ctx) const {
    if (entry.path.empty()) return;
    ctx.out_.imports.push_back(entry);

    const ScopeFrame& owner = ctx.frames_.back();

    ParsedSymbol sym;
    sym.name = entry.wildcard ? "*" : entry.alias;
    std::string path = entry.wildcard ? entry.path + ".*" : entry.path;
    sym.qualified_name = ctx.unique_qualified_name(ctx.module_path() + ":" + path, {});
    sym.parent_qualified_name = owner.qualified_name;
    sym.kind = SymbolKind::Import;
    std::string text = trim(ctx.ast().node_text(node));
    sym.signature = text.substr(0, text.find('\n'));
    sym.source_text = text;
    TSPoint start = ts_node_start_point(node);
    TSPoint end = ts_node_end_point(node);
    sym.start_line = start.row + 1;
    sym.end_line = end.row + 1;
    sym.start_column = start.column;
    sym.end_column = end.column;
    sym.metadata = json{{"import_path", entry.path}, {"alias", entry.alias}, {"wildcard", entry.wildcard}};

    if (!entry.wildcard) {
        CallSite site;
        site.source = sym.qualified_name;
        site.callee = entry.path;
        site.name = last_segment(entry.path);
        site.import_path = entry.path;
        site.type = ReferenceType::Import;
        site.line = sym.start_line;
        ctx.out_.calls.push_back(std::move(site));
    }
    ctx.out_.symbols.push_back(std::move(sym));
}

void LanguageAdapter::handle_call(TSNode node, ParseContext& ctx) const {
    auto required = import_from_call(node, ctx);
    if (!required.empty()) {
        for (const auto& entry : required) add_import(entry, node, ctx);
        return;
    }

    auto target = call_target(node, ctx);
    if (!target) return;

    auto segments = split_callee(target->callee);
    if (segments.empty()) return;

    CallSite site;
    site.source = ctx.frames_.back().qualified_name;
    site.name = segments.back();
    site.enclosing_type = ctx.enclosing_type();
    site.type = ReferenceType::Call;
    site.line = ts_node_start_point(node).row + 1;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) site.callee += ".";
        site.callee += segments[i];
    }

    // this.x.run() -> receiver x; this.run() -> sibling call with no receiver
    size_t first = 0;
    if (segments[0] == "this" || segments[0] == "self" || segments[0] == "Self") first = 1;
    size_t remaining = segments.size() - first;
    if (remaining >= 2) {
        const std::string& lead = segments[first];
        if (remaining == 2 || !ctx.lookup_binding(lead).empty()) {
            site.receiver = lead;
        } else {
            site.receiver = segments[segments.size() - 2];
        }
        site.receiver_type = ctx.lookup_binding(site.receiver);
    }

    for (TSNode args : target->arguments) {
        collect_argument_usages(args, site, ctx);
    }
    ctx.out_.calls.push_back(std::move(site));
}

void LanguageAdapter::collect_argument_usages(TSNode args, CallSite& site, ParseContext& ctx) const {
    if (ts_node_is_null(args)) return;

    std::unordered_set<std::string> seen;
    std::vector<TSNode> stack{args};
    while (!stack.empty()) {
        TSNode current = stack.back();
        stack.pop_back();

        if (!ts_node_eq(current, args)) {
            NodeKind kind = classify(current);
            if (kind == NodeKind::Call || kind == NodeKind::Lambda ||
                kind == NodeKind::FunctionDefinition || kind == NodeKind::TypeDefinition) {
                continue; // visited by the main walk
            }
            if (kind == NodeKind::StringLiteral) {
                if (site.argument_hint.empty()) site.argument_hint = strip_quotes(ctx.ast().node_text(current));
                continue;
            }
            if (kind == NodeKind::Literal) continue;
            if (kind == NodeKind::Identifier) {
                std::string name = ctx.ast().node_text(current);
                if (name.empty() || is_reserved_word(name) || !seen.insert(name).second) continue;

                CallSite usage;
                usage.source = site.source;
                usage.callee = name;
                usage.name = name;
                usage.receiver_type = ctx.lookup_binding(name);
                usage.enclosing_type = site.enclosing_type;
                usage.type = ReferenceType::Usage;
                usage.line = ts_node_start_point(current).row + 1;
                ctx.out_.calls.push_back(std::move(usage));
                continue;
            }
        }

        uint32_t child_count = ts_node_child_count(current);
        for (uint32_t i = child_count; i > 0; --i) {
            stack.push_back(ts_node_child(current, i - 1));
        }
    }
}

// Factory to create the adapter for a language
std::unique_ptr<LanguageAdapter> create_adapter(Language lang) {
    switch (lang) {
        case Language::Python:
            return std::make_unique<PythonAdapter>();
        case Language::Java:
            return std::make_unique<JavaAdapter>();
        case Language::Kotlin:
            return std::make_unique<KotlinAdapter>();
        case Language::JavaScript:
            return std::make_unique<JavaScriptAdapter>();
        case Language::Rust:
            return std::make_unique<RustAdapter>();
        default:
            return nullptr;
    }
}

} // namespace cartograph
