#pragma once

#include "types.hpp"
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tree_sitter/api.h>
#include <unordered_map>
#include <vector>

// Forward declarations for tree-sitter language functions
extern "C" {
const TSLanguage *tree_sitter_python();
const TSLanguage *tree_sitter_java();
const TSLanguage *tree_sitter_kotlin();
const TSLanguage *tree_sitter_javascript();
const TSLanguage *tree_sitter_rust();
}

namespace cartograph {

// Canonical node kinds. Each adapter maps its grammar's raw node types onto
// these; code outside the adapters only ever sees NodeKind.
enum class NodeKind : uint8_t {
    Other,
    Package,            // package / namespace header
    Import,             // import, use, from-import
    TypeDefinition,     // class, interface, object, struct, enum, trait, impl
    FunctionDefinition, // function, method, constructor
    ModuleDefinition,   // nested module
    Call,               // call expression, method invocation, new expression
    Arguments,          // argument list of a call
    Identifier,         // identifier leaf
    TypedBinding,       // declaration with a static type or constructor initializer
    Lambda,             // lambda / closure / arrow function body
    StringLiteral,
    Literal,            // any other literal, and reserved words like this/self
};

// Parser for a single grammar
class LanguageParser {
public:

    explicit LanguageParser(const TSLanguage *grammar);
    ~LanguageParser();

    // Non-copyable
    LanguageParser(const LanguageParser &) = delete;
    LanguageParser &operator=(const LanguageParser &) = delete;

    // Movable
    LanguageParser(LanguageParser &&other) noexcept;
    LanguageParser &operator=(LanguageParser &&other) noexcept;

    // Parse source code
    bool parse(const std::string &source);

    TSNode root() const;

    const std::string &source() const { return source_; }

    std::string node_text(TSNode node) const;

    // Fraction of source bytes covered by ERROR or MISSING nodes
    double error_ratio() const;

private:

    TSParser *parser_ = nullptr;
    TSTree *tree_ = nullptr;
    std::string source_;
};

// Symbol descriptor emitted by an adapter
struct ParsedSymbol {
    std::string name;
    std::string qualified_name;
    std::string parent_qualified_name;
    SymbolKind kind = SymbolKind::Function;
    std::string signature;
    std::string source_text;
    uint32_t start_line = 0;
    uint32_t end_line = 0;
    uint32_t start_column = 0;
    uint32_t end_column = 0;
    json metadata = json::object();
};

// Raw call expression, argument identifier, import or inheritance clause
struct CallSite {
    std::string source;           // qualified name of the enclosing symbol
    std::string callee;           // callee text with argument lists stripped
    std::string receiver;         // navigation segment the member is invoked on
    std::string name;             // invoked member, bare name, or argument identifier
    std::string receiver_type;    // declared type of the receiver, if statically known
    std::string enclosing_type;   // member prefix of the innermost type scope
    std::string target_qualified; // set when the target is known at parse time
    std::string import_path;      // full dotted path, for import sites
    ReferenceType type = ReferenceType::Call;
    std::string argument_hint;    // first string literal among the arguments
    uint32_t line = 0;
};

struct ImportEntry {
    std::string alias; // name visible in the file
    std::string path;  // full dotted path
    bool wildcard = false;
};

// Everything the resolver needs from one file
struct FileAnalysis {
    std::string module_path;
    std::string package;
    std::vector<ImportEntry> imports;
    std::vector<ParsedSymbol> symbols;
    std::vector<CallSite> calls;
};

// What an adapter reports for a definition node
struct Definition {
    std::string name;
    SymbolKind kind = SymbolKind::Function;
    std::string signature;
    std::vector<std::string> param_types;
    std::vector<std::string> bases;
    // Member prefix override (Rust impl blocks qualify methods under the type)
    std::string member_scope;
    json metadata = json::object();
};

// Name with a statically known type
struct Binding {
    std::string name;
    std::string type;
    bool member = false; // belongs to the enclosing type (field, self.x)
};

struct CallTarget {
    std::string callee;
    std::vector<TSNode> arguments;
};

struct ScopeFrame {
    std::string qualified_name; // symbol owning the scope
    std::string member_prefix;  // prefix for definitions nested in this scope
    bool is_type = false;
    std::unordered_map<std::string, std::string> bindings;
};

// Mutable state of one walk over a file
class ParseContext {
public:

    ParseContext(const LanguageParser &ast, std::string module_path);

    const LanguageParser &ast() const { return ast_; }
    const std::string &module_path() const { return module_path_; }
    const std::string &package() const { return package_; }
    void set_package(std::string package) { package_ = std::move(package); }

    const std::vector<ScopeFrame> &frames() const { return frames_; }

    // Declared type of a name, innermost scope first ("" if unknown)
    std::string lookup_binding(const std::string &name) const;

    // Member prefix of the innermost type scope ("" outside types)
    std::string enclosing_type() const;

    bool inside_type() const;

private:

    friend class LanguageAdapter;

    const LanguageParser &ast_;
    std::string module_path_;
    std::string package_;
    std::vector<ScopeFrame> frames_;
    // member prefix of a type -> field name -> declared type
    std::unordered_map<std::string, std::unordered_map<std::string, std::string>> type_members_;
    std::unordered_map<std::string, int> used_names_;
    FileAnalysis out_;

    std::string unique_qualified_name(const std::string &base, const std::vector<std::string> &param_types);
};

// Per-language adapter. Subclasses supply a node-kind table and a handful of
// hooks; the walk itself lives here and never looks at raw type strings.
class LanguageAdapter {
public:

    virtual ~LanguageAdapter() = default;

    virtual Language language() const = 0;
    virtual const TSLanguage *grammar() const = 0;

    NodeKind classify(TSNode node) const;

    std::vector<ParsedSymbol> extract_symbols(const LanguageParser &ast,
                                              const std::string &module_path) const;
    std::vector<CallSite> extract_calls(const LanguageParser &ast,
                                        const std::string &module_path) const;

    // Single walk producing symbols, calls and the import table
    FileAnalysis analyze(const LanguageParser &ast, const std::string &module_path) const;

protected:

    using KindTable = std::unordered_map<std::string_view, NodeKind>;

    virtual const KindTable &kind_table() const = 0;

    // Package declared by a Package node
    virtual std::string package_name(TSNode node, const ParseContext &ctx) const;

    virtual std::vector<ImportEntry> read_import(TSNode node, const ParseContext &ctx) const = 0;

    // nullopt for definition-kind nodes that should not become symbols
    virtual std::optional<Definition> describe(TSNode node, const ParseContext &ctx) const = 0;

    // Bindings introduced by a definition (fields, parameters) or a TypedBinding node
    virtual std::vector<Binding> bindings(TSNode node, NodeKind kind, const ParseContext &ctx) const = 0;

    virtual std::optional<CallTarget> call_target(TSNode node, const ParseContext &ctx) const = 0;

    // Calls that are really imports (CommonJS require)
    virtual std::vector<ImportEntry> import_from_call(TSNode node, const ParseContext &ctx) const;

    // Words that are never references when found as argument identifiers
    virtual bool is_reserved_word(std::string_view word) const;

    // ============ Shared helpers for adapters ============

    static TSNode field(TSNode node, const char *name);
    static bool is_type(TSNode node, const char *type);
    static TSNode first_child_of_type(TSNode node, std::initializer_list<const char *> types);
    // Named children; empty for a null node
    static std::vector<TSNode> named_children(TSNode node);
    // Declaration text up to its body, annotations dropped, whitespace collapsed
    static std::string declaration_header(const LanguageParser &ast, TSNode node, TSNode body);
    static std::string strip_generics(std::string type);
    static std::string strip_quotes(const std::string &text);
    static std::string last_segment(const std::string &path, const char *separators = ".:");
    static std::string trim(const std::string &s);

private:

    void walk(ParseContext &ctx) const;
    void enter_definition(TSNode node, const Definition &def, ParseContext &ctx) const;
    void add_bindings(const std::vector<Binding> &found, ParseContext &ctx) const;
    void handle_call(TSNode node, ParseContext &ctx) const;
    void collect_argument_usages(TSNode args, CallSite &site, ParseContext &ctx) const;
    void add_import(const ImportEntry &entry, TSNode node, ParseContext &ctx) const;
};

// Factory to create the adapter for a language (nullptr for Unknown)
std::unique_ptr<LanguageAdapter> create_adapter(Language lang);

// Build signature from param types, e.g. "(int, String)"
std::string build_param_signature(const std::vector<std::string> &param_types);

// "src/a/B.kt" -> "src.a.B"
std::string module_path_for(const std::string &relative_path);

// Split a callee such as `this.repo?.save` or `Foo::bar` into segments,
// dropping argument lists and generic arguments.
std::vector<std::string> split_callee(const std::string &callee);

} // namespace cartograph
