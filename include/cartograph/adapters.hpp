#pragma once

#include "parser.hpp"

namespace cartograph {

// ============================================================================
// Per-language adapters. Each one owns its node-kind table and the hooks the
// generic walk in LanguageAdapter calls back into.
// ============================================================================

class PythonAdapter : public LanguageAdapter {
public:
    Language language() const override { return Language::Python; }
    const TSLanguage *grammar() const override { return tree_sitter_python(); }

protected:
    const KindTable &kind_table() const override;
    std::vector<ImportEntry> read_import(TSNode node, const ParseContext &ctx) const override;
    std::optional<Definition> describe(TSNode node, const ParseContext &ctx) const override;
    std::vector<Binding> bindings(TSNode node, NodeKind kind, const ParseContext &ctx) const override;
    std::optional<CallTarget> call_target(TSNode node, const ParseContext &ctx) const override;
};

class JavaAdapter : public LanguageAdapter {
public:
    Language language() const override { return Language::Java; }
    const TSLanguage *grammar() const override { return tree_sitter_java(); }

protected:
    const KindTable &kind_table() const override;
    std::string package_name(TSNode node, const ParseContext &ctx) const override;
    std::vector<ImportEntry> read_import(TSNode node, const ParseContext &ctx) const override;
    std::optional<Definition> describe(TSNode node, const ParseContext &ctx) const override;
    std::vector<Binding> bindings(TSNode node, NodeKind kind, const ParseContext &ctx) const override;
    std::optional<CallTarget> call_target(TSNode node, const ParseContext &ctx) const override;
};

// Accepts node names of both the kotlin-ng grammar (identifier, import,
// qualified_identifier) and the older fwcd grammar (simple_identifier,
// import_header, call_suffix).
class KotlinAdapter : public LanguageAdapter {
public:
    Language language() const override { return Language::Kotlin; }
    const TSLanguage *grammar() const override { return tree_sitter_kotlin(); }

protected:
    const KindTable &kind_table() const override;
    std::string package_name(TSNode node, const ParseContext &ctx) const override;
    std::vector<ImportEntry> read_import(TSNode node, const ParseContext &ctx) const override;
    std::optional<Definition> describe(TSNode node, const ParseContext &ctx) const override;
    std::vector<Binding> bindings(TSNode node, NodeKind kind, const ParseContext &ctx) const override;
    std::optional<CallTarget> call_target(TSNode node, const ParseContext &ctx) const override;
};

class JavaScriptAdapter : public LanguageAdapter {
public:
    Language language() const override { return Language::JavaScript; }
    const TSLanguage *grammar() const override { return tree_sitter_javascript(); }

protected:
    const KindTable &kind_table() const override;
    std::vector<ImportEntry> read_import(TSNode node, const ParseContext &ctx) const override;
    std::optional<Definition> describe(TSNode node, const ParseContext &ctx) const override;
    std::vector<Binding> bindings(TSNode node, NodeKind kind, const ParseContext &ctx) const override;
    std::optional<CallTarget> call_target(TSNode node, const ParseContext &ctx) const override;
    std::vector<ImportEntry> import_from_call(TSNode node, const ParseContext &ctx) const override;
};

class RustAdapter : public LanguageAdapter {
public:
    Language language() const override { return Language::Rust; }
    const TSLanguage *grammar() const override { return tree_sitter_rust(); }

protected:
    const KindTable &kind_table() const override;
    std::vector<ImportEntry> read_import(TSNode node, const ParseContext &ctx) const override;
    std::optional<Definition> describe(TSNode node, const ParseContext &ctx) const override;
    std::vector<Binding> bindings(TSNode node, NodeKind kind, const ParseContext &ctx) const override;
    std::optional<CallTarget> call_target(TSNode node, const ParseContext &ctx) const override;
};

} // namespace cartograph
