// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "parser.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cartograph {

// Symbol as seen by the resolver
struct SymbolEntry {
    SymbolUID id = INVALID_UID;
    std::string name;
    std::string qualified_name;
    std::string module_path; // module path of the defining file
    std::string package;     // declared package of the defining file
    SymbolKind kind = SymbolKind::Function;
    RowId file_id = 0;
};

// ============================================================================
// SymbolIndex - repository-wide lookup tables over interned strings
// ============================================================================
class SymbolIndex {
public:
    void add(const SymbolEntry &entry);

    size_t size() const { return entries_.size(); }

    bool contains(SymbolUID id) const { return ids_.count(id) > 0; }

    // Exact qualified name
    std::optional<SymbolUID> find_qualified(const std::string &qualified_name) const;

    // Qualified name with any overload suffix removed: `a.B.run`, not `a.B.run(int)`
    std::vector<SymbolUID> find_base_qualified(const std::string &base) const;

    // Members named `name` of the type at dotted path `type_path`
    std::vector<SymbolUID> match_member(const std::string &type_path, const std::string &name) const;

    // Top-level symbol addressed by a dotted path (`pkg.mod.Name`); module
    // symbols only when nothing else matches
    std::vector<SymbolUID> match_top(const std::string &path) const;

    // Every symbol with the given bare name
    std::vector<SymbolUID> find_by_name(const std::string &name) const;

    // Strip "(..)" and "#n" suffixes from a qualified name
    static std::string base_qualified(const std::string &qualified_name);

    // True when `module` is `path` or ends with `.path`
    static bool module_matches(const std::string &module, const std::string &path);

private:
    struct Entry {
        SymbolUID id;
        size_t name;
        size_t module;
        size_t package;
        size_t owner; // simple name of the enclosing type, or the empty string
        SymbolKind kind;
    };

    bool located_at(const Entry &entry, const std::string &prefix, const std::string &full) const;

    StringPool pool_;
    std::vector<Entry> entries_;
    std::unordered_map<size_t, std::vector<uint32_t>> by_name_;
    std::unordered_map<size_t, std::vector<uint32_t>> by_base_;
    std::unordered_map<size_t, uint32_t> by_qualified_;
    std::unordered_map<SymbolUID, uint32_t> ids_;
};

// Outcome of binding one call site
struct Resolution {
    std::optional<SymbolUID> target;
    std::string target_name;
    std::string target_path; // dotted hint for later rebinding
    bool is_ambiguous = false;

    bool is_external() const { return !target.has_value(); }
};

// Imports of one file, keyed by the name visible in the file
struct FileScope {
    std::string module_path;
    std::string package;
    std::unordered_map<std::string, std::string> imports;
    std::vector<std::string> wildcards;

    static FileScope from(const FileAnalysis &analysis);

    // Full path bound to `alias` ("" if not imported)
    std::string import_path(const std::string &alias) const;
};

// ============================================================================
// Resolver - ordered strategy chain over a SymbolIndex
//
//   1. scope    declared receiver type, or a sibling member of the enclosing type
//   2. imports  receiver or bare name bound by the file's import table
//   3. package  same module / package
//   4. external unresolved, kept with a path hint
// ============================================================================
class Resolver {
public:
    explicit Resolver(const SymbolIndex &index) : index_(index) {}

    // One entry per candidate target. Empty when the site should be dropped
    // (argument identifiers that name nothing in the repository).
    std::vector<Resolution> resolve(const FileScope &scope, const CallSite &site) const;

    // Re-bind an external edge from its stored name and path hint
    std::vector<SymbolUID> rebind(const std::string &target_name, const std::string &target_path) const;

private:
    const SymbolIndex &index_;

    std::vector<SymbolUID> by_scope(const FileScope &scope, const CallSite &site) const;
    std::vector<SymbolUID> by_imports(const FileScope &scope, const CallSite &site) const;
    std::vector<SymbolUID> by_package(const FileScope &scope, const CallSite &site) const;
    std::string external_hint(const FileScope &scope, const CallSite &site) const;

    // Candidate dotted paths for a type name as written in a file
    std::vector<std::string> type_paths(const FileScope &scope, const std::string &type) const;
};

} // namespace cartograph
