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

#include "cartograph/resolver.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace cartograph {

namespace {

std::string last_of(const std::string &path) {
    size_t dot = path.rfind('.');
    return dot == std::string::npos ? path : path.substr(dot + 1);
}

std::string prefix_of(const std::string &path) {
    size_t dot = path.rfind('.');
    return dot == std::string::npos ? "" : path.substr(0, dot);
}

std::string first_of(const std::string &path) {
    return path.substr(0, path.find('.'));
}

bool capitalised(const std::string &name) {
    return !name.empty() && std::isupper(static_cast<unsigned char>(name[0]));
}

} // namespace

// ============ SymbolIndex ============

std::string SymbolIndex::base_qualified(const std::string &qualified_name) {
    std::string base = qualified_name;
    size_t paren = base.find('(');
    if (paren != std::string::npos) base.erase(paren);
    size_t hash = base.rfind('#');
    if (hash != std::string::npos && base.find('.', hash) == std::string::npos) base.erase(hash);
    return base;
}

bool SymbolIndex::module_matches(const std::string &module, const std::string &path) {
    if (path.empty() || module.size() < path.size()) return false;
    if (module == path) return true;
    return module.size() > path.size() && module[module.size() - path.size() - 1] == '.' &&
           module.compare(module.size() - path.size(), path.size(), path) == 0;
}

void SymbolIndex::add(const SymbolEntry &entry) {
    if (entry.kind == SymbolKind::Import) return;
    if (ids_.count(entry.id)) return;

    std::string base = base_qualified(entry.qualified_name);
    std::string relative;
    if (base.size() > entry.module_path.size() + 1 &&
        base.compare(0, entry.module_path.size(), entry.module_path) == 0 &&
        base[entry.module_path.size()] == '.') {
        relative = base.substr(entry.module_path.size() + 1);
    }

    Entry e;
    e.id = entry.id;
    e.name = pool_.intern(entry.name);
    e.module = pool_.intern(entry.module_path);
    e.package = pool_.intern(entry.package);
    e.owner = pool_.intern(last_of(prefix_of(relative)));
    e.kind = entry.kind;

    uint32_t idx = static_cast<uint32_t>(entries_.size());
    entries_.push_back(e);
    ids_[entry.id] = idx;
    by_name_[e.name].push_back(idx);
    by_base_[pool_.intern(base)].push_back(idx);
    by_qualified_[pool_.intern(entry.qualified_name)] = idx;
}

std::optional<SymbolUID> SymbolIndex::find_qualified(const std::string &qualified_name) const {
    size_t key = pool_.find(qualified_name);
    if (key == SIZE_MAX) return std::nullopt;
    auto it = by_qualified_.find(key);
    if (it == by_qualified_.end()) return std::nullopt;
    return entries_[it->second].id;
}

std::vector<SymbolUID> SymbolIndex::find_base_qualified(const std::string &base) const {
    std::vector<SymbolUID> out;
    size_t key = pool_.find(base);
    if (key == SIZE_MAX) return out;
    auto it = by_base_.find(key);
    if (it == by_base_.end()) return out;
    for (uint32_t idx : it->second) out.push_back(entries_[idx].id);
    return out;
}

std::vector<SymbolUID> SymbolIndex::find_by_name(const std::string &name) const {
    std::vector<SymbolUID> out;
    size_t key = pool_.find(name);
    if (key == SIZE_MAX) return out;
    auto it = by_name_.find(key);
    if (it == by_name_.end()) return out;
    for (uint32_t idx : it->second) out.push_back(entries_[idx].id);
    return out;
}

bool SymbolIndex::located_at(const Entry &entry, const std::string &prefix, const std::string &full) const {
    // A bare path carries no location; any module qualifies
    if (prefix.empty()) return true;
    const std::string &module = pool_.get(entry.module);
    return module_matches(module, prefix) || module_matches(module, full) ||
           pool_.get(entry.package) == prefix;
}

std::vector<SymbolUID> SymbolIndex::match_member(const std::string &type_path, const std::string &name) const {
    std::vector<SymbolUID> out;
    if (type_path.empty() || name.empty()) return out;
    size_t name_key = pool_.find(name);
    size_t owner_key = pool_.find(last_of(type_path));
    if (name_key == SIZE_MAX || owner_key == SIZE_MAX) return out;

    auto it = by_name_.find(name_key);
    if (it == by_name_.end()) return out;
    std::string prefix = prefix_of(type_path);
    for (uint32_t idx : it->second) {
        const Entry &e = entries_[idx];
        if (e.owner == owner_key && located_at(e, prefix, type_path)) out.push_back(e.id);
    }
    return out;
}

std::vector<SymbolUID> SymbolIndex::match_top(const std::string &path) const {
    std::vector<SymbolUID> out;
    if (path.empty()) return out;
    size_t name_key = pool_.find(last_of(path));
    size_t empty_key = pool_.find("");
    if (name_key == SIZE_MAX) return out;

    auto it = by_name_.find(name_key);
    if (it == by_name_.end()) return out;
    std::string prefix = prefix_of(path);

    std::vector<const Entry *> found;
    for (uint32_t idx : it->second) {
        const Entry &e = entries_[idx];
        if (e.owner != empty_key) continue;
        if (!located_at(e, prefix, path)) continue;
        found.push_back(&e);
    }

    // Prefer real definitions over module symbols, and types over impl blocks
    for (SymbolKind skip : {SymbolKind::Module, SymbolKind::Impl}) {
        bool other = std::any_of(found.begin(), found.end(), [&](const Entry *e) { return e->kind != skip; });
        if (!other) continue;
        found.erase(std::remove_if(found.begin(), found.end(), [&](const Entry *e) { return e->kind == skip; }),
                    found.end());
    }
    for (const Entry *e : found) out.push_back(e->id);
    return out;
}

// ============ FileScope ============

FileScope FileScope::from(const FileAnalysis &analysis) {
    FileScope scope;
    scope.module_path = analysis.module_path;
    scope.package = analysis.package;
    for (const auto &entry : analysis.imports) {
        if (entry.wildcard) {
            scope.wildcards.push_back(entry.path);
        } else if (!entry.alias.empty()) {
            scope.imports.emplace(entry.alias, entry.path);
        }
    }
    return scope;
}

std::string FileScope::import_path(const std::string &alias) const {
    auto it = imports.find(alias);
    return it == imports.end() ? "" : it->second;
}

// ============ Resolver ============

std::vector<std::string> Resolver::type_paths(const FileScope &scope, const std::string &type) const {
    std::vector<std::string> paths;
    auto push = [&](const std::string &path) {
        if (!path.empty() && std::find(paths.begin(), paths.end(), path) == paths.end()) paths.push_back(path);
    };

    std::string head = first_of(type);
    std::string imported = scope.import_path(head);
    if (!imported.empty()) push(imported + type.substr(head.size()));
    for (const auto &wildcard : scope.wildcards) push(wildcard + "." + type);
    push(scope.module_path + "." + type);
    if (!scope.package.empty()) push(scope.package + "." + type);
    push(type);
    return paths;
}

std::vector<SymbolUID> Resolver::by_scope(const FileScope &scope, const CallSite &site) const {
    if (!site.receiver_type.empty()) {
        for (const auto &path : type_paths(scope, site.receiver_type)) {
            auto ids = site.type == ReferenceType::Call ? index_.match_member(path, site.name)
                                                        : index_.match_top(path);
            if (!ids.empty()) return ids;
        }
        return {};
    }

    // Bare call inside a type: sibling member
    if (site.type == ReferenceType::Call && site.receiver.empty() && !site.enclosing_type.empty()) {
        return index_.find_base_qualified(site.enclosing_type + "." + site.name);
    }
    return {};
}

std::vector<SymbolUID> Resolver::by_imports(const FileScope &scope, const CallSite &site) const {
    if (!site.receiver.empty()) {
        std::string imported = scope.import_path(site.receiver);
        if (!imported.empty()) {
            auto ids = index_.match_member(imported, site.name);
            if (ids.empty()) ids = index_.match_top(imported + "." + site.name);
            return ids;
        }
        for (const auto &wildcard : scope.wildcards) {
            auto ids = index_.match_member(wildcard + "." + site.receiver, site.name);
            if (!ids.empty()) return ids;
        }
        return {};
    }

    std::string imported = scope.import_path(site.name);
    if (!imported.empty()) return index_.match_top(imported);
    for (const auto &wildcard : scope.wildcards) {
        auto ids = index_.match_top(wildcard + "." + site.name);
        if (!ids.empty()) return ids;
    }
    return {};
}

std::vector<SymbolUID> Resolver::by_package(const FileScope &scope, const CallSite &site) const {
    if (site.receiver.empty()) {
        auto ids = index_.find_base_qualified(scope.module_path + "." + site.name);
        if (ids.empty() && !scope.package.empty()) ids = index_.match_top(scope.package + "." + site.name);
        return ids;
    }
    if (!capitalised(site.receiver)) return {};
    auto ids = index_.match_member(scope.module_path + "." + site.receiver, site.name);
    if (ids.empty() && !scope.package.empty()) {
        ids = index_.match_member(scope.package + "." + site.receiver, site.name);
    }
    return ids;
}

std::string Resolver::external_hint(const FileScope &scope, const CallSite &site) const {
    if (!site.receiver_type.empty()) {
        std::string head = first_of(site.receiver_type);
        std::string imported = scope.import_path(head);
        return imported.empty() ? site.receiver_type : imported + site.receiver_type.substr(head.size());
    }
    if (!site.receiver.empty()) return scope.import_path(site.receiver);
    return scope.import_path(site.name);
}

std::vector<Resolution> Resolver::resolve(const FileScope &scope, const CallSite &site) const {
    std::vector<Resolution> out;

    // Bound edges keep the hint too, so they can be re-bound if the target goes away
    auto emit = [&](const std::vector<SymbolUID> &ids, const std::string &hint) {
        if (ids.empty()) {
            Resolution r;
            r.target_name = site.name;
            r.target_path = hint;
            out.push_back(r);
            return;
        }
        for (SymbolUID id : ids) {
            Resolution r;
            r.target = id;
            r.target_name = site.name;
            r.target_path = hint;
            r.is_ambiguous = ids.size() > 1;
            out.push_back(r);
        }
    };

    if (!site.target_qualified.empty()) {
        auto id = index_.find_qualified(site.target_qualified);
        emit(id ? std::vector<SymbolUID>{*id} : std::vector<SymbolUID>{}, site.target_qualified);
        return out;
    }

    if (site.type == ReferenceType::Import) {
        emit(index_.match_top(site.import_path), site.import_path);
        return out;
    }

    auto ids = by_scope(scope, site);
    if (ids.empty()) ids = by_imports(scope, site);
    if (ids.empty()) ids = by_package(scope, site);

    // Argument identifiers naming nothing in the repository are local values
    if (ids.empty() && site.type == ReferenceType::Usage) return out;
    emit(ids, external_hint(scope, site));
    return out;
}

std::vector<SymbolUID> Resolver::rebind(const std::string &target_name, const std::string &target_path) const {
    if (target_path.empty() || target_name.empty()) return {};
    if (last_of(SymbolIndex::base_qualified(target_path)) == target_name) {
        auto ids = index_.match_top(target_path);
        if (ids.empty()) {
            // Member edges carry the exact qualified name
            auto id = index_.find_qualified(target_path);
            if (id) ids.push_back(*id);
        }
        return ids;
    }
    auto ids = index_.match_member(target_path, target_name);
    if (ids.empty()) ids = index_.match_top(target_path + "." + target_name);
    return ids;
}

} // namespace cartograph
