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

#include "cartograph/indexer.hpp"
#include "cartograph/errors.hpp"
#include "cartograph/hash.hpp"
#include "cartograph/logging.hpp"
#include <algorithm>
#include <cstdio>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace cartograph {

namespace {

// Package of a file without a declared one: the module path's parent
std::string parent_path(const std::string &module_path) {
    size_t dot = module_path.rfind('.');
    return dot == std::string::npos ? "" : module_path.substr(0, dot);
}

std::string extension_tag(const std::string &relative_path) {
    size_t dot = relative_path.rfind('.');
    size_t slash = relative_path.rfind('/');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return "";
    return relative_path.substr(dot + 1);
}

} // namespace

json IndexResult::to_json() const {
    return json{{"status", to_string(status)},
                {"files_total", files_total},
                {"files_parsed", files_parsed},
                {"files_failed", files_failed},
                {"files_unchanged", files_unchanged},
                {"files_reparsed", files_reparsed},
                {"files_deleted", files_deleted},
                {"symbols_written", symbols_written},
                {"references_written", references_written},
                {"references_rebound", references_rebound},
                {"graph_writes", graph_writes}};
}

Indexer::Indexer(GraphStore &store, const Config &config)
    : store_(store), config_(config), detector_(config) {}

ParsedFile Indexer::parse_file(FileChange &change, const std::string &module_path) const {
    ParsedFile out;
    out.change = &change;
    out.module_path = module_path;
    out.analysis.module_path = module_path;
    out.analysis.package = parent_path(module_path);

    auto fail = [&out](std::string error) {
        out.failed = true;
        out.error = std::move(error);
    };

    if (!change.read_error.empty()) {
        fail(change.read_error);
        return out;
    }
    if (change.content.find('\0') != std::string::npos) {
        fail("Binary content");
        return out;
    }

    auto adapter = create_adapter(change.discovered.language);
    if (!adapter) {
        fail("Unsupported language");
        return out;
    }

    LanguageParser parser(adapter->grammar());
    if (!parser.parse(change.content)) {
        fail("Parser returned no syntax tree");
        return out;
    }

    double ratio = parser.error_ratio();
    if (ratio >= config_.max_error_ratio) {
        char buf[96];
        std::snprintf(buf, sizeof(buf), "Syntax errors cover %.1f%% of the source", ratio * 100.0);
        fail(buf);
        return out;
    }

    try {
        out.analysis = adapter->analyze(parser, module_path);
    } catch (const ParseError &e) {
        fail(e.what());
    }
    return out;
}

void Indexer::worker_parse_files(std::vector<ParsedFile> &files, size_t start_idx, size_t end_idx) const {
    for (size_t i = start_idx; i < end_idx; ++i) {
        ParsedFile &slot = files[i];
        slot = parse_file(*slot.change, slot.module_path);
        if (slot.failed) {
            log_warn("Parse failed", {StringField("path", slot.change->relative_path), StringField("error", slot.error)});
        } else {
            log_debug("Parsed", {StringField("path", slot.change->relative_path),
                                 IntField("symbols", static_cast<int64_t>(slot.analysis.symbols.size())),
                                 IntField("calls", static_cast<int64_t>(slot.analysis.calls.size()))});
        }
    }
}

void Indexer::parse_all(std::vector<ParsedFile> &files) const {
    if (files.empty()) return;
    unsigned int num_threads = std::max(1u, config_.effective_parse_threads());
    size_t files_per_thread = (files.size() + num_threads - 1) / num_threads;

    // Each thread owns a contiguous slice of the result slots
    std::vector<std::thread> threads;
    for (unsigned int t = 0; t < num_threads; ++t) {
        size_t start_idx = t * files_per_thread;
        size_t end_idx = std::min(start_idx + files_per_thread, files.size());
        if (start_idx >= files.size()) break;
        threads.emplace_back(&Indexer::worker_parse_files, this, std::ref(files), start_idx, end_idx);
    }
    for (auto &t : threads) {
        t.join();
    }
}

IndexResult Indexer::index_repository(RowId repo_id, const HeartbeatCallback &heartbeat) {
    IndexResult result;
    int64_t writes_before = store_.graph_write_count();

    RepositoryRecord repo = store_.get_repository(repo_id);
    std::error_code ec;
    if (!fs::is_directory(repo.root_path, ec)) {
        throw NotFound("Repository root is not a directory: " + repo.root_path);
    }
    store_.set_repository_status(repo_id, RepositoryStatus::Parsing);
    log_info("Indexing repository", {IntField("repo_id", repo_id), StringField("root", repo.root_path)});

    ChangeSet changes = detector_.detect(repo.root_path, store_.list_files(repo_id, true));
    std::vector<FileChange *> to_parse = changes.to_parse();
    result.files_unchanged = static_cast<int64_t>(changes.unchanged.size());
    result.files_reparsed = static_cast<int64_t>(to_parse.size());
    result.files_deleted = static_cast<int64_t>(changes.deleted.size());
    log_info("Change detection", {IntField("unchanged", result.files_unchanged),
                                  IntField("changed", static_cast<int64_t>(changes.changed.size())),
                                  IntField("new", static_cast<int64_t>(changes.added.size())),
                                  IntField("deleted", result.files_deleted)});

    // ============ Deleted files ============
    for (const auto &change : changes.deleted) {
        Transaction tx(store_.db());
        store_.delete_file_graph(change.stored->id);
        store_.mark_file_deleted(change.stored->id);
        store_.reset_dangling_references(repo_id);
        tx.commit();
    }

    // ============ Module paths ============
    // Unchanged files keep theirs; the rest are assigned in path order, with
    // the extension appended when two files map to the same module path
    std::unordered_set<std::string> taken_modules;
    for (const auto &change : changes.unchanged) {
        taken_modules.insert(change.stored->module_path);
    }

    std::vector<ParsedFile> parsed(to_parse.size());
    for (size_t i = 0; i < to_parse.size(); ++i) {
        FileChange *change = to_parse[i];
        std::string module = module_path_for(change->relative_path);
        if (change->stored && !change->stored->module_path.empty() && !taken_modules.count(change->stored->module_path)) {
            module = change->stored->module_path;
        } else if (taken_modules.count(module)) {
            std::string base = module + "~" + extension_tag(change->relative_path);
            module = base;
            for (int n = 2; taken_modules.count(module); ++n) module = base + std::to_string(n);
        }
        taken_modules.insert(module);
        parsed[i].change = change;
        parsed[i].module_path = module;
    }

    // ============ Phase 1: parse ============
    parse_all(parsed);

    // ============ Symbol index ============
    std::unordered_set<RowId> rewritten;
    for (FileChange *change : to_parse) {
        if (change->stored) rewritten.insert(change->stored->id);
    }

    SymbolIndex index;
    std::unordered_set<std::string> taken_names;
    std::unordered_map<RowId, std::vector<SymbolUID>> old_symbols;
    for (auto &entry : store_.symbol_entries(repo_id)) {
        if (rewritten.count(entry.file_id)) {
            old_symbols[entry.file_id].push_back(entry.id);
            continue;
        }
        taken_names.insert(entry.qualified_name);
        index.add(entry);
    }

    for (auto &file : parsed) {
        if (file.failed) continue;
        FileAnalysis &analysis = file.analysis;

        // Qualified names stay unique across the repository
        std::unordered_map<std::string, std::string> renames;
        for (auto &sym : analysis.symbols) {
            if (taken_names.count(sym.qualified_name)) {
                std::string candidate;
                for (int n = 2;; ++n) {
                    candidate = sym.qualified_name + "#dup" + std::to_string(n);
                    if (!taken_names.count(candidate)) break;
                }
                renames[sym.qualified_name] = candidate;
                sym.qualified_name = candidate;
            }
            taken_names.insert(sym.qualified_name);
        }
        if (!renames.empty()) {
            auto renamed = [&renames](std::string &name) {
                auto it = renames.find(name);
                if (it != renames.end()) name = it->second;
            };
            for (auto &sym : analysis.symbols) renamed(sym.parent_qualified_name);
            for (auto &site : analysis.calls) {
                renamed(site.source);
                renamed(site.target_qualified);
            }
        }

        for (const auto &sym : analysis.symbols) {
            SymbolEntry entry;
            entry.id = stable_symbol_uid(repo_id, sym.qualified_name);
            entry.name = sym.name;
            entry.qualified_name = sym.qualified_name;
            entry.module_path = analysis.module_path;
            entry.package = analysis.package;
            entry.kind = sym.kind;
            index.add(entry);
        }
    }

    // ============ Phase 2: resolve and write ============
    Resolver resolver(index);
    size_t batch_size = std::max(1u, config_.max_files_per_batch);

    for (size_t i = 0; i < parsed.size(); ++i) {
        ParsedFile &file = parsed[i];
        FileChange &change = *file.change;

        FileRecord row;
        row.repo_id = repo_id;
        row.relative_path = change.relative_path;
        row.language = change.discovered.language;
        row.content_hash = change.content_hash;
        row.content = change.content.find('\0') == std::string::npos ? change.content : "";
        row.module_path = file.module_path;
        row.package = file.analysis.package;
        row.status = file.failed ? FileStatus::Failed : FileStatus::Parsed;
        row.error = file.error;
        row.size_bytes = static_cast<int64_t>(change.discovered.size_bytes);

        std::vector<SymbolRecord> symbols;
        std::vector<ReferenceRecord> refs;
        if (!file.failed) {
            std::unordered_set<std::string> owned;
            for (const auto &sym : file.analysis.symbols) {
                owned.insert(sym.qualified_name);
                SymbolRecord rec;
                rec.id = stable_symbol_uid(repo_id, sym.qualified_name);
                rec.repo_id = repo_id;
                rec.name = sym.name;
                rec.qualified_name = sym.qualified_name;
                rec.kind = sym.kind;
                rec.signature = sym.signature;
                rec.source_text = sym.source_text;
                rec.parent_qualified_name = sym.parent_qualified_name;
                rec.parent_id = sym.parent_qualified_name.empty()
                                    ? INVALID_UID
                                    : stable_symbol_uid(repo_id, sym.parent_qualified_name);
                rec.start_line = sym.start_line;
                rec.end_line = sym.end_line;
                rec.start_column = sym.start_column;
                rec.end_column = sym.end_column;
                rec.metadata = sym.metadata;
                symbols.push_back(std::move(rec));
            }

            FileScope scope = FileScope::from(file.analysis);
            for (const auto &site : file.analysis.calls) {
                if (!owned.count(site.source)) continue;
                SymbolUID source = stable_symbol_uid(repo_id, site.source);
                for (const auto &r : resolver.resolve(scope, site)) {
                    ReferenceRecord ref;
                    ref.repo_id = repo_id;
                    ref.source_symbol_id = source;
                    ref.target_symbol_id = r.target;
                    ref.target_name = r.target_name;
                    ref.target_path = r.target_path;
                    ref.type = site.type;
                    ref.is_external = r.is_external();
                    ref.is_ambiguous = r.is_ambiguous;
                    ref.line = site.line;
                    ref.argument_hint = site.argument_hint;
                    refs.push_back(std::move(ref));
                }
            }
        }

        // One transaction per file. A qualified name that moved here from
        // another rewritten file takes that row along; edges left without a
        // target turn external until the rebind.
        std::vector<SymbolUID> ids;
        ids.reserve(symbols.size());
        for (const auto &rec : symbols) ids.push_back(rec.id);
        std::vector<SymbolUID> removed;
        if (change.stored) {
            std::unordered_set<SymbolUID> kept(ids.begin(), ids.end());
            for (SymbolUID id : old_symbols[change.stored->id]) {
                if (!kept.count(id)) removed.push_back(id);
            }
        }

        Transaction tx(store_.db());
        if (change.stored) store_.delete_file_graph(change.stored->id);
        store_.delete_symbols(ids);
        RowId file_id = store_.upsert_file(row);
        for (auto &rec : symbols) rec.file_id = file_id;
        for (auto &ref : refs) ref.file_id = file_id;
        store_.insert_symbols(symbols);
        store_.insert_references(refs);
        store_.reset_references_to(removed);
        tx.commit();

        result.symbols_written += static_cast<int64_t>(symbols.size());
        result.references_written += static_cast<int64_t>(refs.size());

        if (heartbeat && (i + 1) % batch_size == 0) heartbeat();
    }

    // ============ Rebind ============
    result.references_rebound = rebind_external_edges(repo_id, resolver);
    if (heartbeat) heartbeat();

    // ============ Repository status ============
    RepositoryRecord counted = store_.refresh_repository_counters(repo_id);
    result.files_total = counted.total_files;
    result.files_parsed = counted.parsed_files;
    result.files_failed = counted.failed_files;

    double failed_fraction = counted.total_files > 0
                                 ? static_cast<double>(counted.failed_files) / static_cast<double>(counted.total_files)
                                 : 0.0;
    std::string error;
    if (failed_fraction > config_.failed_file_threshold) {
        result.status = RepositoryStatus::Failed;
        error = std::to_string(counted.failed_files) + " of " + std::to_string(counted.total_files) +
                " files failed to parse";
    }
    store_.set_repository_status(repo_id, result.status, error);
    result.graph_writes = store_.graph_write_count() - writes_before;

    log_info("Indexing complete", {IntField("repo_id", repo_id), StringField("status", to_string(result.status)),
                                   IntField("parsed", result.files_parsed), IntField("failed", result.files_failed),
                                   IntField("symbols_written", result.symbols_written),
                                   IntField("references_written", result.references_written),
                                   IntField("rebound", result.references_rebound)});
    return result;
}

int64_t Indexer::rebind_external_edges(RowId repo_id, const Resolver &resolver) {
    Transaction tx(store_.db());
    store_.reset_dangling_references(repo_id);

    int64_t rebound = 0;
    for (const auto &ref : store_.external_references(repo_id)) {
        auto targets = resolver.rebind(ref.target_name, ref.target_path);
        if (targets.empty()) continue;
        store_.bind_reference(ref, targets);
        ++rebound;
    }
    tx.commit();
    return rebound;
}

} // namespace cartograph
