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

#include "cartograph/entry_points.hpp"
#include "cartograph/errors.hpp"
#include "cartograph/logging.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace cartograph {

namespace {

// ============ Text helpers ============

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string simple_name(const std::string &name) {
    size_t pos = name.find_last_of(".:");
    return pos == std::string::npos ? name : name.substr(pos + 1);
}

// String value of `key = "..."` inside an annotation, or ""
std::string named_string(const std::string &text, const std::string &key) {
    size_t pos = 0;
    while ((pos = text.find(key, pos)) != std::string::npos) {
        size_t after = pos + key.size();
        bool starts_word = pos == 0 || !(std::isalnum(static_cast<unsigned char>(text[pos - 1])) || text[pos - 1] == '_');
        while (after < text.size() && std::isspace(static_cast<unsigned char>(text[after]))) ++after;
        if (starts_word && after < text.size() && text[after] == '=') {
            return first_string_literal(text.substr(after + 1));
        }
        pos = after;
    }
    return "";
}

// Text between the first '(' and its matching ')'
std::string argument_text(const std::string &text) {
    size_t open = text.find('(');
    size_t close = text.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close <= open) return "";
    return text.substr(open + 1, close - open - 1);
}

std::string join_paths(const std::string &prefix, const std::string &path) {
    if (prefix.empty()) return path;
    if (path.empty()) return prefix;
    std::string out = prefix;
    if (out.back() == '/') out.pop_back();
    if (path.front() != '/') out += '/';
    return out + path;
}

const std::string *find_annotation(const SymbolView &view, std::initializer_list<const char *> names) {
    for (const auto &a : view.annotations) {
        std::string name = simple_name(annotation_name(a));
        for (const char *n : names) {
            if (name == n) return &a;
        }
    }
    return nullptr;
}

std::vector<std::string> json_strings(const json &metadata, const char *key) {
    std::vector<std::string> out;
    auto it = metadata.find(key);
    if (it == metadata.end() || !it->is_array()) return out;
    for (const auto &v : *it) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

bool is_callable(const SymbolView &view) {
    return view.symbol.kind == SymbolKind::Function || view.symbol.kind == SymbolKind::Method;
}

// Path declared on the enclosing type (@RequestMapping / @Path)
std::string parent_path(const SymbolView &view, std::initializer_list<const char *> names) {
    if (!view.parent) return "";
    for (const auto &a : json_strings(view.parent->metadata, "annotations")) {
        std::string name = simple_name(annotation_name(a));
        for (const char *n : names) {
            if (name == n) {
                std::string p = named_string(a, "value");
                if (p.empty()) p = named_string(a, "path");
                return p.empty() ? first_string_literal(a) : p;
            }
        }
    }
    return "";
}

const char *const HTTP_VERBS[] = {"get", "post", "put", "delete", "patch"};

bool is_http_verb(const std::string &name) {
    for (const char *v : HTTP_VERBS) {
        if (name == v) return true;
    }
    return false;
}

// Outgoing calls shaped like `router.get("/path", ...)`
json route_calls(const SymbolView &view, bool include_all) {
    json routes = json::array();
    for (const auto &ref : view.calls) {
        if (ref.type != ReferenceType::Call) continue;
        std::string name = to_lower(ref.target_name);
        if (!(is_http_verb(name) || (include_all && name == "all"))) continue;
        if (ref.argument_hint.empty() || ref.argument_hint.front() != '/') continue;
        routes.push_back(json{{"method", to_upper(name)}, {"path", ref.argument_hint}});
    }
    return routes;
}

// ============ Rule predicates ============

std::optional<json> spring_mapping(const SymbolView &view) {
    if (!is_callable(view)) return std::nullopt;
    const std::string *a =
        find_annotation(view, {"GetMapping", "PostMapping", "PutMapping", "DeleteMapping", "PatchMapping", "RequestMapping"});
    if (!a) return std::nullopt;

    std::string name = simple_name(annotation_name(*a));
    std::string method = "ANY";
    if (name != "RequestMapping") {
        method = to_upper(name.substr(0, name.size() - std::string("Mapping").size()));
    } else {
        size_t pos = a->find("RequestMethod.");
        if (pos != std::string::npos) {
            size_t start = pos + std::string("RequestMethod.").size();
            size_t end = start;
            while (end < a->size() && std::isalpha(static_cast<unsigned char>((*a)[end]))) ++end;
            method = a->substr(start, end - start);
        }
    }

    std::string path = named_string(*a, "value");
    if (path.empty()) path = named_string(*a, "path");
    if (path.empty()) path = first_string_literal(*a);
    path = join_paths(parent_path(view, {"RequestMapping"}), path);
    return json{{"method", method}, {"path", path.empty() ? "/" : path}};
}

std::optional<json> spring_controller(const SymbolView &view) {
    if (!is_type_kind(view.symbol.kind)) return std::nullopt;
    if (!find_annotation(view, {"RestController", "Controller"})) return std::nullopt;
    json meta = json::object();
    for (const auto &a : view.annotations) {
        if (simple_name(annotation_name(a)) == "RequestMapping") meta["path"] = first_string_literal(a);
    }
    return meta;
}

std::optional<json> jaxrs_method(const SymbolView &view) {
    if (!is_callable(view)) return std::nullopt;
    const std::string *verb = find_annotation(view, {"GET", "POST", "PUT", "DELETE", "PATCH", "HEAD", "OPTIONS"});
    if (!verb) return std::nullopt;
    std::string path;
    if (const std::string *p = find_annotation(view, {"Path"})) path = first_string_literal(*p);
    path = join_paths(parent_path(view, {"Path"}), path);
    return json{{"method", simple_name(annotation_name(*verb))}, {"path", path.empty() ? "/" : path}};
}

std::optional<json> kafka_listener(const SymbolView &view) {
    const std::string *a = find_annotation(view, {"KafkaListener"});
    if (!a) return std::nullopt;
    std::string topic = named_string(*a, "topics");
    if (topic.empty()) topic = first_string_literal(*a);
    return json{{"topic", topic}};
}

std::optional<json> pulsar_listener(const SymbolView &view) {
    const std::string *a = find_annotation(view, {"PulsarListener", "PulsarConsumer"});
    if (!a) return std::nullopt;
    std::string topic = named_string(*a, "topics");
    if (topic.empty()) topic = first_string_literal(*a);
    return json{{"topic", topic}};
}

std::optional<json> scheduled(const SymbolView &view) {
    if (!is_callable(view)) return std::nullopt;
    const std::string *a = find_annotation(view, {"Scheduled"});
    if (!a) return std::nullopt;
    std::string schedule = named_string(*a, "cron");
    if (schedule.empty()) schedule = argument_text(*a);
    return json{{"schedule", schedule}};
}

std::optional<json> camel_configure(const SymbolView &view) {
    if (!is_callable(view) || view.symbol.name != "configure") return std::nullopt;
    bool route_builder = false;
    if (view.parent) {
        for (const auto &base : json_strings(view.parent->metadata, "bases")) {
            if (base.find("RouteBuilder") != std::string::npos) route_builder = true;
        }
    }
    std::string endpoint;
    for (const auto &ref : view.calls) {
        if (ref.type == ReferenceType::Call && ref.target_name == "from") {
            endpoint = ref.argument_hint;
            break;
        }
    }
    if (!route_builder && endpoint.empty()) return std::nullopt;
    return json{{"topic", endpoint}};
}

std::optional<json> camel_from_call(const SymbolView &view) {
    if (is_type_kind(view.symbol.kind)) return std::nullopt;
    for (const auto &ref : view.calls) {
        if (ref.type == ReferenceType::Call && ref.target_name == "from" && !ref.argument_hint.empty()) {
            return json{{"topic", ref.argument_hint}};
        }
    }
    return std::nullopt;
}

std::optional<json> verb_routes(const SymbolView &view, bool include_all) {
    if (is_type_kind(view.symbol.kind)) return std::nullopt;
    json routes = route_calls(view, include_all);
    if (routes.empty()) return std::nullopt;
    json meta = routes.front();
    if (routes.size() > 1) meta["routes"] = routes;
    return meta;
}

std::optional<json> ktor_routing(const SymbolView &view) { return verb_routes(view, false); }

std::optional<json> express_route(const SymbolView &view) { return verb_routes(view, true); }

// @app.route("/x", methods=["POST"]) and friends
std::optional<json> python_route(const SymbolView &view, bool fastapi) {
    if (!is_callable(view)) return std::nullopt;
    for (const auto &d : view.annotations) {
        std::string name = annotation_name(d);
        std::string last = simple_name(name);
        if (name == last) continue; // needs a receiver: app.route, router.get
        if (!fastapi && last == "route") {
            std::string method = named_string(d, "methods");
            return json{{"method", method.empty() ? "GET" : to_upper(method)}, {"path", first_string_literal(d)}};
        }
        if (fastapi && (is_http_verb(last) || last == "websocket" || last == "api_route")) {
            return json{{"method", last == "api_route" ? "ANY" : to_upper(last)}, {"path", first_string_literal(d)}};
        }
    }
    return std::nullopt;
}

std::optional<json> flask_route(const SymbolView &view) { return python_route(view, false); }

std::optional<json> fastapi_route(const SymbolView &view) { return python_route(view, true); }

std::optional<json> django_view(const SymbolView &view) {
    if (is_callable(view)) {
        for (const auto &d : view.annotations) {
            std::string name = simple_name(annotation_name(d));
            if (name == "api_view" || name == "action") {
                std::string method = first_string_literal(d);
                return json{{"method", method.empty() ? "GET" : to_upper(method)}};
            }
        }
        return std::nullopt;
    }
    for (const auto &base : view.bases) {
        if (base.find("APIView") != std::string::npos || base.find("ViewSet") != std::string::npos) {
            return json::object();
        }
    }
    return std::nullopt;
}

std::optional<json> celery_task(const SymbolView &view) {
    if (!is_callable(view)) return std::nullopt;
    for (const auto &d : view.annotations) {
        std::string name = simple_name(annotation_name(d));
        if (name == "task" || name == "shared_task") {
            std::string topic = named_string(d, "name");
            return json{{"topic", topic.empty() ? view.symbol.name : topic}};
        }
    }
    return std::nullopt;
}

std::optional<json> python_consumer(const SymbolView &view) {
    if (is_type_kind(view.symbol.kind)) return std::nullopt;
    for (const auto &ref : view.calls) {
        if (ref.type != ReferenceType::Call) continue;
        if (ref.target_name == "KafkaConsumer" || ref.target_name == "subscribe") {
            return json{{"topic", ref.argument_hint}};
        }
    }
    return std::nullopt;
}

std::optional<json> apscheduler_job(const SymbolView &view) {
    if (!is_callable(view)) return std::nullopt;
    for (const auto &d : view.annotations) {
        if (simple_name(annotation_name(d)) == "scheduled_job") {
            return json{{"schedule", argument_text(d)}};
        }
    }
    return std::nullopt;
}

std::optional<json> lambda_handler(const SymbolView &view) {
    if (!is_callable(view)) return std::nullopt;
    if (view.symbol.name != "handler" && view.symbol.name != "lambda_handler") return std::nullopt;
    if (view.parent && view.parent->kind != SymbolKind::Module) return std::nullopt;
    return json::object();
}

// #[get("/")] on actix and rocket handlers
std::optional<json> rust_route(const SymbolView &view) {
    if (!is_callable(view)) return std::nullopt;
    for (const auto &a : view.annotations) {
        std::string name = simple_name(annotation_name(a));
        if (is_http_verb(name)) {
            return json{{"method", to_upper(name)}, {"path", first_string_literal(a)}};
        }
        if (name == "route") {
            std::string method = named_string(a, "method");
            return json{{"method", method.empty() ? "ANY" : to_upper(method)}, {"path", first_string_literal(a)}};
        }
    }
    return std::nullopt;
}

struct FrameworkPattern {
    const char *framework;
    std::vector<const char *> patterns;
};

const std::vector<FrameworkPattern> &framework_patterns(Language lang) {
    static const std::vector<FrameworkPattern> python = {
        {"flask", {"flask"}},
        {"fastapi", {"fastapi"}},
        {"django", {"django", "rest_framework"}},
        {"celery", {"celery"}},
        {"kafka", {"kafka", "confluent_kafka", "aiokafka"}},
        {"pulsar", {"pulsar"}},
        {"apscheduler", {"apscheduler"}},
        {"aws-lambda", {"aws_lambda", "awslambdaric"}},
    };
    static const std::vector<FrameworkPattern> jvm = {
        {"spring-boot", {"org.springframework"}},
        {"jax-rs", {"javax.ws.rs", "jakarta.ws.rs"}},
        {"kafka", {"org.apache.kafka", "org.springframework.kafka"}},
        {"pulsar", {"org.apache.pulsar"}},
        {"apache-camel", {"org.apache.camel"}},
        {"ktor", {"io.ktor"}},
    };
    static const std::vector<FrameworkPattern> javascript = {
        {"express", {"express"}},
        {"aws-lambda", {"aws-lambda", "@aws-sdk", "aws-sdk"}},
        {"kafka", {"kafkajs"}},
    };
    static const std::vector<FrameworkPattern> rust = {
        {"actix", {"actix_web", "actix-web", "actix"}},
        {"rocket", {"rocket"}},
    };
    static const std::vector<FrameworkPattern> none;

    switch (lang) {
    case Language::Python:
        return python;
    case Language::Java:
    case Language::Kotlin:
        return jvm;
    case Language::JavaScript:
        return javascript;
    case Language::Rust:
        return rust;
    default:
        return none;
    }
}

const char *const TEST_PATH_MARKERS[] = {
    "/test/", "/tests/", "/it/", "/integration/", "test.kt", "test.java", "test.py",
    "test.js", "test.rs", "_test.", ".spec.", "spec.kt", "spec.js",
};

} // namespace

// ============ Public helpers ============

std::string annotation_name(const std::string &annotation) {
    size_t start = 0;
    while (start < annotation.size() &&
           (annotation[start] == '@' || annotation[start] == '#' || annotation[start] == '[' || annotation[start] == '!' ||
            std::isspace(static_cast<unsigned char>(annotation[start])))) {
        ++start;
    }
    size_t end = start;
    while (end < annotation.size() && annotation[end] != '(' && annotation[end] != ']' &&
           !std::isspace(static_cast<unsigned char>(annotation[end]))) {
        ++end;
    }
    std::string name = annotation.substr(start, end - start);
    // Kotlin use-site targets: @field:Foo
    size_t colon = name.find(':');
    if (colon != std::string::npos && name.find("::") == std::string::npos) name = name.substr(colon + 1);
    return name;
}

std::string first_string_literal(const std::string &text) {
    for (size_t i = 0; i < text.size(); ++i) {
        char quote = text[i];
        if (quote != '"' && quote != '\'') continue;
        std::string out;
        for (size_t j = i + 1; j < text.size(); ++j) {
            if (text[j] == '\\' && j + 1 < text.size()) {
                out += text[++j];
                continue;
            }
            if (text[j] == quote) return out;
            out += text[j];
        }
        return out;
    }
    return "";
}

bool is_test_path(const std::string &relative_path) {
    std::string path = "/" + to_lower(relative_path);
    for (const char *marker : TEST_PATH_MARKERS) {
        if (path.find(marker) != std::string::npos) return true;
    }
    return false;
}

std::set<std::string> frameworks_for_import(Language lang, const std::string &import_path) {
    std::set<std::string> out;
    std::string lowered = to_lower(import_path);
    for (const auto &fp : framework_patterns(lang)) {
        for (const char *pattern : fp.patterns) {
            if (lowered.find(pattern) != std::string::npos) {
                out.insert(fp.framework);
                break;
            }
        }
    }
    return out;
}

const std::vector<DetectionRule> &detection_rules() {
    using L = Language;
    using T = EntryPointType;
    static const std::vector<DetectionRule> rules = {
        {"spring_request_mapping", {L::Java, L::Kotlin}, "spring-boot", T::Http, 0.95, spring_mapping},
        {"spring_rest_controller", {L::Java, L::Kotlin}, "spring-boot", T::Http, 0.6, spring_controller},
        {"spring_scheduled", {L::Java, L::Kotlin}, "spring-boot", T::Scheduler, 0.9, scheduled},
        {"jax_rs_resource_method", {L::Java, L::Kotlin}, "jax-rs", T::Http, 0.9, jaxrs_method},
        {"kafka_listener", {L::Java, L::Kotlin}, "kafka", T::Event, 0.9, kafka_listener},
        {"pulsar_listener", {L::Java, L::Kotlin}, "pulsar", T::Event, 0.85, pulsar_listener},
        {"camel_configure_method", {L::Java, L::Kotlin}, "apache-camel", T::Event, 0.85, camel_configure},
        {"camel_from_call", {L::Java, L::Kotlin}, "apache-camel", T::Event, 0.75, camel_from_call},
        {"ktor_route", {L::Kotlin}, "ktor", T::Http, 0.8, ktor_routing},
        {"flask_route", {L::Python}, "flask", T::Http, 0.9, flask_route},
        {"fastapi_route", {L::Python}, "fastapi", T::Http, 0.9, fastapi_route},
        {"django_view", {L::Python}, "django", T::Http, 0.8, django_view},
        {"celery_task", {L::Python}, "celery", T::Event, 0.85, celery_task},
        {"kafka_consumer", {L::Python}, "kafka", T::Event, 0.75, python_consumer},
        {"apscheduler_job", {L::Python}, "apscheduler", T::Scheduler, 0.85, apscheduler_job},
        {"lambda_handler", {L::Python, L::JavaScript}, "aws-lambda", T::Event, 0.8, lambda_handler},
        {"express_route", {L::JavaScript}, "express", T::Http, 0.85, express_route},
        {"actix_route", {L::Rust}, "actix", T::Http, 0.9, rust_route},
        {"rocket_route", {L::Rust}, "rocket", T::Http, 0.9, rust_route},
    };
    return rules;
}

json DetectionResult::to_json() const {
    return json{{"run_id", run_id},
                {"candidates_detected", candidates_detected},
                {"entry_points_confirmed", entry_points_confirmed},
                {"frameworks_detected", frameworks_detected},
                {"by_type", by_type},
                {"by_framework", by_framework},
                {"reused_existing", reused_existing}};
}

// ============ EntryPointDetector ============

EntryPointDetector::EntryPointDetector(GraphStore &store, const Config &config,
                                       std::shared_ptr<Collaborator> collaborator)
    : store_(store), config_(config), collaborator_(std::move(collaborator)) {}

std::vector<EntryPointCandidateRecord> EntryPointDetector::find_candidates(RowId repo_id,
                                                                           std::vector<std::string> &frameworks) {
    std::vector<SymbolRecord> symbols = store_.repository_symbols(repo_id);

    std::unordered_map<SymbolUID, const SymbolRecord *> by_id;
    std::map<Language, std::set<std::string>> language_frameworks;
    std::set<std::string> all_frameworks;
    for (const auto &sym : symbols) {
        by_id[sym.id] = &sym;
        if (sym.kind != SymbolKind::Import) continue;
        auto path = sym.metadata.find("import_path");
        if (path == sym.metadata.end() || !path->is_string()) continue;
        for (const auto &fw : frameworks_for_import(sym.language, path->get<std::string>())) {
            language_frameworks[sym.language].insert(fw);
            all_frameworks.insert(fw);
        }
    }
    frameworks.assign(all_frameworks.begin(), all_frameworks.end());

    std::unordered_map<SymbolUID, std::vector<ReferenceRecord>> calls;
    for (auto &ref : store_.repository_references(repo_id)) {
        calls[ref.source_symbol_id].push_back(std::move(ref));
    }
    static const std::vector<ReferenceRecord> no_calls;

    // Best candidate per symbol
    std::unordered_map<SymbolUID, EntryPointCandidateRecord> best;
    std::vector<SymbolUID> order;

    for (const auto &sym : symbols) {
        if (sym.kind == SymbolKind::Import || is_test_path(sym.file_path)) continue;
        auto fw = language_frameworks.find(sym.language);
        if (fw == language_frameworks.end()) continue;

        auto parent = by_id.find(sym.parent_id);
        auto found = calls.find(sym.id);
        SymbolView view{sym, parent == by_id.end() ? nullptr : parent->second, {}, json_strings(sym.metadata, "bases"),
                        found == calls.end() ? no_calls : found->second};
        for (const char *key : {"annotations", "decorators", "attributes"}) {
            for (auto &a : json_strings(sym.metadata, key)) view.annotations.push_back(std::move(a));
        }

        for (const auto &rule : detection_rules()) {
            if (!rule.languages.count(sym.language) || !fw->second.count(rule.framework)) continue;
            auto it = best.find(sym.id);
            if (it != best.end() && it->second.confidence >= rule.confidence) continue;

            std::optional<json> metadata = rule.predicate(view);
            if (!metadata) continue;

            EntryPointCandidateRecord c;
            c.repo_id = repo_id;
            c.symbol_id = sym.id;
            c.file_path = sym.file_path;
            c.symbol_name = sym.name;
            c.qualified_name = sym.qualified_name;
            c.type = rule.type;
            c.framework = rule.framework;
            c.detection_pattern = rule.id;
            c.metadata = std::move(*metadata);
            c.confidence = rule.confidence;
            if (it == best.end()) {
                order.push_back(sym.id);
                best.emplace(sym.id, std::move(c));
            } else {
                it->second = std::move(c);
            }
        }
    }

    std::vector<EntryPointCandidateRecord> out;
    out.reserve(order.size());
    for (SymbolUID id : order) out.push_back(std::move(best[id]));
    return out;
}

std::vector<EntryPointRecord> EntryPointDetector::confirm(const RepositoryRecord &repo,
                                                          const std::vector<std::string> &frameworks,
                                                          const std::vector<EntryPointCandidateRecord> &candidates) {
    RepositoryContext context{repo.name, repo.languages, frameworks};
    const size_t batch_size = std::max(1u, config_.entry_point_batch_size);
    const auto timeout = std::chrono::milliseconds(static_cast<int64_t>(config_.collaborator_timeout_seconds) * 1000);

    std::vector<EntryPointRecord> confirmed;
    for (EntryPointType type : {EntryPointType::Http, EntryPointType::Event, EntryPointType::Scheduler}) {
        std::vector<const EntryPointCandidateRecord *> of_type;
        for (const auto &c : candidates) {
            if (c.type == type) of_type.push_back(&c);
        }

        for (size_t start = 0; start < of_type.size(); start += batch_size) {
            size_t end = std::min(start + batch_size, of_type.size());
            std::vector<CandidateEvidence> batch;
            for (size_t i = start; i < end; ++i) {
                CandidateEvidence ev;
                ev.candidate = *of_type[i];
                if (auto sym = store_.get_symbol(repo.id, ev.candidate.symbol_id)) {
                    ev.kind = sym->kind;
                    ev.language = language_to_string(sym->language);
                    ev.signature = sym->signature;
                    ev.snippet = head_lines(sym->source_text, config_.snippet_max_lines);
                }
                batch.push_back(std::move(ev));
            }

            auto collaborator = collaborator_;
            auto verdicts = call_with_timeout<std::vector<EntryPointVerdict>>(
                [collaborator, context, type, batch] { return collaborator->confirm_entry_points(context, type, batch); },
                timeout, "Entry point confirmation");

            int64_t accepted = 0;
            for (const auto &v : verdicts) {
                if (v.candidate_index >= batch.size() || !v.is_entry_point) continue;
                if (v.name.empty()) {
                    log_warn("Verdict without a name", {IntField("candidate_index", static_cast<int64_t>(v.candidate_index))});
                    continue;
                }
                const auto &c = batch[v.candidate_index].candidate;
                EntryPointRecord ep;
                ep.repo_id = repo.id;
                ep.candidate_id = c.id;
                ep.symbol_id = c.symbol_id;
                ep.file_path = c.file_path;
                ep.qualified_name = c.qualified_name;
                ep.type = c.type;
                ep.framework = c.framework;
                ep.name = v.name;
                ep.description = v.description;
                ep.metadata = c.metadata;
                ep.confidence = v.confidence;
                ep.reasoning = v.reasoning;
                confirmed.push_back(std::move(ep));
                ++accepted;
            }
            log_info("Confirmation batch", {StringField("type", to_string(type)),
                                            IntField("batch_index", static_cast<int64_t>(start / batch_size)),
                                            IntField("batch_size", static_cast<int64_t>(batch.size())),
                                            IntField("confirmed", accepted)});
        }
    }
    return confirmed;
}

DetectionResult EntryPointDetector::existing_result(RowId repo_id) {
    DetectionResult result;
    result.reused_existing = true;
    auto candidates = store_.list_candidates(repo_id);
    result.candidates_detected = static_cast<int64_t>(candidates.size());
    if (!candidates.empty()) result.run_id = candidates.front().run_id;

    std::set<std::string> frameworks;
    for (const auto &ep : store_.list_entry_points(repo_id, std::nullopt, "")) {
        result.entry_points_confirmed++;
        result.by_type[to_string(ep.type)]++;
        result.by_framework[ep.framework]++;
        frameworks.insert(ep.framework);
    }
    result.frameworks_detected.assign(frameworks.begin(), frameworks.end());
    return result;
}

DetectionResult EntryPointDetector::detect(RowId repo_id, bool force) {
    RepositoryRecord repo = store_.get_repository(repo_id);
    if (repo.status == RepositoryStatus::Pending || repo.status == RepositoryStatus::Parsing) {
        throw InvalidState("Repository " + std::to_string(repo_id) + " is not indexed yet");
    }
    if (!force && store_.count_entry_points(repo_id) > 0) {
        log_info("Entry points already detected", {IntField("repo_id", repo_id)});
        return existing_result(repo_id);
    }

    DetectionResult result;
    std::vector<EntryPointCandidateRecord> candidates = find_candidates(repo_id, result.frameworks_detected);

    result.run_id = store_.next_candidate_run(repo_id);
    for (auto &c : candidates) c.run_id = result.run_id;
    {
        Transaction tx(store_.db());
        store_.insert_candidates(candidates);
        tx.commit();
    }
    result.candidates_detected = static_cast<int64_t>(candidates.size());
    log_info("Entry point candidates", {IntField("repo_id", repo_id), IntField("run_id", result.run_id),
                                        IntField("candidates", result.candidates_detected)});

    std::vector<EntryPointRecord> confirmed = confirm(repo, result.frameworks_detected, candidates);
    store_.replace_entry_points(repo_id, confirmed);

    result.entry_points_confirmed = static_cast<int64_t>(confirmed.size());
    for (const auto &ep : confirmed) {
        result.by_type[to_string(ep.type)]++;
        result.by_framework[ep.framework]++;
    }
    log_info("Entry points confirmed", {IntField("repo_id", repo_id), IntField("confirmed", result.entry_points_confirmed)});
    return result;
}

} // namespace cartograph
