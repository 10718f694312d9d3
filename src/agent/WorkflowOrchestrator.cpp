#include <chrono>
#include <numeric>
#include <sstream>
#include <spdlog/spdlog.h>

#include "agent/WorkflowOrchestrator.hpp"
#include "agent/QueryAnalyzer.hpp"
#include "LogManager.hpp"
#include "utils/TextUtils.hpp"

namespace hybrid_agent {

namespace {

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

// Absent and null both mean "use the default"
const json* option_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return nullptr;
    return &(*it);
}

}

WorkflowOrchestrator::WorkflowOrchestrator(std::shared_ptr<GraphRetriever> graph,
                                           std::shared_ptr<WebRetriever> web,
                                           std::shared_ptr<SimilarityCache> cache,
                                           std::shared_ptr<AnswerSynthesizer> synthesizer)
    : graph_(std::move(graph)), web_(std::move(web)), cache_(std::move(cache)), synthesizer_(std::move(synthesizer)) {
    if (!graph_ || !web_ || !synthesizer_) {
        throw std::invalid_argument("WorkflowOrchestrator requires graph, web and synthesizer components");
    }
}

// --- STATE MACHINE ---

Step WorkflowOrchestrator::transition(Step current, const QueryOptions& options) {
    switch (current) {
        case Step::ROUTE: return Step::ANALYZE;
        case Step::ANALYZE: return options.use_graph ? Step::SEARCH_GRAPH : Step::SEARCH_INTERNET;
        case Step::SEARCH_GRAPH: return options.use_internet ? Step::SEARCH_INTERNET : Step::GENERATE;
        case Step::SEARCH_INTERNET: return Step::GENERATE;
        case Step::GENERATE: return Step::FORMAT;
        case Step::FORMAT: return Step::DONE;
        case Step::DONE: return Step::DONE;
    }
    return Step::DONE;
}

Step WorkflowOrchestrator::next_step(Step current, const RunState& state) {
    Step next = transition(current, state.options);
    if (!is_terminal_step(next) && state.iterations >= MAX_ITERATIONS) {
        return Step::GENERATE;
    }
    return next;
}

void WorkflowOrchestrator::run(RunState& state, const std::string& query_id) {
    Step step = Step::ROUTE;
    state.next_step = step;

    while (step != Step::DONE) {
        if (!is_terminal_step(step)) {
            if (state.iterations >= MAX_ITERATIONS) {
                state.max_iterations_reached = true;
                state.reasoning_trace.push_back("Iteration limit reached, skipping to answer generation");
                spdlog::warn("⚠️ Iteration limit ({}) reached before {}", MAX_ITERATIONS, step_to_string(step));
                step = Step::GENERATE;
                state.next_step = step;
                continue;
            }
            state.iterations++;
        }

        auto t_start = std::chrono::high_resolution_clock::now();
        execute_step(step, state);
        auto t_end = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(t_end - t_start).count();

        std::string detail = state.reasoning_trace.empty() ? "" : state.reasoning_trace.back();
        LogManager::instance().add_trace({query_id, step_to_string(step), detail, ms});

        Step planned = transition(step, state.options);
        Step next = next_step(step, state);
        if (next != planned) state.max_iterations_reached = true;

        step = next;
        state.next_step = step;
    }
    state.next_step.reset();
}

void WorkflowOrchestrator::execute_step(Step step, RunState& state) {
    switch (step) {
        case Step::ROUTE: do_route(state); break;
        case Step::ANALYZE: do_analyze(state); break;
        case Step::SEARCH_GRAPH: do_search_graph(state); break;
        case Step::SEARCH_INTERNET: do_search_internet(state); break;
        case Step::GENERATE: do_generate(state); break;
        case Step::FORMAT: do_format(state); break;
        case Step::DONE: break;
    }
}

// --- STEPS ---

void WorkflowOrchestrator::do_route(RunState& state) {
    spdlog::info("🧭 Routing query: {}", state.query);
    state.route = QueryAnalyzer::route(state.query, state.options);
    state.completed_steps.push_back(step_to_string(Step::ROUTE));
    state.reasoning_trace.push_back("Query routed to steps: " + join(state.route.step_names(), ", "));
}

void WorkflowOrchestrator::do_analyze(RunState& state) {
    spdlog::info("🔬 Analyzing query: {}", state.query);
    state.analysis = QueryAnalyzer::analyze(state.query);
    state.completed_steps.push_back(step_to_string(Step::ANALYZE));
    state.reasoning_trace.push_back("Query analysis: " + state.analysis.to_json().dump());
}

void WorkflowOrchestrator::do_search_graph(RunState& state) {
    if (!state.options.use_graph) {
        state.completed_steps.push_back(step_to_string(Step::SEARCH_GRAPH));
        state.reasoning_trace.push_back("Graph search disabled by options");
        return;
    }

    spdlog::info("🕸️ Searching graph for: {}", state.query);
    try {
        std::string backend_error;
        auto results = graph_->search(state.query, state.options.max_results, &backend_error);
        state.graph_count += results.size();
        if (!backend_error.empty()) {
            state.last_error = "Graph search error: " + backend_error;
            state.reasoning_trace.push_back(*state.last_error);
            state.reasoning_trace.push_back("Using " + std::to_string(results.size()) + " fallback graph results");
        } else {
            state.reasoning_trace.push_back("Found " + std::to_string(results.size()) + " graph results");
        }
        for (auto& d : results) state.documents.push_back(std::move(d));
    } catch (const std::exception& e) {
        spdlog::error("❌ Graph step failed: {}", e.what());
        state.last_error = std::string("Graph search error: ") + e.what();
        state.reasoning_trace.push_back(*state.last_error);
    }
    state.completed_steps.push_back(step_to_string(Step::SEARCH_GRAPH));
}

void WorkflowOrchestrator::do_search_internet(RunState& state) {
    if (!state.options.use_internet) {
        state.completed_steps.push_back(step_to_string(Step::SEARCH_INTERNET));
        state.reasoning_trace.push_back("Internet search disabled by options");
        return;
    }

    spdlog::info("🌐 Searching internet for: {}", state.query);
    try {
        std::string backend_error;
        auto web_results = web_->search(state.query, state.options.max_results, &backend_error);
        size_t web_n = web_results.size();
        if (!backend_error.empty()) {
            state.last_error = "Internet search error: " + backend_error;
            state.reasoning_trace.push_back(*state.last_error);
        }
        state.internet_count += web_n;
        for (auto& d : web_results) state.documents.push_back(std::move(d));

        std::vector<Document> semantic;
        if (cache_) semantic = cache_->query(state.query, state.options.max_results / 2);
        state.semantic_count += semantic.size();
        for (auto& d : semantic) state.documents.push_back(std::move(d));

        state.reasoning_trace.push_back("Found " + std::to_string(web_n) +
                                        (backend_error.empty() ? " internet results and " : " mock internet results and ") +
                                        std::to_string(semantic.size()) + " semantic results");
    } catch (const std::exception& e) {
        spdlog::error("❌ Internet step failed: {}", e.what());
        state.last_error = std::string("Internet search error: ") + e.what();
        state.reasoning_trace.push_back(*state.last_error);
    }
    state.completed_steps.push_back(step_to_string(Step::SEARCH_INTERNET));
}

void WorkflowOrchestrator::do_generate(RunState& state) {
    auto result = synthesizer_->synthesize(state.query, state.documents);
    state.final_answer = std::move(result.answer);
    state.key_points = std::move(result.key_points);
    state.summary = std::move(result.summary);
    state.sources = std::move(result.sources);
    state.completed_steps.push_back(step_to_string(Step::GENERATE));
    state.reasoning_trace.push_back("Answer generated from " + std::to_string(state.documents.size()) +
                                    " documents (mode: " + synthesis_mode_to_string(result.mode) + ")");
}

void WorkflowOrchestrator::do_format(RunState& state) {
    double confidence = 0.0;
    if (!state.documents.empty()) {
        double total = std::accumulate(state.documents.begin(), state.documents.end(), 0.0,
                                       [](double acc, const Document& d) { return acc + d.confidence; });
        confidence = total / (double)state.documents.size();
    }

    state.completed_steps.push_back(step_to_string(Step::FORMAT));
    state.structured_output = {
        {"key_points", state.key_points},
        {"summary", state.summary},
        {"confidence", confidence},
        {"reasoning", state.reasoning_trace},
        {"steps_completed", state.completed_steps},
        {"route", state.route.step_names()}
    };
    state.should_continue = false;
    spdlog::info("📦 Formatted final answer with {} sources", state.sources.size());
}

// --- ENTRY POINT ---

std::optional<std::string> WorkflowOrchestrator::parse_options(const json& j, QueryOptions& out) {
    out = QueryOptions{};
    if (j.is_null()) return std::nullopt;
    if (!j.is_object()) return std::string("options must be an object");

    if (const json* v = option_field(j, "use_graph")) {
        if (!v->is_boolean()) return std::string("options.use_graph must be a boolean");
        out.use_graph = v->get<bool>();
    }
    if (const json* v = option_field(j, "use_internet")) {
        if (!v->is_boolean()) return std::string("options.use_internet must be a boolean");
        out.use_internet = v->get<bool>();
    }
    if (const json* v = option_field(j, "max_results")) {
        if (!v->is_number_integer()) return std::string("options.max_results must be an integer");
        long long n = v->get<long long>();
        if (n < 1 || n > MAX_RESULTS_LIMIT) {
            return "options.max_results must be between 1 and " + std::to_string(MAX_RESULTS_LIMIT);
        }
        out.max_results = (int)n;
    }
    return std::nullopt;
}

std::string WorkflowOrchestrator::next_query_id() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::stringstream ss;
    ss << "q-" << ms << "-" << ++query_counter_;
    return ss.str();
}

QueryResponse WorkflowOrchestrator::process_query(const std::string& query, const json& options, const json& context) {
    auto t_start = std::chrono::high_resolution_clock::now();

    QueryLog log;
    log.timestamp = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    log.query_id = next_query_id();
    log.query = utf8_truncate(query, 200);

    auto finish = [&](QueryResponse response, const std::vector<std::string>& steps, size_t n_sources) {
        auto t_end = std::chrono::high_resolution_clock::now();
        log.duration_ms = std::chrono::duration<double, std::milli>(t_end - t_start).count();
        log.status = response.ok() ? "success" : "error";
        log.error_code = error_code_to_string(response.error);
        log.steps = steps;
        log.source_count = n_sources;
        LogManager::instance().add_log(log);
        response.query_id = log.query_id;
        return response;
    };

    std::string trimmed = trim(query);
    if (trimmed.empty()) {
        spdlog::warn("⚠️ Rejected empty query");
        return finish(QueryResponse::failure(ErrorCode::INVALID_REQUEST, "Query cannot be empty"), {}, 0);
    }

    QueryOptions opts;
    if (auto err = parse_options(options, opts)) {
        spdlog::warn("⚠️ Rejected query options: {}", *err);
        return finish(QueryResponse::failure(ErrorCode::INVALID_REQUEST, *err), {}, 0);
    }

    spdlog::info("🚀 Processing [{}]: {}", log.query_id, utf8_truncate(trimmed, 50));

    try {
        RunState state(trimmed, opts);
        if (context.is_object()) state.context = context;

        run(state, log.query_id);

        QueryResponse response;
        response.answer = state.final_answer;
        response.sources = state.sources;
        response.structured_output = state.structured_output;
        response.context = state.context;

        spdlog::info("✅ [{}] {} documents, {} iterations, steps: {}", log.query_id, state.documents.size(),
                     state.iterations, join(state.completed_steps, " -> "));
        return finish(std::move(response), state.completed_steps, state.documents.size());
    } catch (const std::exception& e) {
        spdlog::error("💥 Processing failed [{}]: {}", log.query_id, e.what());
        return finish(QueryResponse::failure(ErrorCode::PROCESSING_ERROR, "Failed to process query"), {}, 0);
    }
}

}
