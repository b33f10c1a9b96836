#include "lsbridge/session.hpp"

#include "lsbridge/format.hpp"

#include "internal/text.hpp"
#include "internal/types.hpp"

#include <glaze/glaze.hpp>

#include <unistd.h>

#include <algorithm>
#include <fstream>
#include <future>
#include <sstream>

using namespace lsbridge::literals;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace lsbridge {

    namespace detail {

        template <typename T>
        static std::string to_json(const T& value) {
            std::string json{};
            if (auto ec = glz::write_json(value, json); ec) {
                throw session_error{error_kind::invalid_request, "failed to serialize request payload"};
            }
            return json;
        }

        static fs::path normalize_file(const fs::path& file) {
            std::error_code ec{};
            auto abs = fs::absolute(file, ec);
            if (ec) {
                return file.lexically_normal();
            }
            auto canon = fs::weakly_canonical(abs, ec);
            return ec ? abs.lexically_normal() : canon;
        }

        static std::string read_file(const fs::path& path) {
            std::ifstream in{path, std::ios::binary};
            if (!in) {
                throw session_error{error_kind::io_error, "cannot read {}"_format(path.string())};
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (in.bad()) {
                throw session_error{error_kind::io_error, "error while reading {}"_format(path.string())};
            }
            return ss.str();
        }

        // Temp file beside the target, then rename, so readers never see a partial file.
        static void write_file_atomically(const fs::path& path, std::string_view contents) {
            auto tmp = path;
            tmp += ".lsbridge-{}.tmp"_format(::getpid());
            {
                std::ofstream out{tmp, std::ios::binary | std::ios::trunc};
                if (!out) {
                    throw session_error{error_kind::io_error, "cannot create {}"_format(tmp.string())};
                }
                out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
                out.flush();
                if (!out) {
                    std::error_code ignored{};
                    fs::remove(tmp, ignored);
                    throw session_error{error_kind::io_error, "failed writing {}"_format(tmp.string())};
                }
            }

            std::error_code ec{};
            auto perms = fs::status(path, ec).permissions();
            if (!ec) {
                fs::permissions(tmp, perms, ec);
            }
            fs::rename(tmp, path, ec);
            if (ec) {
                std::error_code ignored{};
                fs::remove(tmp, ignored);
                throw session_error{
                        error_kind::io_error, "cannot replace {}: {}"_format(path.string(), ec.message())};
            }
        }

        // ── glz::generic accessors ──────────────────────────────────────

        static const glz::generic* member(const glz::generic& value, std::string_view key) {
            auto* obj = std::get_if<glz::generic::object_t>(&value.data);
            if (obj == nullptr) {
                return nullptr;
            }
            auto it = obj->find(key);
            return it == obj->end() ? nullptr : &it->second;
        }

        static std::optional<std::string> string_member(const glz::generic& value, std::string_view key) {
            auto* m = member(value, key);
            if (m == nullptr) {
                return std::nullopt;
            }
            if (auto* s = std::get_if<std::string>(&m->data)) {
                return *s;
            }
            return std::nullopt;
        }

        static std::optional<double> number_member(const glz::generic& value, std::string_view key) {
            auto* m = member(value, key);
            if (m == nullptr) {
                return std::nullopt;
            }
            if (auto* d = std::get_if<double>(&m->data)) {
                return *d;
            }
            return std::nullopt;
        }

        static bool is_null(const glz::generic& value) {
            return std::holds_alternative<glz::generic::null_t>(value.data);
        }

        static std::optional<position> as_position(const glz::generic* value) {
            if (value == nullptr) {
                return std::nullopt;
            }
            auto line = number_member(*value, "line");
            auto character = number_member(*value, "character");
            if (!line || !character || *line < 0 || *character < 0) {
                return std::nullopt;
            }
            return position{.line = static_cast<uint32_t>(*line), .character = static_cast<uint32_t>(*character)};
        }

        static std::optional<range> range_member(const glz::generic& value, std::string_view key) {
            auto* r = member(value, key);
            if (r == nullptr) {
                return std::nullopt;
            }
            auto start = as_position(member(*r, "start"));
            auto end = as_position(member(*r, "end"));
            if (!start || !end) {
                return std::nullopt;
            }
            return range{.start = *start, .end = *end};
        }

        static glz::generic parse_result(std::string_view method, const std::string& json) {
            glz::generic value{};
            if (auto ec = glz::read_json(value, json); ec) {
                throw session_error{
                        error_kind::invalid_response,
                        "unparseable {} result: {}"_format(method, glz::format_error(ec, json))};
            }
            return value;
        }

        // MarkupContent, MarkedString, MarkedString[] or a bare string.
        static std::string hover_text(const glz::generic& contents) {
            if (auto* s = std::get_if<std::string>(&contents.data)) {
                return *s;
            }
            if (auto value = string_member(contents, "value")) {
                if (auto language = string_member(contents, "language"); language && !language->empty()) {
                    return "```{}\n{}\n```"_format(*language, *value);
                }
                return *value;
            }
            if (auto* arr = std::get_if<glz::generic::array_t>(&contents.data)) {
                std::vector<std::string> parts{};
                for (const auto& item : *arr) {
                    if (auto part = hover_text(item); !utils::trim_view(part).empty()) {
                        parts.push_back(std::move(part));
                    }
                }
                return utils::join_with_separator(parts, "\n\n");
            }
            return {};
        }

        // Location or LocationLink.
        static std::optional<location> as_location(const glz::generic& value) {
            if (auto uri = string_member(value, "uri")) {
                if (auto span = range_member(value, "range")) {
                    return location{.uri = std::move(*uri), .span = *span};
                }
                return std::nullopt;
            }
            if (auto uri = string_member(value, "targetUri")) {
                auto span = range_member(value, "targetSelectionRange");
                if (!span) {
                    span = range_member(value, "targetRange");
                }
                if (span) {
                    return location{.uri = std::move(*uri), .span = *span};
                }
            }
            return std::nullopt;
        }

        static std::vector<location> as_locations(std::string_view method, const glz::generic& value) {
            std::vector<location> out{};
            if (is_null(value)) {
                return out;
            }
            if (auto* arr = std::get_if<glz::generic::array_t>(&value.data)) {
                for (const auto& item : *arr) {
                    auto loc = as_location(item);
                    if (!loc) {
                        throw session_error{error_kind::invalid_response, "malformed location in {} result"_format(method)};
                    }
                    out.push_back(std::move(*loc));
                }
                return out;
            }
            if (auto loc = as_location(value)) {
                out.push_back(std::move(*loc));
                return out;
            }
            throw session_error{error_kind::invalid_response, "unexpected {} result shape"_format(method)};
        }

        static bool contains(const range& outer, const range& inner) {
            auto before_eq = [](const position& a, const position& b) {
                return a.line < b.line || (a.line == b.line && a.character <= b.character);
            };
            return before_eq(outer.start, inner.start) && before_eq(inner.end, outer.end);
        }

        // SymbolInformation[] is flat; rebuild the hierarchy from range containment.
        static std::vector<document_symbol> nest_by_range(std::vector<document_symbol> flat) {
            std::ranges::stable_sort(flat, [](const document_symbol& a, const document_symbol& b) {
                if (a.span.start.line != b.span.start.line) {
                    return a.span.start.line < b.span.start.line;
                }
                if (a.span.start.character != b.span.start.character) {
                    return a.span.start.character < b.span.start.character;
                }
                if (a.span.end.line != b.span.end.line) {
                    return a.span.end.line > b.span.end.line;
                }
                return a.span.end.character > b.span.end.character;
            });

            std::vector<document_symbol> roots{};
            std::vector<document_symbol*> stack{};
            for (auto& sym : flat) {
                while (!stack.empty() && !contains(stack.back()->span, sym.span)) {
                    stack.pop_back();
                }
                auto& siblings = stack.empty() ? roots : stack.back()->children;
                siblings.push_back(std::move(sym));
                // only the innermost open scope grows, so ancestor pointers stay valid
                stack.push_back(&siblings.back());
            }
            return roots;
        }

        static std::optional<document_symbol> as_document_symbol(const glz::generic& value, bool& flat) {
            auto name = string_member(value, "name");
            auto kind = number_member(value, "kind");
            if (!name || !kind) {
                return std::nullopt;
            }
            document_symbol sym{.name = std::move(*name), .kind = static_cast<int>(*kind)};

            if (auto span = range_member(value, "range")) {
                auto selection = range_member(value, "selectionRange");
                sym.span = *span;
                sym.selection = selection.value_or(*span);
                sym.detail = string_member(value, "detail").value_or("");
                if (auto* children = member(value, "children")) {
                    if (auto* arr = std::get_if<glz::generic::array_t>(&children->data)) {
                        for (const auto& child : *arr) {
                            bool child_flat = false;
                            if (auto c = as_document_symbol(child, child_flat)) {
                                sym.children.push_back(std::move(*c));
                            }
                        }
                    }
                }
                return sym;
            }

            if (auto* loc = member(value, "location")) {
                auto span = range_member(*loc, "range");
                if (!span) {
                    return std::nullopt;
                }
                flat = true;
                sym.span = *span;
                sym.selection = *span;
                sym.detail = string_member(value, "containerName").value_or("");
                return sym;
            }
            return std::nullopt;
        }

    }  // namespace detail

    session_options session_options::from_config(const fs::path& root, const startup_config& cfg) {
        return session_options{
                .root = root,
                .server_path = cfg.server_path,
                .server_args = cfg.server_args,
                .server_log = cfg.server_log,
                .handshake_timeout = std::chrono::milliseconds{cfg.handshake_timeout_ms},
                .request_timeout = std::chrono::milliseconds{cfg.request_timeout_ms},
                .shutdown_grace = std::chrono::milliseconds{cfg.shutdown_grace_ms},
                .max_body_bytes = cfg.max_body_bytes};
    }

    session::session(private_tag, session_options opts, std::shared_ptr<event_sink> events)
            : opts_{std::move(opts)},
              events_{std::move(events)},
              mux_{[this](std::string_view method, std::string_view params) { on_notification(method, params); },
                   [this](std::string_view id, std::string_view method, std::string_view params) {
                       on_server_request(id, method, params);
                   }} {}

    session::~session() {
        close();
    }

    std::shared_ptr<session> session::spawn(session_options opts, std::shared_ptr<event_sink> events) {
        auto s = std::make_shared<session>(private_tag{}, std::move(opts), std::move(events));
        s->start();
        return s;
    }

    std::shared_ptr<session> session::open(session_options opts, std::shared_ptr<event_sink> events) {
        auto s = spawn(std::move(opts), std::move(events));
        try {
            s->initialize();
        } catch (const session_error&) {
            s->close();
            throw;
        }
        return s;
    }

    void session::start() {
        spawn_options spawn_opts{
                .executable = opts_.server_path,
                .args = opts_.server_args,
                .working_directory = opts_.root,
                .stderr_path = opts_.server_log};

        child_process::pipes pipes{};
        process_ = child_process::spawn(spawn_opts, pipes);
        channel_ = std::make_unique<transport_channel>(pipes.stdin_fd, pipes.stdout_fd, opts_.max_body_bytes);
        reader_ = std::jthread{[this] { read_loop(); }};
        log_info("started ", opts_.server_path.string(), " for ", opts_.root.string(), " (pid ", process_.pid(), ")");
    }

    void session::initialize() {
        {
            std::lock_guard lock{state_mutex_};
            if (state_ == session_state::closed || state_ == session_state::degraded) {
                throw session_error{error_kind::backend_disconnected, "session for {} is no longer usable"_format(opts_.root.string())};
            }
            if (state_ != session_state::uninitialized) {
                throw session_error{error_kind::invalid_request, "session for {} is already initialized"_format(opts_.root.string())};
            }
            state_ = session_state::initializing;
        }

        auto root_uri = path_to_uri(opts_.root);
        internal::initialize_params params{
                .processId = static_cast<int>(::getpid()),
                .rootUri = root_uri,
                .rootPath = opts_.root.string(),
                .workspaceFolders = {{.uri = root_uri, .name = opts_.root.filename().string()}}};

        auto started = std::chrono::steady_clock::now();
        try {
            send_request("initialize", detail::to_json(params), opts_.handshake_timeout);
            send_notification("initialized", "{}", started + opts_.handshake_timeout);
        } catch (const session_error& e) {
            mark_degraded();
            if (e.kind() == error_kind::timeout) {
                throw session_error{
                        error_kind::handshake_timeout,
                        "no initialize reply from {} within {}ms"_format(
                                opts_.server_path.string(), opts_.handshake_timeout.count())};
            }
            throw;
        }

        std::lock_guard lock{state_mutex_};
        if (state_ != session_state::initializing) {
            throw session_error{error_kind::backend_disconnected, "language server for {} went away during the handshake"_format(opts_.root.string())};
        }
        state_ = session_state::ready;
        handshake_done_ = true;
        log_info("session ready for ", opts_.root.string(), " after ", to_millis(std::chrono::steady_clock::now() - started), "ms");
    }

    void session::read_loop() {
        std::string reason{"language server closed its output"};
        try {
            while (auto frame = channel_->next_frame()) {
                mux_.dispatch_inbound(*frame);
            }
        } catch (const session_error& e) {
            reason = "{}: {}"_format(e.kind(), e.what());
        } catch (const std::exception& e) {
            reason = "reader failed: {}"_format(e.what());
        }

        if (!process_.is_alive()) {
            if (auto st = process_.status()) {
                reason += " (server {})"_format(st->describe());
            }
        }

        auto failed = mux_.fail_all(error_kind::backend_disconnected, reason);

        disconnect_handler handler{};
        {
            std::lock_guard lock{state_mutex_};
            if (state_ != session_state::closed) {
                state_ = session_state::degraded;
                log_warn("session for ", opts_.root.string(), " disconnected: ", reason, "; ", failed, " request(s) failed");
            }
            handler = on_disconnect_;
        }
        if (handler) {
            handler();
        }
    }

    void session::on_notification(std::string_view method, std::string_view params) {
        if (method == "textDocument/publishDiagnostics"sv) {
            internal::publish_diagnostics_params published{};
            if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(published, params); ec) {
                log_warn("ignoring malformed publishDiagnostics: ", glz::format_error(ec, params));
                return;
            }
            std::vector<diagnostic> converted{};
            converted.reserve(published.diagnostics.size());
            for (auto& d : published.diagnostics) {
                converted.push_back(
                        diagnostic{
                                .span = d.range,
                                .severity = d.severity.value_or(1),
                                .message = std::move(d.message),
                                .source = std::move(d.source)});
            }
            auto key = detail::normalize_file(uri_to_path(published.uri)).string();
            debug_log(converted.size(), " diagnostic(s) for ", key);
            std::lock_guard lock{diagnostics_mutex_};
            diagnostics_[key] = std::move(converted);
            return;
        }
        if (method == "window/logMessage"sv || method == "window/showMessage"sv) {
            internal::log_message_params msg{};
            if (!glz::read<glz::opts{.error_on_unknown_keys = false}>(msg, params)) {
                debug_log("server: ", msg.message);
            }
            return;
        }
        debug_log("notification ", method);
    }

    void session::on_server_request(std::string_view id_json, std::string_view method, std::string_view params) {
        std::string result{"null"};
        if (method == "workspace/configuration"sv) {
            internal::configuration_params config{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(config, params);
            std::vector<std::string> nulls(ec ? 0U : config.items.size(), "null");
            result = "[{}]"_format(utils::join_with_separator(nulls, ","));
        }
        else if (method == "workspace/applyEdit"sv) {
            result = R"({"applied":false})";
        }
        debug_log("answering server request ", method, " id=", id_json, " with ", result);

        internal::reply_message reply{.id = glz::raw_json{std::string{id_json}}, .result = glz::raw_json{result}};
        try {
            // never wait here: a reply the pipe cannot take yet stays queued and the reader flushes it
            channel_->send(detail::to_json(reply), std::chrono::steady_clock::now());
        } catch (const session_error& e) {
            if (e.kind() == error_kind::timeout) {
                debug_log("reply to ", method, " queued behind unread input");
            }
            else {
                log_warn("could not answer ", method, ": ", e.what());
            }
        }
    }

    void session::set_disconnect_handler(disconnect_handler handler) {
        std::lock_guard lock{state_mutex_};
        on_disconnect_ = std::move(handler);
    }

    session_state session::state() const {
        std::lock_guard lock{state_mutex_};
        return state_;
    }

    bool session::healthy() {
        return state() == session_state::ready && !mux_.closed() && process_.is_alive();
    }

    void session::require_ready() const {
        std::lock_guard lock{state_mutex_};
        switch (state_) {
            case session_state::ready:
                return;
            case session_state::uninitialized:
            case session_state::initializing:
                throw session_error{
                        error_kind::handshake_not_complete,
                        "session for {} has not completed the handshake"_format(opts_.root.string())};
            case session_state::degraded:
            case session_state::closed:
                throw session_error{
                        error_kind::backend_disconnected,
                        "session for {} is {}"_format(opts_.root.string(), state_)};
        }
    }

    void session::mark_degraded() {
        std::lock_guard lock{state_mutex_};
        if (state_ != session_state::closed) {
            state_ = session_state::degraded;
        }
    }

    std::string session::send_request(
            std::string_view method, std::string params_json, std::chrono::milliseconds timeout) {
        auto id = mux_.next_id();
        auto deadline = request_multiplexer::clock::now() + timeout;

        std::string body{};
        if (params_json.empty()) {
            body = detail::to_json(internal::bare_request_message{.id = id, .method = std::string{method}});
        }
        else {
            body = detail::to_json(
                    internal::request_message<glz::raw_json>{
                            .id = id, .method = std::string{method}, .params = glz::raw_json{std::move(params_json)}});
        }

        auto future = mux_.register_request(id, std::string{method}, deadline);
        try {
            channel_->send(body, deadline);
        } catch (const session_error& e) {
            if (e.kind() != error_kind::timeout) {
                mux_.fail(id, error_kind::backend_disconnected, e.what());
                mark_degraded();
                throw session_error{error_kind::backend_disconnected, "failed to send {}: {}"_format(method, e.what())};
            }
            // still queued; the wait below reports the timeout
            debug_log(method, " (id ", id, ") not yet written at its deadline");
        }

        if (future.wait_until(deadline) == std::future_status::timeout) {
            // a reply landing between the wait and fail() wins; fail() then returns false
            mux_.fail(id, error_kind::timeout, "{} (id {}) timed out after {}ms"_format(method, id, timeout.count()));
        }

        auto payload = future.get();
        if (payload.error) {
            throw session_error{
                    error_kind::invalid_response,
                    "{} failed: {} (code {})"_format(method, payload.error->message, payload.error->code)};
        }
        return std::move(payload.result);
    }

    void session::send_notification(
            std::string_view method, std::string params_json, std::chrono::steady_clock::time_point deadline) {
        std::string body{};
        if (params_json.empty()) {
            body = detail::to_json(internal::bare_notification_message{.method = std::string{method}});
        }
        else {
            body = detail::to_json(
                    internal::notification_message<glz::raw_json>{
                            .method = std::string{method}, .params = glz::raw_json{std::move(params_json)}});
        }
        try {
            channel_->send(body, deadline);
        } catch (const session_error& e) {
            if (e.kind() == error_kind::timeout) {
                // the notification stays queued and is delivered once the server reads again
                throw session_error{error_kind::timeout, "{} not delivered in time: {}"_format(method, e.what())};
            }
            mark_degraded();
            throw session_error{error_kind::backend_disconnected, "failed to send {}: {}"_format(method, e.what())};
        }
    }

    template <typename F>
    auto session::traced(std::string_view operation, F&& fn) {
        auto started_at = std::chrono::system_clock::now();
        auto t0 = std::chrono::steady_clock::now();

        auto emit = [&](event_status status, std::optional<std::string> error) {
            if (!events_) {
                return;
            }
            try {
                events_->emit(
                        execution_event{
                                .tool_name = std::string{operation},
                                .session_id = opts_.root.string(),
                                .status = status,
                                .started_at = started_at,
                                .duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::steady_clock::now() - t0),
                                .error_message = std::move(error)});
            } catch (const std::exception& e) {
                log_warn("dropping execution event for ", operation, ": ", e.what());
            }
        };

        try {
            auto result = std::forward<F>(fn)();
            emit(event_status::success, std::nullopt);
            return result;
        } catch (const session_error& e) {
            emit(event_status::error, "{}: {}"_format(e.kind(), e.what()));
            throw;
        } catch (const std::exception& e) {
            emit(event_status::error, std::string{e.what()});
            throw;
        }
    }

    std::string session::request(std::string_view method, std::string params_json) {
        return traced(method, [&] {
            require_ready();
            return send_request(method, std::move(params_json), opts_.request_timeout);
        });
    }

    std::string session::ensure_document_open(const fs::path& file) {
        auto uri = path_to_uri(file);
        std::lock_guard lock{documents_mutex_};
        if (open_documents_.contains(uri)) {
            return uri;
        }
        internal::did_open_params params{
                .textDocument = {
                        .uri = uri,
                        .languageId = std::string{language_id_for(file)},
                        .version = 1,
                        .text = detail::read_file(file)}};
        // a didOpen that times out is still queued, so the document counts as open from here
        open_documents_.emplace(uri, 1);
        send_notification(
                "textDocument/didOpen",
                detail::to_json(params),
                std::chrono::steady_clock::now() + opts_.request_timeout);
        return uri;
    }

    hover_info session::hover(const fs::path& file, position pos) {
        return traced("hover", [&] {
            require_ready();
            auto path = detail::normalize_file(file);
            auto uri = ensure_document_open(path);
            internal::position_params params{.textDocument = {.uri = uri}, .position = pos};
            auto result = detail::parse_result(
                    "hover", send_request("textDocument/hover", detail::to_json(params), opts_.request_timeout));

            auto no_info = [&] {
                return session_error{
                        error_kind::invalid_response,
                        "no hover information at {}:{}:{}"_format(path.string(), pos.line + 1, pos.character + 1)};
            };
            if (detail::is_null(result)) {
                throw no_info();
            }
            auto* contents = detail::member(result, "contents");
            if (contents == nullptr) {
                throw no_info();
            }
            hover_info info{.contents = detail::hover_text(*contents), .span = detail::range_member(result, "range")};
            if (utils::trim_view(info.contents).empty()) {
                throw no_info();
            }
            return info;
        });
    }

    std::vector<location> session::definition(const fs::path& file, position pos) {
        return traced("definition", [&] {
            require_ready();
            auto uri = ensure_document_open(detail::normalize_file(file));
            internal::position_params params{.textDocument = {.uri = uri}, .position = pos};
            auto result = detail::parse_result(
                    "definition",
                    send_request("textDocument/definition", detail::to_json(params), opts_.request_timeout));
            return detail::as_locations("definition", result);
        });
    }

    std::vector<location> session::references(const fs::path& file, position pos, bool include_declaration) {
        return traced("references", [&] {
            require_ready();
            auto uri = ensure_document_open(detail::normalize_file(file));
            internal::reference_params params{
                    .textDocument = {.uri = uri},
                    .position = pos,
                    .context = {.includeDeclaration = include_declaration}};
            auto result = detail::parse_result(
                    "references",
                    send_request("textDocument/references", detail::to_json(params), opts_.request_timeout));
            return detail::as_locations("references", result);
        });
    }

    std::vector<document_symbol> session::document_symbols(const fs::path& file) {
        return traced("document_symbols", [&] {
            require_ready();
            auto uri = ensure_document_open(detail::normalize_file(file));
            internal::document_symbol_params params{.textDocument = {.uri = uri}};
            auto result = detail::parse_result(
                    "documentSymbol",
                    send_request("textDocument/documentSymbol", detail::to_json(params), opts_.request_timeout));

            std::vector<document_symbol> symbols{};
            if (detail::is_null(result)) {
                return symbols;
            }
            auto* arr = std::get_if<glz::generic::array_t>(&result.data);
            if (arr == nullptr) {
                throw session_error{error_kind::invalid_response, "documentSymbol result is not an array"};
            }
            bool flat = false;
            for (const auto& item : *arr) {
                auto sym = detail::as_document_symbol(item, flat);
                if (!sym) {
                    throw session_error{error_kind::invalid_response, "malformed symbol in documentSymbol result"};
                }
                symbols.push_back(std::move(*sym));
            }
            return flat ? detail::nest_by_range(std::move(symbols)) : symbols;
        });
    }

    std::vector<diagnostic> session::diagnostics(const fs::path& file) {
        return traced("diagnostics", [&] {
            require_ready();
            auto path = detail::normalize_file(file);
            ensure_document_open(path);
            std::lock_guard lock{diagnostics_mutex_};
            auto it = diagnostics_.find(path.string());
            return it == diagnostics_.end() ? std::vector<diagnostic>{} : it->second;
        });
    }

    edit_result session::apply_edit(const fs::path& file, range span, std::string_view new_text) {
        return traced("apply_edit", [&] {
            require_ready();
            auto path = detail::normalize_file(file);
            auto uri = ensure_document_open(path);

            auto original = detail::read_file(path);
            auto begin = internal::text::offset_of(original, span.start);
            auto end = internal::text::offset_of(original, span.end);
            if (!begin || !end || *end < *begin) {
                throw session_error{
                        error_kind::invalid_request,
                        "edit range {}:{}-{}:{} is outside {}"_format(
                                span.start.line, span.start.character, span.end.line, span.end.character,
                                path.string())};
            }

            std::string updated{};
            updated.reserve(original.size() - (*end - *begin) + new_text.size());
            updated.append(original, 0U, *begin);
            updated.append(new_text);
            updated.append(original, *end, std::string::npos);
            detail::write_file_atomically(path, updated);

            int version = 0;
            {
                std::lock_guard lock{documents_mutex_};
                version = ++open_documents_[uri];
            }
            internal::did_change_params change{
                    .textDocument = {.uri = uri, .version = version}, .contentChanges = {{.text = updated}}};
            auto deadline = std::chrono::steady_clock::now() + opts_.request_timeout;
            send_notification("textDocument/didChange", detail::to_json(change), deadline);
            send_notification(
                    "textDocument/didSave",
                    detail::to_json(internal::did_save_params{.textDocument = {.uri = uri}}),
                    deadline);

            return edit_result{
                    .start_line = span.start.line + 1U,
                    .end_line = span.end.line + 1U,
                    .lines_removed = static_cast<size_t>(span.end.line - span.start.line) + 1U,
                    .lines_added = internal::text::line_count(new_text)};
        });
    }

    void session::close() {
        std::lock_guard close_lock{close_mutex_};
        bool graceful = false;
        {
            std::lock_guard lock{state_mutex_};
            if (state_ == session_state::closed) {
                return;
            }
            graceful = handshake_done_ && state_ == session_state::ready;
            state_ = session_state::closed;
        }

        if (channel_) {
            if (graceful) {
                try {
                    auto budget = std::min(opts_.request_timeout, opts_.shutdown_grace);
                    send_request("shutdown", {}, budget);
                    send_notification("exit", {}, std::chrono::steady_clock::now() + budget);
                } catch (const session_error& e) {
                    debug_log("graceful shutdown of ", opts_.root.string(), " failed: ", e.what());
                }
            }
            channel_->close_write();
        }

        if (!graceful || !process_.wait_for_exit(opts_.shutdown_grace)) {
            process_.terminate(graceful ? 0ms : opts_.shutdown_grace);
        }

        if (channel_) {
            channel_->interrupt();
        }
        if (reader_.joinable()) {
            if (reader_.get_id() == std::this_thread::get_id()) {
                reader_.detach();
            }
            else {
                reader_.join();
            }
        }
        mux_.fail_all(error_kind::backend_disconnected, "session for {} was closed"_format(opts_.root.string()));
        log_info("closed session for ", opts_.root.string());
    }

}  // namespace lsbridge
