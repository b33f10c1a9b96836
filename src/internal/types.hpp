#pragma once

#include "lsbridge/config.hpp"
#include "lsbridge/protocol.hpp"

#include <glaze/glaze.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lsbridge::internal {

    // ── JSON-RPC envelopes (client → server) ────────────────────────

    template <typename Params>
    struct request_message {
        std::string jsonrpc{"2.0"};
        int64_t id{};
        std::string method{};
        Params params{};
    };

    template <typename Params>
    struct notification_message {
        std::string jsonrpc{"2.0"};
        std::string method{};
        Params params{};
    };

    // shutdown and exit carry no params member at all
    struct bare_request_message {
        std::string jsonrpc{"2.0"};
        int64_t id{};
        std::string method{};
    };

    struct bare_notification_message {
        std::string jsonrpc{"2.0"};
        std::string method{};
    };

    // Reply to a server-initiated request; id is echoed verbatim.
    struct reply_message {
        std::string jsonrpc{"2.0"};
        glz::raw_json id{};
        glz::raw_json result{"null"};
    };

    // ── JSON-RPC envelopes (server → client) ────────────────────────

    struct rpc_error_body {
        int code{};
        std::string message{};
    };

    struct inbound_envelope {
        std::optional<glz::raw_json> id{};
        std::optional<std::string> method{};
        std::optional<glz::raw_json> params{};
        std::optional<glz::raw_json> result{};
        std::optional<rpc_error_body> error{};
    };

    // ── LSP params ──────────────────────────────────────────────────

    struct empty_params {};

    struct client_info {
        std::string name{"lsbridge"};
        std::string version{"0.1.0"};
    };

    struct dynamic_registration {
        bool dynamicRegistration{false};
    };

    struct hover_client_caps {
        bool dynamicRegistration{false};
        std::vector<std::string> contentFormat{"markdown", "plaintext"};
    };

    struct document_symbol_client_caps {
        bool dynamicRegistration{false};
        bool hierarchicalDocumentSymbolSupport{true};
    };

    struct synchronization_caps {
        bool dynamicRegistration{false};
        bool didSave{true};
    };

    struct publish_diagnostics_caps {
        bool relatedInformation{false};
    };

    struct text_document_client_caps {
        synchronization_caps synchronization{};
        hover_client_caps hover{};
        dynamic_registration definition{};
        dynamic_registration references{};
        document_symbol_client_caps documentSymbol{};
        publish_diagnostics_caps publishDiagnostics{};
    };

    struct workspace_edit_caps {
        bool documentChanges{false};
    };

    struct workspace_client_caps {
        bool applyEdit{true};
        workspace_edit_caps workspaceEdit{};
        bool configuration{true};
    };

    struct client_capabilities {
        text_document_client_caps textDocument{};
        workspace_client_caps workspace{};
    };

    struct workspace_folder {
        std::string uri{};
        std::string name{};
    };

    struct initialize_params {
        int processId{};
        client_info clientInfo{};
        std::string rootUri{};
        std::string rootPath{};
        client_capabilities capabilities{};
        std::vector<workspace_folder> workspaceFolders{};
    };

    struct text_document_identifier {
        std::string uri{};
    };

    struct versioned_text_document_identifier {
        std::string uri{};
        int version{};
    };

    struct text_document_item {
        std::string uri{};
        std::string languageId{};
        int version{};
        std::string text{};
    };

    struct did_open_params {
        text_document_item textDocument{};
    };

    struct content_change {
        std::string text{};
    };

    struct did_change_params {
        versioned_text_document_identifier textDocument{};
        std::vector<content_change> contentChanges{};
    };

    struct did_save_params {
        text_document_identifier textDocument{};
        std::optional<std::string> text{};
    };

    struct position_params {
        text_document_identifier textDocument{};
        lsbridge::position position{};
    };

    struct reference_context {
        bool includeDeclaration{true};
    };

    struct reference_params {
        text_document_identifier textDocument{};
        lsbridge::position position{};
        reference_context context{};
    };

    struct document_symbol_params {
        text_document_identifier textDocument{};
    };

    // ── server → client payloads ────────────────────────────────────

    struct diagnostic_wire {
        lsbridge::range range{};
        std::optional<int> severity{};
        std::string message{};
        std::optional<std::string> source{};
    };

    struct publish_diagnostics_params {
        std::string uri{};
        std::optional<int> version{};
        std::vector<diagnostic_wire> diagnostics{};
    };

    struct configuration_params {
        std::vector<glz::raw_json> items{};
    };

    struct log_message_params {
        int type{};
        std::string message{};
    };

    // ── execution events (JSONL sink) ───────────────────────────────

    struct event_record {
        std::string tool_name{};
        std::string session_id{};
        std::string status{};
        int64_t started_at_ms{};
        int64_t duration_ms{};
        std::optional<std::string> error_message{};
    };

}  // namespace lsbridge::internal

namespace glz {

    template <>
    struct meta<lsbridge::position> {
        using T = lsbridge::position;
        static constexpr auto value = object("line", &T::line, "character", &T::character);
    };

    template <>
    struct meta<lsbridge::range> {
        using T = lsbridge::range;
        static constexpr auto value = object("start", &T::start, "end", &T::end);
    };

    template <>
    struct meta<lsbridge::internal::reply_message> {
        using T = lsbridge::internal::reply_message;
        static constexpr auto value = object("jsonrpc", &T::jsonrpc, "id", &T::id, "result", &T::result);
    };

    template <>
    struct meta<lsbridge::internal::rpc_error_body> {
        using T = lsbridge::internal::rpc_error_body;
        static constexpr auto value = object("code", &T::code, "message", &T::message);
    };

    template <>
    struct meta<lsbridge::internal::inbound_envelope> {
        using T = lsbridge::internal::inbound_envelope;
        static constexpr auto value = object(
                "id", &T::id, "method", &T::method, "params", &T::params, "result", &T::result, "error", &T::error);
    };

    template <>
    struct meta<lsbridge::persisted_config> {
        using T = lsbridge::persisted_config;
        static constexpr auto value = object(
                "schema_version",
                &T::schema_version,
                "server_path",
                &T::server_path,
                "server_args",
                &T::server_args,
                "server_log",
                &T::server_log,
                "root_markers",
                &T::root_markers,
                "handshake_timeout_ms",
                &T::handshake_timeout_ms,
                "request_timeout_ms",
                &T::request_timeout_ms,
                "shutdown_grace_ms",
                &T::shutdown_grace_ms,
                "idle_timeout_ms",
                &T::idle_timeout_ms,
                "reaper_interval_ms",
                &T::reaper_interval_ms,
                "max_body_bytes",
                &T::max_body_bytes,
                "events_file",
                &T::events_file,
                "verbosity",
                &T::verbosity);
    };

}  // namespace glz
