#include <algorithm>
#include <envdebug/mcp/server.h>
#include <envdebug/redact/redactor.h>
#include <exception>
#include <utility>

namespace envdebug::mcp
{

namespace
{

constexpr std::string_view kDebugEnvDescription =
    "Return environment variables with sensitive values redacted. Variables with KEY, "
    "TOKEN, CRED, SECRET, AUTH, PASSWORD or PASSPHRASE at word boundaries (or PASS as a "
    "whole word) have alphanumeric characters replaced with asterisks.";

Json str(std::string_view s)
{
    return Json{std::string(s)};
}

Json make_error_response(Json id, int code, std::string message)
{
    Json::Object err;
    err.emplace("code", Json{static_cast<double>(code)});
    err.emplace("message", Json{std::move(message)});

    Json::Object top;
    top.emplace("jsonrpc", str("2.0"));
    top.emplace("id", std::move(id));
    top.emplace("error", Json{err});
    return Json{top};
}

Json make_success_response(Json id, Json result)
{
    Json::Object top;
    top.emplace("jsonrpc", str("2.0"));
    top.emplace("id", std::move(id));
    top.emplace("result", std::move(result));
    return Json{top};
}

Json text_content(std::string text)
{
    Json::Object item;
    item.emplace("type", str("text"));
    item.emplace("text", Json{std::move(text)});
    return Json{Json::Array{Json{item}}};
}

bool is_valid_id(const Json& id)
{
    return id.is_string() || id.is_number();
}

bool is_supported_protocol(std::string_view version)
{
    return std::find(kSupportedProtocolVersions.begin(), kSupportedProtocolVersions.end(),
                     version) != kSupportedProtocolVersions.end();
}

} // namespace

Json env_to_json(const env::EnvMap& env)
{
    Json::Object obj;
    for (const auto& [name, value] : env)
    {
        obj.emplace_hint(obj.end(), name, Json{value});
    }
    return Json{obj};
}

Server::Server(ServerConfig config, EnvironmentSource source, const diag::Reporter& reporter)
    : config_(std::move(config)), source_(std::move(source)), reporter_(&reporter)
{
    if (!source_)
    {
        source_ = env::snapshot_environment;
    }
}

std::optional<std::string> Server::handle_line(std::string_view line)
{
    if (!line.empty() && line.back() == '\r')
    {
        line.remove_suffix(1);
    }
    if (line.find_first_not_of(" \t") == std::string_view::npos)
    {
        return std::nullopt;
    }

    const auto parsed = parse_json(line);
    if (!parsed.has_value())
    {
        reporter_->debug("malformed message, answering parse error");
        return json_serialize(
            make_error_response(Json{nullptr}, rpc_error::kParseError, "Parse error"));
    }
    if (!parsed->is_object())
    {
        return json_serialize(
            make_error_response(Json{nullptr}, rpc_error::kInvalidRequest, "Invalid Request"));
    }

    const auto& root = *parsed->as_object();
    const auto id_it = root.find("id");
    const bool is_notification = id_it == root.end();
    if (!is_notification && !is_valid_id(id_it->second))
    {
        return json_serialize(make_error_response(Json{nullptr}, rpc_error::kInvalidRequest,
                                                  "Invalid Request: id must be string or number"));
    }
    const Json id = is_notification ? Json{nullptr} : id_it->second;

    const auto jsonrpc = json_get_string(root, "jsonrpc");
    const auto method = json_get_string(root, "method");
    if (!jsonrpc.has_value() || *jsonrpc != "2.0" || !method.has_value())
    {
        if (is_notification)
        {
            reporter_->debug("dropping invalid notification");
            return std::nullopt;
        }
        return json_serialize(
            make_error_response(id, rpc_error::kInvalidRequest, "Invalid Request"));
    }

    if (is_notification)
    {
        reporter_->debug("notification: " + *method);
        return std::nullopt;
    }

    reporter_->debug("request: " + *method);
    return json_serialize(dispatch(*method, id, root));
}

Json Server::dispatch(const std::string& method, const Json& id, const Json::Object& root)
{
    const auto params_it = root.find("params");
    if (params_it != root.end() && !params_it->second.is_object())
    {
        return make_error_response(id, rpc_error::kInvalidParams,
                                   "Invalid params: params must be an object");
    }
    static const Json::Object kNoParams;
    const Json::Object& params =
        params_it == root.end() ? kNoParams : *params_it->second.as_object();

    if (method == "initialize")
    {
        return handle_initialize(id, params);
    }
    if (method == "ping")
    {
        return make_success_response(id, Json{Json::Object{}});
    }
    if (method == "tools/list")
    {
        return handle_tools_list(id);
    }
    if (method == "tools/call")
    {
        return handle_tools_call(id, params);
    }

    return make_error_response(id, rpc_error::kMethodNotFound, "Method not found: " + method);
}

Json Server::handle_initialize(const Json& id, const Json::Object& params) const
{
    std::string version(kLatestProtocolVersion);
    if (const auto requested = json_get_string(params, "protocolVersion");
        requested.has_value() && is_supported_protocol(*requested))
    {
        version = *requested;
    }

    Json::Object tools;
    tools.emplace("listChanged", Json{false});
    Json::Object capabilities;
    capabilities.emplace("tools", Json{tools});

    Json::Object server_info;
    server_info.emplace("name", Json{config_.name});
    server_info.emplace("version", Json{config_.version});

    Json::Object result;
    result.emplace("protocolVersion", Json{version});
    result.emplace("capabilities", Json{capabilities});
    result.emplace("serverInfo", Json{server_info});
    return make_success_response(id, Json{result});
}

Json Server::handle_tools_list(const Json& id) const
{
    Json::Object input_schema;
    input_schema.emplace("type", str("object"));
    input_schema.emplace("properties", Json{Json::Object{}});

    Json::Object string_schema;
    string_schema.emplace("type", str("string"));
    Json::Object output_schema;
    output_schema.emplace("type", str("object"));
    output_schema.emplace("additionalProperties", Json{string_schema});

    Json::Object tool;
    tool.emplace("name", str(kDebugEnvTool));
    tool.emplace("description", str(kDebugEnvDescription));
    tool.emplace("inputSchema", Json{input_schema});
    tool.emplace("outputSchema", Json{output_schema});

    Json::Object result;
    result.emplace("tools", Json{Json::Array{Json{tool}}});
    return make_success_response(id, Json{result});
}

Json Server::handle_tools_call(const Json& id, const Json::Object& params)
{
    const auto name = json_get_string(params, "name");
    if (!name.has_value())
    {
        return make_error_response(id, rpc_error::kInvalidParams,
                                   "Invalid params: missing tool name");
    }
    if (*name != kDebugEnvTool)
    {
        return make_error_response(id, rpc_error::kInvalidParams, "Unknown tool: " + *name);
    }
    const auto args_it = params.find("arguments");
    if (args_it != params.end() && !args_it->second.is_object())
    {
        return make_error_response(id, rpc_error::kInvalidParams,
                                   "Invalid params: arguments must be an object");
    }

    return make_success_response(id, call_debug_env());
}

Json Server::call_debug_env()
{
    Json::Object result;
    try
    {
        const Json view = env_to_json(redact::build_debug_view(source_()));
        result.emplace("content", text_content(json_serialize(view)));
        result.emplace("structuredContent", view);
        result.emplace("isError", Json{false});
    }
    catch (const std::exception& e)
    {
        // Report the failure as a tool error instead of an empty or partial mapping.
        reporter_->report(diag::Diagnostic{.severity = diag::Severity::Error,
                                           .message = "debug_env failed",
                                           .notes = {e.what()}});
        result.emplace("content", text_content(std::string("Error: ") + e.what()));
        result.emplace("isError", Json{true});
    }
    return Json{result};
}

int Server::serve(std::istream& in, std::ostream& out)
{
    reporter_->debug("serving " + config_.name + " " + config_.version + " on stdio");

    std::string line;
    while (std::getline(in, line))
    {
        const auto response = handle_line(line);
        if (!response.has_value())
        {
            continue;
        }
        out << *response << "\n";
        out.flush();
        if (!out)
        {
            reporter_->report(diag::Diagnostic{.severity = diag::Severity::Error,
                                               .message = "failed to write response",
                                               .notes = {}});
            return 1;
        }
    }

    if (in.bad())
    {
        reporter_->report(diag::Diagnostic{
            .severity = diag::Severity::Error, .message = "failed to read input", .notes = {}});
        return 1;
    }

    reporter_->debug("end of input, shutting down");
    return 0;
}

} // namespace envdebug::mcp
