#pragma once

#include <array>
#include <envdebug/diag/render.h>
#include <envdebug/env/environment.h>
#include <envdebug/mcp/json.h>
#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

/**
 * @file server.h
 * @brief Model Context Protocol server (JSON-RPC 2.0, one message per line over stdio).
 */

namespace envdebug::mcp
{

inline constexpr std::string_view kLatestProtocolVersion = "2025-06-18";
inline constexpr std::array<std::string_view, 3> kSupportedProtocolVersions = {
    "2024-11-05",
    "2025-03-26",
    kLatestProtocolVersion,
};

/** @brief Name of the single tool exposed by the server. */
inline constexpr std::string_view kDebugEnvTool = "debug_env";

/** @brief JSON-RPC 2.0 error codes. */
namespace rpc_error
{
inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
} // namespace rpc_error

struct ServerConfig
{
    std::string name = "env-debug-mcp";
    std::string version;
};

/** @brief Supplies the environment the `debug_env` tool reports on. */
using EnvironmentSource = std::function<env::EnvMap()>;

class Server
{
  public:
    /**
     * @brief `source` defaults to env::snapshot_environment when empty.
     *
     * `reporter` must outlive the server.
     */
    Server(ServerConfig config, EnvironmentSource source, const diag::Reporter& reporter);

    /**
     * @brief Handle one incoming message; returns the serialized response, if any.
     *
     * Notifications and blank lines produce no response.
     */
    [[nodiscard]] std::optional<std::string> handle_line(std::string_view line);

    /**
     * @brief Read messages from `in` until end of input, writing responses to `out`.
     *
     * Returns 0 at end of input and 1 if either stream fails.
     */
    int serve(std::istream& in, std::ostream& out);

  private:
    [[nodiscard]] Json dispatch(const std::string& method, const Json& id,
                                const Json::Object& root);
    [[nodiscard]] Json handle_initialize(const Json& id, const Json::Object& params) const;
    [[nodiscard]] Json handle_tools_list(const Json& id) const;
    [[nodiscard]] Json handle_tools_call(const Json& id, const Json::Object& params);
    [[nodiscard]] Json call_debug_env();

    ServerConfig config_;
    EnvironmentSource source_;
    const diag::Reporter* reporter_;
};

/** @brief Serialize a string-to-string mapping as a JSON object. */
[[nodiscard]] Json env_to_json(const env::EnvMap& env);

} // namespace envdebug::mcp
