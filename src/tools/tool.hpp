#pragma once

#include <functional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/context/context.hpp"
#include "core/errors/errors.hpp"
#include "protocol/tool_contract.hpp"

namespace toolguard::tools {

// A unit of work the executor runs on behalf of an agent.
//
// execute() may be called from several threads at once. Implementations
// should stop work and return once ctx is done; the executor cannot
// interrupt them.
class Tool {
public:
    virtual ~Tool() = default;

    virtual std::string name() const = 0;
    virtual protocol::Annotations annotations() const = 0;
    virtual core::errors::Result<protocol::ToolResult> execute(
        const core::context::Context& ctx, const nlohmann::json& input) = 0;
};

using ToolHandler = std::function<core::errors::Result<protocol::ToolResult>(
    const core::context::Context&, const nlohmann::json&)>;

// Tool backed by a callable.
class FunctionTool : public Tool {
public:
    FunctionTool(std::string name, protocol::Annotations annotations,
                 ToolHandler handler);

    std::string name() const override;
    protocol::Annotations annotations() const override;
    core::errors::Result<protocol::ToolResult> execute(
        const core::context::Context& ctx, const nlohmann::json& input) override;

private:
    std::string name_;
    protocol::Annotations annotations_;
    ToolHandler handler_;
};

}  // namespace toolguard::tools
