#include "tools/tool.hpp"

#include <utility>

namespace toolguard::tools {

using core::errors::Error;
using core::errors::ErrorCategory;
using protocol::ToolResult;

FunctionTool::FunctionTool(std::string name, protocol::Annotations annotations,
                           ToolHandler handler)
    : name_(std::move(name)),
      annotations_(annotations),
      handler_(std::move(handler)) {}

std::string FunctionTool::name() const {
    return name_;
}

protocol::Annotations FunctionTool::annotations() const {
    return annotations_;
}

core::errors::Result<ToolResult> FunctionTool::execute(
    const core::context::Context& ctx, const nlohmann::json& input) {
    if (!handler_) {
        return Error{ErrorCategory::Internal, "Tool has no handler: " + name_,
                     "missing_handler"};
    }
    return handler_(ctx, input);
}

}  // namespace toolguard::tools
