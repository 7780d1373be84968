#include "Errors.hpp"

namespace flux_mcp {

ToolError::ToolError(ErrorKind kind, const std::string& message, std::string detail)
    : std::runtime_error(message), kind_(kind), detail_(std::move(detail)) {}

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Infrastructure:      return "InfrastructureError";
        case ErrorKind::ExternalProgram:     return "ExternalProgramError";
        case ErrorKind::MalformedOutput:     return "MalformedOutputError";
        case ErrorKind::UnexpectedStructure: return "UnexpectedStructureError";
    }
    return "ToolError";
}

std::string excerpt(std::string_view text, std::size_t max_length) {
    if (text.size() <= max_length) {
        return std::string(text);
    }
    // Never split a multi-byte UTF-8 sequence
    std::size_t cut = max_length;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    std::string result(text.substr(0, cut));
    result += "...";
    return result;
}

} // namespace flux_mcp
