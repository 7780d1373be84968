#include "StdioTransport.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace flux_mcp {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
    spdlog::debug("StdioTransport initialized");
}

json StdioTransport::read_message() {
    std::string line;

    // Blank lines between messages are skipped
    while (true) {
        if (closed_ || !std::getline(in_, line)) {
            if (in_.eof()) {
                spdlog::debug("Reached end of input stream");
            } else if (!closed_) {
                spdlog::error("Error reading from input stream");
            }
            return json();  // Return empty JSON on EOF or error
        }
        if (line.find_first_not_of(" \t\r") != std::string::npos) {
            break;
        }
    }

    // json::parse_error propagates; the server answers it with -32700
    json message = json::parse(line);
    spdlog::debug("Read message: {}", line);
    return message;
}

void StdioTransport::write_message(const json& message) {
    if (closed_) {
        spdlog::warn("Dropping message, transport is closed");
        return;
    }
    // Child output may hold bytes that are not valid UTF-8
    std::string serialized = message.dump(-1, ' ', false, json::error_handler_t::replace);
    out_ << serialized << std::endl;  // std::endl flushes automatically
    spdlog::debug("Wrote {} bytes", serialized.size());
}

bool StdioTransport::is_open() const {
    return !closed_ && in_.good() && out_.good();
}

void StdioTransport::close() {
    if (!closed_.exchange(true)) {
        out_.flush();
        spdlog::info("Transport closed");
    }
}

} // namespace flux_mcp
