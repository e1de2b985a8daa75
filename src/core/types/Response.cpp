#include "core/types/Response.hpp"

namespace customrpc::core {

Response Response::ok(std::string output) {
    Response response;
    response.success = true;
    if (!output.empty()) {
        response.output = std::move(output);
    }
    return response;
}

Response Response::failure(std::string error, std::string partialOutput) {
    Response response;
    response.success = false;
    response.error = error.empty() ? "Unknown error" : std::move(error);
    if (!partialOutput.empty()) {
        response.output = std::move(partialOutput);
    }
    return response;
}

} // namespace customrpc::core
