/**
 * @file Response.hpp
 * @brief Result of one command, returned to the invoking process.
 */

#pragma once

#include <optional>
#include <string>

namespace customrpc::core {

/**
 * @brief Success with optional output, or failure with an error and partial output.
 *
 * A failed response always carries a non-empty error text.
 */
struct Response {
    bool success{false};
    std::optional<std::string> output;
    std::string error;

    /**
     * @brief Builds a successful response.
     * @param output Text to show to the caller; empty text is omitted.
     */
    static Response ok(std::string output = {});

    /**
     * @brief Builds a failed response.
     * @param error Error description; replaced by "Unknown error" when empty.
     * @param partialOutput Output captured before the failure; empty text is omitted.
     */
    static Response failure(std::string error, std::string partialOutput = {});

    bool operator==(const Response& other) const = default;
};

} // namespace customrpc::core
