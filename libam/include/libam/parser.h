//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "package.h"

#include <expected>
#include <string>
#include <vector>

namespace am {

    enum class ParseError {
        InvalidFormat,        // Not JSON, or not the expected shape
        MissingRequiredField, // A result lacks Name or Version
        ErrorReply            // The RPC answered with "type": "error"
    };

    class Parser {
    public:
        // Parses an RPC v5 reply body into its result records.
        // Absent or null dependency keys yield empty lists.
        static std::expected<std::vector<PackageMetadata>, ParseError> parse_rpc_response(const std::string& body);
    };

} // namespace am
