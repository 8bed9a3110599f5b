#pragma once

#include <string>

#include "nlohmann/json.hpp"
#include "protocol/messages.hpp"

namespace pysandbox::protocol {

enum class RequestKind {
    kExecute,
    kWriteFile,
    kReadFile
};

// The one normalization step: anything that is not "writeFile" or
// "readFile" is an execute request, which keeps older hosts that send
// {"code": ...} without a type working.
RequestKind ResolveKind(const nlohmann::json& data);

// Decodes one protocol line. Throws ProtocolError.
Request ParseRequest(const std::string& line);

// One JSON object, no trailing newline.
std::string SerializeResult(const ExecutionResult& result);

}  // namespace pysandbox::protocol
