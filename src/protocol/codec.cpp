#include "protocol/codec.hpp"

#include <cmath>

namespace pysandbox::protocol {
namespace {

bool HasValue(const nlohmann::json& data, const char* key) {
    return data.contains(key) && !data[key].is_null();
}

std::string RequireString(const nlohmann::json& data, const char* key, const char* request_type) {
    if (!data.contains(key) || !data[key].is_string()) {
        throw ProtocolError(std::string(request_type) + " request requires string field '" + key + "'");
    }
    return data[key].get<std::string>();
}

ExecuteRequest ParseExecute(const nlohmann::json& data) {
    ExecuteRequest request{};
    if (HasValue(data, "code")) {
        if (!data["code"].is_string()) {
            throw ProtocolError("field 'code' must be a string");
        }
        request.code = data["code"].get<std::string>();
    }

    if (HasValue(data, "files")) {
        const auto& files = data["files"];
        if (!files.is_object()) {
            throw ProtocolError("field 'files' must be an object of path to content");
        }
        for (const auto& [path, content] : files.items()) {
            if (!content.is_string()) {
                throw ProtocolError("content for file '" + path + "' must be a string");
            }
            request.files[path] = content.get<std::string>();
        }
    }

    if (HasValue(data, "timeout")) {
        const auto& timeout = data["timeout"];
        if (!timeout.is_number()) {
            throw ProtocolError("field 'timeout' must be a number of seconds");
        }
        const auto seconds = timeout.get<double>();
        if (std::isfinite(seconds)) {
            request.timeout_seconds = seconds;
        }
    }
    return request;
}

}  // namespace

RequestKind ResolveKind(const nlohmann::json& data) {
    if (data.contains("type") && data["type"].is_string()) {
        const auto type = data["type"].get<std::string>();
        if (type == "writeFile") {
            return RequestKind::kWriteFile;
        }
        if (type == "readFile") {
            return RequestKind::kReadFile;
        }
    }
    return RequestKind::kExecute;
}

Request ParseRequest(const std::string& line) {
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& ex) {
        throw ProtocolError(ex.what());
    }
    if (!data.is_object()) {
        throw ProtocolError("request must be a JSON object");
    }

    switch (ResolveKind(data)) {
        case RequestKind::kWriteFile: {
            WriteFileRequest request{};
            request.path = RequireString(data, "path", "writeFile");
            request.content = RequireString(data, "content", "writeFile");
            return request;
        }
        case RequestKind::kReadFile: {
            ReadFileRequest request{};
            request.path = RequireString(data, "path", "readFile");
            return request;
        }
        case RequestKind::kExecute:
            break;
    }
    return ParseExecute(data);
}

std::string SerializeResult(const ExecutionResult& result) {
    nlohmann::ordered_json json = nlohmann::ordered_json::object();
    json["success"] = result.success;
    json["output"] = result.output;
    json["error"] = result.error.has_value() ? nlohmann::ordered_json(*result.error)
                                             : nlohmann::ordered_json(nullptr);
    json["logs"] = result.logs;
    // Guest output is not guaranteed to be valid UTF-8.
    return json.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

}  // namespace pysandbox::protocol
