#include "protocol/response_emitter.hpp"

#include "protocol/codec.hpp"

namespace pysandbox::protocol {

ResponseEmitter::ResponseEmitter(std::ostream& out)
    : out_(out) {}

void ResponseEmitter::Emit(const ExecutionResult& result) {
    if (!out_) {
        throw FatalTransportError("protocol stream is closed");
    }
    const auto line = SerializeResult(result);
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        throw FatalTransportError("failed to write response to protocol stream");
    }
    ++emitted_;
}

}  // namespace pysandbox::protocol
