#pragma once

#include <cstddef>
#include <ostream>

#include "protocol/messages.hpp"

namespace pysandbox::protocol {

// Writes one result per line, flushed, in call order.
class ResponseEmitter {
public:
    explicit ResponseEmitter(std::ostream& out);

    // Throws FatalTransportError when the stream refuses the write.
    void Emit(const ExecutionResult& result);

    std::size_t Emitted() const { return emitted_; }

private:
    std::ostream& out_;
    std::size_t emitted_ = 0;
};

}  // namespace pysandbox::protocol
