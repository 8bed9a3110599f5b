#pragma once

#include <cstdint>
#include <string>

#include <boost/python.hpp>

#include "config/config_schema.hpp"
#include "runtime/interpreter.hpp"

namespace pysandbox::runtime {

// Embedded CPython. The interpreter is process-wide, so at most one
// instance should exist, and it must be driven from the thread that
// called Initialize().
class PythonInterpreter : public Interpreter {
public:
    explicit PythonInterpreter(config::RuntimeConfig config);

    void Initialize() override;
    void InstallCapture() override;
    CapturedOutput RestoreCapture() noexcept override;
    RunOutcome Run(const std::string& code, const CancellationToken& token) override;
    void Interrupt() override;
    void DisarmInterrupt() noexcept override;

private:
    config::RuntimeConfig config_;
    bool initialized_ = false;
    std::uint64_t next_generation_ = 0;
    boost::python::object helpers_;
    boost::python::object main_namespace_;
};

}  // namespace pysandbox::runtime
