#include "capture/output_capture.hpp"

namespace pysandbox::capture {

OutputCapture::OutputCapture(runtime::Interpreter& interpreter)
    : interpreter_(interpreter) {}

OutputCapture::~OutputCapture() {
    Restore();
}

void OutputCapture::Install() {
    if (installed_) {
        return;
    }
    // Marked first so a half-finished install is still restored.
    installed_ = true;
    try {
        interpreter_.InstallCapture();
    } catch (...) {
        Restore();
        throw;
    }
}

runtime::CapturedOutput OutputCapture::Restore() noexcept {
    if (!installed_) {
        return {};
    }
    installed_ = false;
    return interpreter_.RestoreCapture();
}

}  // namespace pysandbox::capture
