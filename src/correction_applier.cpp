#include "phrasecheck/correction_applier.hpp"

#include <iostream>

namespace phrasecheck {

void QueuedCorrectionApplier::apply(const ApplyCorrection& request) {
    if (!out_.push(request)) {
        throw ApplicationError("correction channel is closed");
    }
    std::cout << "[apply] queued #" << request.id << " '" << request.original
              << "' -> '" << request.correction << "'\n";
}

} // namespace phrasecheck
