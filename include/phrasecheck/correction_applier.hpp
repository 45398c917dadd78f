#pragma once

#include "event_channel.hpp"
#include "types.hpp"

namespace phrasecheck {

// Replaces the mistyped phrase in the focused application.
class CorrectionApplier {
public:
    virtual ~CorrectionApplier() = default;

    // Throws ApplicationError when the replacement cannot be performed.
    virtual void apply(const ApplyCorrection& request) = 0;
};

// Publishes requests for an out-of-process injector (keystroke synthesis,
// clipboard, focus restore). The injector reports its outcome separately.
class QueuedCorrectionApplier : public CorrectionApplier {
public:
    explicit QueuedCorrectionApplier(EventChannel<ApplyCorrection>& out) : out_(out) {}

    void apply(const ApplyCorrection& request) override;

private:
    EventChannel<ApplyCorrection>& out_;
};

} // namespace phrasecheck
