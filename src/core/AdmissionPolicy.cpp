/**
 * @file AdmissionPolicy.cpp
 * @brief Ordered admission rules
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#include "lanconnect/AdmissionPolicy.h"

namespace LanConnect {

namespace {

struct AdmissionRule {
    bool (*matches)(const AdmissionRequest& request);
    AdmissionOutcome outcome;
};

const AdmissionRule kRules[] = {
    { [](const AdmissionRequest& r) { return r.deviceKnown; },  AdmissionOutcome::ADMIT_KNOWN },
    { [](const AdmissionRequest& r) { return r.hostAllowed; },  AdmissionOutcome::ADMIT_ALLOWED },
    { [](const AdmissionRequest& r) { return r.discoverable; }, AdmissionOutcome::ADMIT_DISCOVERABLE },
};

}  // anonymous namespace

AdmissionOutcome decideAdmission(const AdmissionRequest& request)
{
    for (const AdmissionRule& rule : kRules) {
        if (rule.matches(request)) {
            return rule.outcome;
        }
    }
    return AdmissionOutcome::REJECT;
}

const char* admissionOutcomeName(AdmissionOutcome outcome)
{
    switch (outcome) {
        case AdmissionOutcome::ADMIT_KNOWN:        return "known";
        case AdmissionOutcome::ADMIT_ALLOWED:      return "allowed";
        case AdmissionOutcome::ADMIT_DISCOVERABLE: return "discoverable";
        case AdmissionOutcome::REJECT:             return "rejected";
    }
    return "unknown";
}

}  // namespace LanConnect
