/**
 * @file AdmissionPolicy.h
 * @brief Decide whether a discovered or connecting peer may have a channel
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#pragma once

namespace LanConnect {

enum class AdmissionOutcome {
    ADMIT_KNOWN,          ///< deviceId already registered, reuse the device
    ADMIT_ALLOWED,        ///< host was targeted by broadcast(address)
    ADMIT_DISCOVERABLE,   ///< unknown peer, but we are discoverable
    REJECT
};

/**
 * @brief Facts about one peer, gathered by the caller
 */
struct AdmissionRequest {
    bool deviceKnown = false;   ///< registry has the deviceId
    bool hostAllowed = false;   ///< peer host is in the allowed set
    bool discoverable = false;  ///< registry accepts unknown devices
};

/**
 * @brief Apply the admission rules in order, first match wins
 *
 * 1. known device       -> ADMIT_KNOWN
 * 2. allowed host       -> ADMIT_ALLOWED
 * 3. discoverable       -> ADMIT_DISCOVERABLE
 * 4. otherwise          -> REJECT
 *
 * Pure function. The host used for rule 2 is the socket peer for inbound TCP
 * and the datagram source for UDP.
 */
AdmissionOutcome decideAdmission(const AdmissionRequest& request);

inline bool isAdmitted(AdmissionOutcome outcome) {
    return outcome != AdmissionOutcome::REJECT;
}

const char* admissionOutcomeName(AdmissionOutcome outcome);

}  // namespace LanConnect
