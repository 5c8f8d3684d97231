// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GIFTGUARD_GUARD_FINGERPRINT_H
#define GIFTGUARD_GUARD_FINGERPRINT_H

/**
 * @file fingerprint.h
 * @brief Caller identity derived from transport metadata
 *
 * A redemption request is keyed for rate limiting by three values: the
 * client IP, a device identifier and a hash of the user agent. The device
 * identifier is taken from the client-supplied X-Device-Fingerprint header
 * when present, otherwise it is derived from low-entropy request headers.
 */

#include <cstdint>
#include <map>
#include <set>
#include <string>

namespace giftguard {

/** Longest accepted client-supplied device fingerprint */
static constexpr size_t MAX_DEVICE_FINGERPRINT_LENGTH = 128;

/** Used when no address can be determined */
static const char* const UNKNOWN_IP = "unknown";

/**
 * @brief Transport metadata of an inbound request
 *
 * Header names are stored as received; lookups are case-insensitive.
 */
struct RequestMetadata {
    std::string peerAddress;
    std::map<std::string, std::string> headers;

    RequestMetadata() = default;
    RequestMetadata(const std::string& peer, const std::map<std::string, std::string>& hdrs)
        : peerAddress(peer), headers(hdrs) {}

    /** Case-insensitive header lookup. Returns an empty string when absent. */
    std::string GetHeader(const std::string& name) const;
    bool HasHeader(const std::string& name) const;
};

/**
 * @brief Identity tuple used to key rate limits
 */
struct Fingerprint {
    std::string ip;
    std::string deviceId;
    std::string userAgentHash;
    std::string userAgent;

    /** True when deviceId was derived from fewer than two supporting headers */
    bool lowConfidence;

    /** True when deviceId came from the X-Device-Fingerprint header */
    bool clientSupplied;

    Fingerprint() : lowConfidence(false), clientSupplied(false) {}
};

/**
 * @brief Derive the identity tuple from request metadata
 *
 * Pure and total: never fails, never rejects. The IP is the peer address
 * without its port. Forwarding headers are honoured only when the peer is a
 * trusted proxy: X-Forwarded-For is then walked from the right, skipping
 * trusted hops, and X-Real-IP is used when it is absent.
 *
 * @param request Transport metadata
 * @param trustedProxies Peer addresses allowed to set forwarding headers
 */
Fingerprint ExtractFingerprint(const RequestMetadata& request,
                               const std::set<std::string>& trustedProxies = std::set<std::string>());

/** Strip a trailing ":port" (and IPv6 brackets) from a peer address */
std::string StripPort(const std::string& address);

/** Stable hex hash of an arbitrary string */
std::string HashIdentityString(const std::string& value);

} // namespace giftguard

#endif // GIFTGUARD_GUARD_FINGERPRINT_H
