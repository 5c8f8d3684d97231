// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <guard/fingerprint.h>

#include <crypto/siphash.h>
#include <utilstrencodings.h>

#include <algorithm>
#include <vector>

namespace giftguard {

// Fixed keys: identity hashes must be stable across restarts so that
// persisted rate-limit windows and fraud logs stay comparable.
static const uint64_t IDENTITY_HASH_K0 = 0x6769667467756172ULL;
static const uint64_t IDENTITY_HASH_K1 = 0x6466696e67657270ULL;

std::string RequestMetadata::GetHeader(const std::string& name) const
{
    const std::string wanted = ToLower(name);
    for (const auto& header : headers) {
        if (ToLower(header.first) == wanted) {
            return header.second;
        }
    }
    return std::string();
}

bool RequestMetadata::HasHeader(const std::string& name) const
{
    const std::string wanted = ToLower(name);
    return std::any_of(headers.begin(), headers.end(),
        [&wanted](const std::pair<const std::string, std::string>& header) {
            return ToLower(header.first) == wanted;
        });
}

std::string StripPort(const std::string& address)
{
    if (address.empty()) {
        return address;
    }

    // [::1]:8080
    if (address[0] == '[') {
        size_t close = address.find(']');
        if (close != std::string::npos) {
            return address.substr(1, close - 1);
        }
        return address;
    }

    // Bare IPv6 has more than one colon and no port
    size_t first = address.find(':');
    if (first != std::string::npos && first == address.rfind(':')) {
        return address.substr(0, first);
    }
    return address;
}

std::string HashIdentityString(const std::string& value)
{
    return HexStr64(CSipHasher(IDENTITY_HASH_K0, IDENTITY_HASH_K1).Write(value).Finalize());
}

/**
 * Client address as seen by the nearest untrusted hop. Entries are appended
 * left to right by each proxy, so everything left of the first untrusted
 * entry (counting from the right) is client-controlled.
 */
static std::string ForwardedClientAddress(const std::string& forwardedFor, const std::set<std::string>& trustedProxies)
{
    std::vector<std::string> hops;
    size_t start = 0;
    while (start <= forwardedFor.size()) {
        size_t comma = forwardedFor.find(',', start);
        if (comma == std::string::npos) comma = forwardedFor.size();
        std::string hop = TrimString(forwardedFor.substr(start, comma - start));
        if (!hop.empty()) hops.push_back(hop);
        start = comma + 1;
    }

    for (auto it = hops.rbegin(); it != hops.rend(); ++it) {
        if (!trustedProxies.count(*it)) {
            return *it;
        }
    }
    return hops.empty() ? std::string() : hops.front();
}

Fingerprint ExtractFingerprint(const RequestMetadata& request, const std::set<std::string>& trustedProxies)
{
    Fingerprint fp;

    std::string ip = StripPort(TrimString(request.peerAddress));
    if (!ip.empty() && trustedProxies.count(ip)) {
        std::string forwarded = ForwardedClientAddress(request.GetHeader("X-Forwarded-For"), trustedProxies);
        if (forwarded.empty()) {
            forwarded = TrimString(request.GetHeader("X-Real-IP"));
        }
        if (!forwarded.empty()) {
            ip = forwarded;
        }
    }
    fp.ip = ip.empty() ? UNKNOWN_IP : ip;

    fp.userAgent = request.GetHeader("User-Agent");
    fp.userAgentHash = HashIdentityString(fp.userAgent);

    std::string supplied = TrimString(request.GetHeader("X-Device-Fingerprint"));
    if (!supplied.empty()) {
        if (supplied.size() > MAX_DEVICE_FINGERPRINT_LENGTH) {
            supplied.resize(MAX_DEVICE_FINGERPRINT_LENGTH);
        }
        fp.deviceId = supplied;
        fp.clientSupplied = true;
        return fp;
    }

    static const char* const DERIVATION_HEADERS[] = {
        "Accept-Language", "Accept-Encoding", "Accept",
    };

    std::string material = fp.userAgent;
    int present = 0;
    for (const char* name : DERIVATION_HEADERS) {
        std::string value = request.GetHeader(name);
        if (!value.empty()) ++present;
        material += '\n';
        material += value;
    }

    fp.deviceId = "h:" + HashIdentityString(material);
    fp.lowConfidence = present < 2;
    return fp;
}

} // namespace giftguard
