// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

#include <uint256.h>
#include <util/strencodings.h>

#include <ostream>
#include <vector>

uint64_t uint256::GetUint64LE() const {
    uint64_t v = 0;
    for (int i = 0; i < 8; i++)
        v |= static_cast<uint64_t>(data[i]) << (i * 8);
    return v;
}

std::string uint256::GetHex() const {
    return HexStr(data, WIDTH);
}

bool uint256::SetHex(const std::string& str) {
    SetNull();

    std::string hex = str;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }

    if (hex.size() != WIDTH * 2) {
        return false;
    }

    std::vector<uint8_t> bytes = ParseHex(hex);
    if (bytes.size() != WIDTH) {
        return false;
    }

    memcpy(data, bytes.data(), WIDTH);
    return true;
}

uint256 uint256::FromHex(const std::string& str) {
    uint256 v;
    v.SetHex(str);
    return v;
}

std::ostream& operator<<(std::ostream& os, const uint256& h) {
    return os << h.GetHex();
}
