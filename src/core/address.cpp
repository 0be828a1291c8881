#include "core/address.h"
#include <algorithm>
#include <cctype>

namespace rentledger {
namespace core {

bool AddressUtil::isWellFormed(const std::string& address) {
    if (address.size() != ADDRESS_HEX_LENGTH + 2) return false;
    if (address[0] != '0' || (address[1] != 'x' && address[1] != 'X')) return false;
    for (size_t i = 2; i < address.size(); ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(address[i]))) return false;
    }
    return true;
}

bool AddressUtil::isZero(const std::string& address) {
    if (address.empty()) return true;
    if (!isWellFormed(address)) return false;
    return std::all_of(address.begin() + 2, address.end(), [](char c) { return c == '0'; });
}

Address AddressUtil::normalize(const std::string& address) {
    Address out = address;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool AddressUtil::equals(const std::string& a, const std::string& b) {
    return normalize(a) == normalize(b);
}

}
}
