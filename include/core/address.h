#pragma once

#include <string>

namespace rentledger {
namespace core {

// Account addresses are 0x-prefixed, 40 hex digit strings. They are compared
// in normalized (lower-case) form.
using Address = std::string;

constexpr const char* ZERO_ADDRESS = "0x0000000000000000000000000000000000000000";
constexpr size_t ADDRESS_HEX_LENGTH = 40;

class AddressUtil {
public:
    static bool isWellFormed(const std::string& address);
    // Empty strings and the all-zero address are both null.
    static bool isZero(const std::string& address);
    static bool isValid(const std::string& address) { return isWellFormed(address) && !isZero(address); }
    static Address normalize(const std::string& address);
    static bool equals(const std::string& a, const std::string& b);
};

}
}
