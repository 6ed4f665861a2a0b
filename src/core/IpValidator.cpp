/**
 * @file IpValidator.cpp
 * @brief Syntactic validation of peer addresses
 *
 * (c) 2026 LanConnect Project
 * Licensed under MIT License
 */

#include "lanconnect/IpValidator.h"
#include <regex>
#include <string>

namespace LanConnect {

namespace {

// Anything longer cannot be a hostname (253) or an address with a sane zone id
constexpr size_t MAX_ADDRESS_LENGTH = 320;

const char* const IPV4_PATTERN =
    R"re(^(([0-9]|[1-9][0-9]|1[0-9]{2}|2[0-4][0-9]|25[0-5])\.){3})re"
    R"re(([0-9]|[1-9][0-9]|1[0-9]{2}|2[0-4][0-9]|25[0-5])$)re";

const char* const HOSTNAME_PATTERN =
    R"re(^(([a-zA-Z]|[a-zA-Z][a-zA-Z0-9\-]*[a-zA-Z0-9])\.)*)re"
    R"re(([A-Za-z]|[A-Za-z][A-Za-z0-9\-]*[A-Za-z0-9])$)re";

// IPv6 with optional embedded IPv4 tail and %zone suffix
const std::string& ipv6Pattern() {
    static const std::string pattern = []() {
        const std::string v4 =
            R"re(((25[0-5]|2[0-4]\d|1\d\d|[1-9]?\d)(\.(25[0-5]|2[0-4]\d|1\d\d|[1-9]?\d)){3}))re";
        const std::string h16 = "[0-9A-Fa-f]{1,4}";

        return R"re(^\s*()re"
            "((" + h16 + ":){7}(" + h16 + "|:))|"
            "((" + h16 + ":){6}(:" + h16 + "|" + v4 + "|:))|"
            "((" + h16 + ":){5}(((:" + h16 + "){1,2})|:" + v4 + "|:))|"
            "((" + h16 + ":){4}(((:" + h16 + "){1,3})|((:" + h16 + ")?:" + v4 + ")|:))|"
            "((" + h16 + ":){3}(((:" + h16 + "){1,4})|((:" + h16 + "){0,2}:" + v4 + ")|:))|"
            "((" + h16 + ":){2}(((:" + h16 + "){1,5})|((:" + h16 + "){0,3}:" + v4 + ")|:))|"
            "((" + h16 + ":){1}(((:" + h16 + "){1,6})|((:" + h16 + "){0,4}:" + v4 + ")|:))|"
            "(:(((:" + h16 + "){1,7})|((:" + h16 + "){0,5}:" + v4 + ")|:))"
            R"re()(%.+)?\s*$)re";
    }();
    return pattern;
}

} // anonymous namespace

bool isValidAddress(const std::string& text) noexcept {
    if (text.empty() || text.size() > MAX_ADDRESS_LENGTH) {
        return false;
    }

    try {
        static const std::regex ipv4(IPV4_PATTERN, std::regex::ECMAScript);
        static const std::regex hostname(HOSTNAME_PATTERN, std::regex::ECMAScript);
        static const std::regex ipv6(ipv6Pattern(), std::regex::ECMAScript);

        return std::regex_match(text, ipv4) ||
               std::regex_match(text, hostname) ||
               std::regex_match(text, ipv6);
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace LanConnect
