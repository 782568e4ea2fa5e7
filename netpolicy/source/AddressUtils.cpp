/*
* If not stated otherwise in this file or this component's LICENSE file the
* following copyright and licenses apply:
*
* Copyright 2024 Sky UK
*
* Licensed under the Apache License, Version 2.0 (the "License");
* you may not use this file except in compliance with the License.
* You may obtain a copy of the License at
*
* http://www.apache.org/licenses/LICENSE-2.0
*
* Unless required by applicable law or agreed to in writing, software
* distributed under the License is distributed on an "AS IS" BASIS,
* WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
* See the License for the specific language governing permissions and
* limitations under the License.
*/
/*
 * File:   AddressUtils.cpp
 *
 */
#include "AddressUtils.h"

#include <cctype>
#include <cstring>

#include <arpa/inet.h>
#include <net/if.h>
#include <netinet/in.h>


namespace
{

size_t addressLength(int family)
{
    return (family == AF_INET) ? sizeof(struct in_addr) : sizeof(struct in6_addr);
}

// parses the string into the buffer, returns the family or AF_UNSPEC
int parseAddress(const std::string& str, uint8_t buf[16])
{
    if (str.empty() || (str.size() >= INET6_ADDRSTRLEN))
        return AF_UNSPEC;

    // inet_pton rejects whitespace and out of range octets for us
    if (inet_pton(AF_INET, str.c_str(), buf) == 1)
        return AF_INET;
    if (inet_pton(AF_INET6, str.c_str(), buf) == 1)
        return AF_INET6;

    return AF_UNSPEC;
}

std::string formatAddress(int family, const uint8_t buf[16])
{
    char str[INET6_ADDRSTRLEN];
    if (inet_ntop(family, buf, str, sizeof(str)) == nullptr)
        return std::string();

    return std::string(str);
}

void applyPrefix(int family, uint8_t buf[16], unsigned prefixLen)
{
    const size_t len = addressLength(family);
    for (size_t i = 0; i < len; i++)
    {
        const int bits = static_cast<int>(prefixLen) - static_cast<int>(i * 8);
        if (bits >= 8)
            continue;
        else if (bits <= 0)
            buf[i] = 0;
        else
            buf[i] &= static_cast<uint8_t>(0xff << (8 - bits));
    }
}

bool isUnspecifiedOrMulticast(int family, const uint8_t buf[16])
{
    if (family == AF_INET)
    {
        uint32_t raw;
        memcpy(&raw, buf, sizeof(raw));
        const uint32_t addr = ntohl(raw);
        return (addr == INADDR_ANY) || IN_MULTICAST(addr);
    }
    else
    {
        struct in6_addr addr;
        memcpy(&addr, buf, sizeof(addr));
        return IN6_IS_ADDR_UNSPECIFIED(&addr) || IN6_IS_ADDR_MULTICAST(&addr);
    }
}

} // namespace


// -----------------------------------------------------------------------------
/**
 *  @brief Validates a single host address.
 *
 *  The unspecified address and multicast addresses are rejected as they can
 *  never be the address of a container.
 *
 *  @param[in]  str         The address string.
 *  @param[in]  family      AF_INET or AF_INET6 to require a family, AF_UNSPEC
 *                          to accept either.
 *
 *  @return the address in canonical form (i.e. IPv6 zeros compressed).
 */
boost::optional<std::string> AddressUtils::validateAddress(const std::string& str,
                                                           int family)
{
    uint8_t buf[16] = { 0 };
    const int parsedFamily = parseAddress(str, buf);
    if (parsedFamily == AF_UNSPEC)
        return boost::none;
    if ((family != AF_UNSPEC) && (family != parsedFamily))
        return boost::none;
    if (isUnspecifiedOrMulticast(parsedFamily, buf))
        return boost::none;

    std::string canonical = formatAddress(parsedFamily, buf);
    if (canonical.empty())
        return boost::none;

    return canonical;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Validates an address prefix of the form <address>/<length>.
 *
 *  The length must be between 1 and 32 for IPv4 and 1 and 128 for IPv6.  Host
 *  bits in the address are allowed, they are cleared in the returned
 *  @a network field.
 */
boost::optional<Cidr> AddressUtils::validateCidr(const std::string& str, int family)
{
    const size_t slash = str.find('/');
    if ((slash == std::string::npos) || (slash == 0) || (slash == (str.size() - 1)))
        return boost::none;

    const std::string addrStr = str.substr(0, slash);
    const std::string lenStr = str.substr(slash + 1);
    if (lenStr.size() > 3)
        return boost::none;

    unsigned prefixLen = 0;
    for (char c : lenStr)
    {
        if (!isdigit(static_cast<unsigned char>(c)))
            return boost::none;
        prefixLen = (prefixLen * 10) + static_cast<unsigned>(c - '0');
    }

    uint8_t buf[16] = { 0 };
    const int parsedFamily = parseAddress(addrStr, buf);
    if (parsedFamily == AF_UNSPEC)
        return boost::none;
    if ((family != AF_UNSPEC) && (family != parsedFamily))
        return boost::none;

    const unsigned maxLen = (parsedFamily == AF_INET) ? 32 : 128;
    if ((prefixLen == 0) || (prefixLen > maxLen))
        return boost::none;

    Cidr cidr;
    cidr.family = parsedFamily;
    cidr.prefixLen = prefixLen;
    cidr.address = formatAddress(parsedFamily, buf);

    applyPrefix(parsedFamily, buf, prefixLen);
    cidr.network = formatAddress(parsedFamily, buf);

    if (cidr.address.empty() || cidr.network.empty())
        return boost::none;

    return cidr;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Returns true if @a address lies within the @a cidr prefix.
 */
bool AddressUtils::cidrContains(const Cidr& cidr, const std::string& address)
{
    uint8_t addrBuf[16] = { 0 };
    if (parseAddress(address, addrBuf) != cidr.family)
        return false;

    uint8_t netBuf[16] = { 0 };
    if (parseAddress(cidr.network, netBuf) != cidr.family)
        return false;

    applyPrefix(cidr.family, addrBuf, cidr.prefixLen);
    return (memcmp(addrBuf, netBuf, addressLength(cidr.family)) == 0);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Returns AF_INET, AF_INET6 or AF_UNSPEC if @a str isn't an address.
 */
int AddressUtils::addressFamily(const std::string& str)
{
    uint8_t buf[16];
    return parseAddress(str, buf);
}

bool AddressUtils::isLinkLocal(const std::string& address)
{
    uint8_t buf[16] = { 0 };
    const int family = parseAddress(address, buf);
    if (family == AF_INET6)
    {
        struct in6_addr addr;
        memcpy(&addr, buf, sizeof(addr));
        return IN6_IS_ADDR_LINKLOCAL(&addr);
    }
    else if (family == AF_INET)
    {
        // 169.254.0.0/16
        return (buf[0] == 169) && (buf[1] == 254);
    }

    return false;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Port numbers must be in the range 1 to 65535.
 */
boost::optional<uint16_t> AddressUtils::validatePort(unsigned long port)
{
    if ((port == 0) || (port > 65535))
        return boost::none;

    return static_cast<uint16_t>(port);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Checks the name is something the kernel would accept as an
 *  interface name.
 */
bool AddressUtils::isValidIfaceName(const std::string& name)
{
    if (name.empty() || (name.size() >= IFNAMSIZ))
        return false;
    if ((name == ".") || (name == ".."))
        return false;

    for (char c : name)
    {
        if (!isgraph(static_cast<unsigned char>(c)) || (c == '/') ||
            (c == ':') || (c == '"') || (c == '\\'))
            return false;
    }

    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Container (machine) names are restricted to the characters the
 *  runtime allows in a hostname.
 */
bool AddressUtils::isValidContainerName(const std::string& name)
{
    if (name.empty() || (name.size() > 64))
        return false;
    if ((name[0] == '-') || (name[0] == '.'))
        return false;

    for (char c : name)
    {
        if (!isalnum(static_cast<unsigned char>(c)) && (c != '-') &&
            (c != '_') && (c != '.'))
            return false;
    }

    return true;
}
