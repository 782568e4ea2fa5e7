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
 * File:   AddressUtils.h
 *
 */
#ifndef ADDRESSUTILS_H
#define ADDRESSUTILS_H

#include <boost/optional.hpp>

#include <cstdint>
#include <string>

#include <sys/socket.h>


// -----------------------------------------------------------------------------
/**
 *  @struct Cidr
 *  @brief A parsed and normalised address prefix.
 *
 *  @a address is the address as supplied (in canonical text form), @a network
 *  is the same address with the host bits cleared.
 */
struct Cidr
{
    int family = AF_UNSPEC;
    std::string address;
    std::string network;
    unsigned prefixLen = 0;

    std::string toString() const
    {
        return network + "/" + std::to_string(prefixLen);
    }

    std::string addressWithPrefix() const
    {
        return address + "/" + std::to_string(prefixLen);
    }
};

// -----------------------------------------------------------------------------
/**
 *  @class AddressUtils
 *  @brief Parsing and range checking of everything user supplied that ends
 *  up in a persisted record or a rendered rule.
 *
 *  All the validate functions return boost::none for malformed input, they
 *  never throw.
 */
class AddressUtils
{
public:
    static boost::optional<std::string> validateAddress(const std::string& str,
                                                        int family = AF_UNSPEC);

    static boost::optional<Cidr> validateCidr(const std::string& str,
                                              int family = AF_UNSPEC);

    static bool cidrContains(const Cidr& cidr, const std::string& address);

    static int addressFamily(const std::string& str);

    static bool isLinkLocal(const std::string& address);

public:
    static boost::optional<uint16_t> validatePort(unsigned long port);

    static bool isValidIfaceName(const std::string& name);
    static bool isValidContainerName(const std::string& name);
};

#endif // !defined(ADDRESSUTILS_H)
