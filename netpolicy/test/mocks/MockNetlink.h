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
#ifndef MOCKNETLINK_H
#define MOCKNETLINK_H

#include <INetlink.h>

#include <boost/optional/optional_io.hpp>

#include <gmock/gmock.h>

class MockNetlink : public INetlink
{
public:
    MOCK_METHOD(bool, ifaceExists, (const std::string& ifaceName), (const, override));
    MOCK_METHOD(bool, ifaceUp, (const std::string& ifaceName), (override));
    MOCK_METHOD(boost::optional<std::string>, defaultRouteIface, (int family), (const, override));

    MOCK_METHOD(bool, createSitTunnel, (const std::string& ifaceName,
                                        const std::string& localV4,
                                        const std::string& remoteV4), (override));
    MOCK_METHOD(bool, deleteLink, (const std::string& ifaceName), (override));
    MOCK_METHOD(bool, addIfaceAddress, (const std::string& ifaceName,
                                        const std::string& addressWithPrefix), (override));
    MOCK_METHOD(bool, addRoute6, (const std::string& ifaceName,
                                  const std::string& destination,
                                  const std::string& gateway), (override));
    MOCK_METHOD(bool, delRoute6, (const std::string& ifaceName,
                                  const std::string& destination), (override));

    MOCK_METHOD(bool, setProxyNdp, (const std::string& ifaceName, bool enable), (override));
    MOCK_METHOD(bool, addProxyNeighbour, (const std::string& ifaceName,
                                          const std::string& address), (override));
    MOCK_METHOD(bool, delProxyNeighbour, (const std::string& ifaceName,
                                          const std::string& address), (override));
};

#endif // !defined(MOCKNETLINK_H)
