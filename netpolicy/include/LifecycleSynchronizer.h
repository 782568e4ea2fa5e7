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
 * File:   LifecycleSynchronizer.h
 *
 */
#ifndef LIFECYCLESYNCHRONIZER_H
#define LIFECYCLESYNCHRONIZER_H

#include "NetworkPolicyTypes.h"

#include <cstddef>
#include <string>

class IFirewallBackend;


// -----------------------------------------------------------------------------
/**
 *  @class LifecycleSynchronizer
 *  @brief Keeps the declared state consistent with events the engine doesn't
 *  control, i.e. containers going away and the firewall backend changing.
 *
 */
class LifecycleSynchronizer
{
public:
    static size_t purgeContainer(const std::string& containerName,
                                 PolicyState* state);

    static PolicyResult switchBackend(IFirewallBackend* outgoing,
                                      IFirewallBackend* incoming,
                                      const PolicyState& outgoingState,
                                      const PolicyState& incomingState);
};

#endif // !defined(LIFECYCLESYNCHRONIZER_H)
