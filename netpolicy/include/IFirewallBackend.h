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
 * File:   IFirewallBackend.h
 *
 */
#ifndef IFIREWALLBACKEND_H
#define IFIREWALLBACKEND_H

#include "NetworkPolicyTypes.h"

#include <string>


// -----------------------------------------------------------------------------
/**
 *  @class IFirewallBackend
 *  @brief Interface implemented by the two NAT / filter backends.
 *
 *  Exactly one backend is authoritative at a time, switching requires the
 *  outgoing backend to be flushed before the incoming one is applied.
 *
 */
class IFirewallBackend
{
public:
    virtual ~IFirewallBackend() = default;

    virtual NatBackend type() const = 0;

    // -------------------------------------------------------------------------
    /**
     *  @brief Returns the rules that apply() would install, as text.
     */
    virtual std::string render(const PolicyState& state) const = 0;

    // -------------------------------------------------------------------------
    /**
     *  @brief Installs the rules for @a desired.
     *
     *  @a previous is the state that was last applied, if known, and is used
     *  by backends that have to remove stale rules individually.  Applying the
     *  same state twice must be a no-op.
     */
    virtual PolicyResult apply(const PolicyState& desired,
                               const PolicyState* previous) = 0;

    // -------------------------------------------------------------------------
    /**
     *  @brief Removes everything this backend has installed.
     */
    virtual PolicyResult flush() = 0;
};

#endif // !defined(IFIREWALLBACKEND_H)
