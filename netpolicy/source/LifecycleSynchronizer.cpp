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
 * File:   LifecycleSynchronizer.cpp
 *
 */
#include "LifecycleSynchronizer.h"
#include "IFirewallBackend.h"

#include <Logging.h>

#include <algorithm>


// -----------------------------------------------------------------------------
/**
 *  @brief Removes every port map and ACL owned by @a containerName.
 *
 *  @return the number of entries removed.
 */
size_t LifecycleSynchronizer::purgeContainer(const std::string& containerName,
                                             PolicyState* state)
{
    const size_t before = state->portMaps.size() + state->acls.size();

    state->portMaps.erase(
        std::remove_if(state->portMaps.begin(), state->portMaps.end(),
                       [&](const PortMapEntry& entry)
                       {
                           return (entry.containerName == containerName);
                       }),
        state->portMaps.end());

    state->acls.erase(
        std::remove_if(state->acls.begin(), state->acls.end(),
                       [&](const Ipv6AclEntry& entry)
                       {
                           return (entry.containerName == containerName);
                       }),
        state->acls.end());

    const size_t removed = before - (state->portMaps.size() + state->acls.size());
    if (removed > 0)
    {
        QUAY_LOG_INFO("purged %zu entries owned by container '%s'",
                      removed, containerName.c_str());
    }

    return removed;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Hands the firewall over from one backend to the other.
 *
 *  The outgoing backend is flushed first, if that fails the incoming backend
 *  is not touched and BackendConflict is returned; applying on top of the
 *  old rules would give duplicate DNAT / double masquerade.
 *
 *  If the incoming backend fails to apply its rules are flushed again and
 *  the outgoing backend is put back with @a outgoingState, so the host isn't
 *  left without any forwarding rules.
 *
 */
PolicyResult LifecycleSynchronizer::switchBackend(IFirewallBackend* outgoing,
                                                  IFirewallBackend* incoming,
                                                  const PolicyState& outgoingState,
                                                  const PolicyState& incomingState)
{
    QUAY_LOG_FN_ENTRY();

    QUAY_LOG_MILESTONE("switching firewall backend from %s to %s",
                       natBackendName(outgoing->type()),
                       natBackendName(incoming->type()));

    PolicyResult result = outgoing->flush();
    if (!result.ok())
    {
        QUAY_LOG_ERROR_EXIT("failed to flush %s rules, not switching backend",
                            natBackendName(outgoing->type()));
        return PolicyResult::failure(PolicyError::BackendConflict,
                                     std::string("failed to flush ") +
                                     natBackendName(outgoing->type()) +
                                     " rules: " + result.detail);
    }

    result = incoming->apply(incomingState, nullptr);
    if (!result.ok())
    {
        QUAY_LOG_ERROR("failed to apply %s rules, restoring %s",
                       natBackendName(incoming->type()),
                       natBackendName(outgoing->type()));

        const PolicyResult flushed = incoming->flush();
        if (!flushed.ok())
            QUAY_LOG_ERROR("failed to flush partial %s rules", natBackendName(incoming->type()));

        const PolicyResult restored = outgoing->apply(outgoingState, nullptr);
        if (!restored.ok())
            QUAY_LOG_ERROR("failed to restore %s rules", natBackendName(outgoing->type()));
    }

    QUAY_LOG_FN_EXIT();
    return result;
}
