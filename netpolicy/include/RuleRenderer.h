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
 * File:   RuleRenderer.h
 *
 */
#ifndef RULERENDERER_H
#define RULERENDERER_H

#include "NetworkPolicyTypes.h"

#include <list>
#include <string>

// everything installed is tagged / namespaced with these so a flush only ever
// removes what we own
#define QUAY_RULE_OWNER_TAG         "quay"
#define QUAY_NFT_FILTER_TABLE       "inet quay"
#define QUAY_NFT_NAT_TABLE          "ip quay_nat"


// -----------------------------------------------------------------------------
/**
 *  @struct IptablesRule
 *  @brief A single rule for the additive backend.
 *
 *  @a args holds the match and target options, i.e. everything after
 *  '-A <chain>'.
 */
struct IptablesRule
{
    std::string table;
    std::string chain;
    std::list<std::string> args;

    std::string toString() const;

    bool operator==(const IptablesRule& rhs) const
    {
        return (table == rhs.table) && (chain == rhs.chain) && (args == rhs.args);
    }
};

// -----------------------------------------------------------------------------
/**
 *  @class RuleRenderer
 *  @brief Turns the declarative policy state into firewall rules.
 *
 *  Pure functions, no side effects.  The WAN interface must already be
 *  resolved into the config, if it's not set the bridge passthrough and
 *  masquerade rules are omitted.
 */
class RuleRenderer
{
public:
    static std::string renderNftables(const PolicyState& state);
    static std::string renderNftablesFlush();

    static std::list<IptablesRule> renderIptables(const PolicyState& state);
    static std::string renderIptablesText(const std::list<IptablesRule>& rules);

private:
    static std::string ipv6Uplink(const NetworkConfig& config);
};

#endif // !defined(RULERENDERER_H)
