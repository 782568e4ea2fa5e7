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
 * File:   RuleRenderer.cpp
 *
 */
#include "RuleRenderer.h"

#include <sstream>


std::string IptablesRule::toString() const
{
    std::string str = "-t " + table + " -A " + chain;
    for (const std::string& arg : args)
    {
        str += ' ';
        str += arg;
    }
    return str;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Returns the name of the tunnel interface IPv6 traffic leaves by, or
 *  an empty string if IPv6 uses the WAN interface (or isn't configured).
 */
std::string RuleRenderer::ipv6Uplink(const NetworkConfig& config)
{
    switch (config.transport.method)
    {
        case TransportMethod::SixInFour:
            return config.transport.tunnelIface;
        case TransportMethod::Wireguard:
            return config.transport.wgIface;
        case TransportMethod::None:
        case TransportMethod::Native:
            break;
    }

    return std::string();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Renders the complete ruleset document for the nftables backend.
 *
 *  The document is loaded with 'nft -f' as a single transaction.  Each table
 *  is declared, deleted and then redefined so that loading the document
 *  replaces whatever we previously installed, and creates it if this is the
 *  first load.  Tables not owned by us are never touched.
 *
 *  The output looks like
 *
 *      table inet quay
 *      delete table inet quay
 *      table inet quay {
 *          chain forward {
 *              type filter hook forward priority 0; policy drop;
 *              ct state established,related accept
 *              iifname "br0" oifname "eth0" accept
 *              iifname "eth0" oifname "br0" meta nfproto ipv4 accept
 *              ip daddr 10.0.0.10 tcp dport 22 accept
 *              ip6 daddr 2001:db8::10 tcp dport 443 accept
 *              meta l4proto ipv6-icmp accept
 *          }
 *      }
 *
 *      table ip quay_nat
 *      delete table ip quay_nat
 *      table ip quay_nat {
 *          chain prerouting {
 *              type nat hook prerouting priority -100; policy accept;
 *              iifname != "br0" tcp dport 2222 dnat to 10.0.0.10:22
 *          }
 *          chain postrouting {
 *              type nat hook postrouting priority 100; policy accept;
 *              ip saddr 10.0.0.0/24 oifname "eth0" masquerade
 *          }
 *      }
 *
 */
std::string RuleRenderer::renderNftables(const PolicyState& state)
{
    const NetworkConfig& config = state.config;
    const std::string& bridge = config.bridge;

    std::ostringstream doc;

    doc << "#!/usr/sbin/nft -f\n"
        << "# generated by quay, do not edit\n"
        << "\n";

    // forward filter
    doc << "table " QUAY_NFT_FILTER_TABLE "\n"
        << "delete table " QUAY_NFT_FILTER_TABLE "\n"
        << "table " QUAY_NFT_FILTER_TABLE " {\n"
        << "\tchain forward {\n"
        << "\t\ttype filter hook forward priority 0; policy drop;\n"
        << "\t\tct state established,related accept\n";

    if (config.wanIface)
    {
        const std::string& wan = config.wanIface.get();

        doc << "\t\tiifname \"" << bridge << "\" oifname \"" << wan << "\" accept\n";

        // IPv6 inbound is governed by the ACLs, so only IPv4 is passed
        // through unconditionally
        doc << "\t\tiifname \"" << wan << "\" oifname \"" << bridge << "\" meta nfproto ipv4 accept\n";
    }

    const std::string uplink = ipv6Uplink(config);
    if (!uplink.empty() && (!config.wanIface || (uplink != config.wanIface.get())))
    {
        doc << "\t\tiifname \"" << bridge << "\" oifname \"" << uplink << "\" meta nfproto ipv6 accept\n";
    }

    for (const PortMapEntry& portMap : state.portMaps)
    {
        doc << "\t\tip daddr " << portMap.containerIpv4 << ' '
            << protocolName(portMap.protocol) << " dport " << portMap.containerPort
            << " accept\n";
    }

    for (const Ipv6AclEntry& acl : state.acls)
    {
        doc << "\t\tip6 daddr " << acl.containerIpv6 << ' '
            << protocolName(acl.protocol) << " dport " << acl.destPort
            << " accept\n";
    }

    // neighbour discovery and path MTU discovery break without this
    doc << "\t\tmeta l4proto ipv6-icmp accept\n"
        << "\t}\n"
        << "}\n"
        << "\n";

    // nat
    doc << "table " QUAY_NFT_NAT_TABLE "\n"
        << "delete table " QUAY_NFT_NAT_TABLE "\n"
        << "table " QUAY_NFT_NAT_TABLE " {\n"
        << "\tchain prerouting {\n"
        << "\t\ttype nat hook prerouting priority -100; policy accept;\n";

    for (const PortMapEntry& portMap : state.portMaps)
    {
        doc << "\t\tiifname != \"" << bridge << "\" "
            << protocolName(portMap.protocol) << " dport " << portMap.hostPort
            << " dnat to " << portMap.containerIpv4 << ':' << portMap.containerPort
            << '\n';
    }

    doc << "\t}\n"
        << "\n"
        << "\tchain postrouting {\n"
        << "\t\ttype nat hook postrouting priority 100; policy accept;\n";

    if (config.wanIface)
    {
        doc << "\t\tip saddr " << config.lan4Cidr << " oifname \""
            << config.wanIface.get() << "\" masquerade\n";
    }

    doc << "\t}\n"
        << "}\n";

    return doc.str();
}

// -----------------------------------------------------------------------------
/**
 *  @brief Renders a document that removes our tables, and only our tables.
 *
 *  Declaring the table first means the delete can't fail if the table was
 *  never created.
 */
std::string RuleRenderer::renderNftablesFlush()
{
    return "table " QUAY_NFT_FILTER_TABLE "\n"
           "delete table " QUAY_NFT_FILTER_TABLE "\n"
           "table " QUAY_NFT_NAT_TABLE "\n"
           "delete table " QUAY_NFT_NAT_TABLE "\n";
}

// -----------------------------------------------------------------------------
/**
 *  @brief Renders the ordered list of rules for the iptables backend.
 *
 *  The options are in the same order iptables-save reports them, every rule
 *  carries the owner comment.  IPv6 ACLs are not rendered, the additive
 *  backend only handles IPv4.
 */
std::list<IptablesRule> RuleRenderer::renderIptables(const PolicyState& state)
{
    const NetworkConfig& config = state.config;
    const std::string& bridge = config.bridge;

    static const std::list<std::string> ownerTag =
        { "-m", "comment", "--comment", QUAY_RULE_OWNER_TAG };

    std::list<IptablesRule> rules;

    auto addRule = [&](const char* table, const char* chain,
                       std::list<std::string> match,
                       std::list<std::string> target)
    {
        IptablesRule rule;
        rule.table = table;
        rule.chain = chain;
        rule.args = std::move(match);
        rule.args.insert(rule.args.end(), ownerTag.begin(), ownerTag.end());
        rule.args.splice(rule.args.end(), target);
        rules.push_back(std::move(rule));
    };

    if (config.wanIface)
    {
        const std::string& wan = config.wanIface.get();

        addRule("nat", "POSTROUTING",
                { "-s", config.lan4Cidr, "-o", wan },
                { "-j", "MASQUERADE" });
    }

    addRule("filter", "FORWARD",
            { "-m", "conntrack", "--ctstate", "RELATED,ESTABLISHED" },
            { "-j", "ACCEPT" });

    if (config.wanIface)
    {
        const std::string& wan = config.wanIface.get();

        addRule("filter", "FORWARD",
                { "-i", bridge, "-o", wan },
                { "-j", "ACCEPT" });
        addRule("filter", "FORWARD",
                { "-i", wan, "-o", bridge },
                { "-j", "ACCEPT" });
    }

    for (const PortMapEntry& portMap : state.portMaps)
    {
        const std::string proto = protocolName(portMap.protocol);

        addRule("nat", "PREROUTING",
                { "!", "-i", bridge, "-p", proto, "-m", proto,
                  "--dport", std::to_string(portMap.hostPort) },
                { "-j", "DNAT", "--to-destination",
                  portMap.containerIpv4 + ":" + std::to_string(portMap.containerPort) });

        addRule("filter", "FORWARD",
                { "-d", portMap.containerIpv4 + "/32", "-o", bridge, "-p", proto,
                  "-m", proto, "--dport", std::to_string(portMap.containerPort) },
                { "-j", "ACCEPT" });
    }

    return rules;
}

std::string RuleRenderer::renderIptablesText(const std::list<IptablesRule>& rules)
{
    std::string text;
    for (const IptablesRule& rule : rules)
    {
        text += rule.toString();
        text += '\n';
    }
    return text;
}
