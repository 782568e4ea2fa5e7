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
 * File:   Netlink.cpp
 *
 */
#include "Netlink.h"

#include <Logging.h>
#include <FileUtilities.h>

#include <cerrno>
#include <cstdint>
#include <fcntl.h>
#include <unistd.h>
#include <arpa/inet.h>
#include <linux/if.h>
#include <linux/neighbour.h>
#include <linux/rtnetlink.h>
#include <netlink/netlink.h>
#include <netlink/socket.h>
#include <netlink/errno.h>
#include <netlink/cache.h>
#include <netlink/route/link.h>
#include <netlink/route/addr.h>
#include <netlink/route/route.h>
#include <netlink/route/nexthop.h>
#include <netlink/route/neighbour.h>
#include <netlink/route/link/sit.h>

#define QUAY_LOG_NL_ERROR(err, fmt, args...) \
    QUAY_LOG_ERROR(fmt " (%d - %s)", ##args, -err, nl_geterror(err))

#define QUAY_LOG_NL_ERROR_EXIT(err, fmt, args...) \
    QUAY_LOG_ERROR_EXIT(fmt " (%d - %s)", ##args, -err, nl_geterror(err))


namespace
{

// -----------------------------------------------------------------------------
/**
 *  @class NlAddress
 *  @brief Wrapper around the nl_addr object
 *
 *  Parses an address, with optional prefix length, from it's text form.
 */
class NlAddress
{
public:
    NlAddress(const std::string& str, int family)
        : mAddress(parse(str, family))
    { }

    ~NlAddress()
    {
        if (mAddress)
            nl_addr_put(mAddress);
    }

    NlAddress(const NlAddress&) = delete;
    NlAddress& operator=(const NlAddress&) = delete;

public:
    explicit operator bool() const noexcept
    {
        return (mAddress != nullptr);
    }

    operator struct nl_addr*() const noexcept
    {
        return mAddress;
    }

private:
    static struct nl_addr* parse(const std::string& str, int family)
    {
        struct nl_addr* addr = nullptr;

        int ret = nl_addr_parse(str.c_str(), family, &addr);
        if (ret < 0)
        {
            QUAY_LOG_NL_ERROR(ret, "failed to parse address '%s'", str.c_str());
            return nullptr;
        }

        return addr;
    }

private:
    struct nl_addr* const mAddress;
};

// -----------------------------------------------------------------------------
/**
 *  @class NlLink
 *  @brief Wrapper around the rtnl_link object
 *
 *  Simple wrapper used to handle construction and safe destruction of a rtnl
 *  link object.
 */
class NlLink
{
public:
    explicit NlLink(struct rtnl_link* link)
        : mLink(link)
    { }

    NlLink(struct nl_sock* nl, const std::string& name)
        : mLink(fromName(nl, name))
    { }

    ~NlLink()
    {
        if (mLink != nullptr)
            rtnl_link_put(mLink);
    }

    NlLink(const NlLink&) = delete;
    NlLink& operator=(const NlLink&) = delete;

public:
    explicit operator bool() const noexcept
    {
        return (mLink != nullptr);
    }

    operator struct rtnl_link*() const noexcept
    {
        return mLink;
    }

private:
    static struct rtnl_link* fromName(struct nl_sock* nl, const std::string& name)
    {
        struct rtnl_link* link = nullptr;

        int ret = rtnl_link_get_kernel(nl, -1, name.c_str(), &link);
        if (ret != 0)
        {
            QUAY_LOG_DEBUG("no interface with name '%s' (%s)", name.c_str(),
                           nl_geterror(ret));
            return nullptr;
        }

        return link;
    }

private:
    struct rtnl_link* const mLink;
};

// -----------------------------------------------------------------------------
/**
 *  @class NlRoute
 *  @brief Wrapper around the rtnl_route object
 */
class NlRoute
{
public:
    NlRoute()
        : mRoute(rtnl_route_alloc())
    { }

    ~NlRoute()
    {
        if (mRoute != nullptr)
            rtnl_route_put(mRoute);
    }

    NlRoute(const NlRoute&) = delete;
    NlRoute& operator=(const NlRoute&) = delete;

public:
    explicit operator bool() const noexcept
    {
        return (mRoute != nullptr);
    }

    operator struct rtnl_route*() const noexcept
    {
        return mRoute;
    }

    std::string toString() const
    {
        if (mRoute == nullptr)
            return std::string("null");

        char buf[128];
        nl_object_dump_buf(OBJ_CAST(mRoute), buf, sizeof(buf));

        std::string str(buf);
        if (!str.empty() && (str.back() == '\n'))
            str.pop_back();

        return str;
    }

private:
    struct rtnl_route* const mRoute;
};

// -----------------------------------------------------------------------------
/**
 *  @class NlNeigh
 *  @brief Wrapper around the rtnl_neigh object
 */
class NlNeigh
{
public:
    NlNeigh()
        : mNeigh(rtnl_neigh_alloc())
    { }

    ~NlNeigh()
    {
        if (mNeigh != nullptr)
            rtnl_neigh_put(mNeigh);
    }

    NlNeigh(const NlNeigh&) = delete;
    NlNeigh& operator=(const NlNeigh&) = delete;

public:
    explicit operator bool() const noexcept
    {
        return (mNeigh != nullptr);
    }

    operator struct rtnl_neigh*() const noexcept
    {
        return mNeigh;
    }

private:
    struct rtnl_neigh* const mNeigh;
};

// -----------------------------------------------------------------------------
/**
 *  @class NlRouteAddress
 *  @brief Wrapper around the rtnl_addr object
 */
class NlRouteAddress
{
public:
    NlRouteAddress()
        : mAddress(rtnl_addr_alloc())
    { }

    ~NlRouteAddress()
    {
        if (mAddress)
            rtnl_addr_put(mAddress);
    }

    NlRouteAddress(const NlRouteAddress&) = delete;
    NlRouteAddress& operator=(const NlRouteAddress&) = delete;

public:
    explicit operator bool() const noexcept
    {
        return (mAddress != nullptr);
    }

    operator struct rtnl_addr*() const noexcept
    {
        return mAddress;
    }

private:
    struct rtnl_addr* const mAddress;
};

// builds a route to @a destination out of @a link, nullptr gateway for an
// on-link route
bool buildRoute6(const NlRoute& route, const NlLink& link,
                 const NlAddress& destination, const NlAddress* gateway)
{
    rtnl_route_set_scope(route, RT_SCOPE_UNIVERSE);
    rtnl_route_set_table(route, RT_TABLE_MAIN);
    rtnl_route_set_protocol(route, RTPROT_STATIC);

    int ret = rtnl_route_set_family(route, AF_INET6);
    if (ret != 0)
    {
        QUAY_LOG_NL_ERROR(ret, "failed to set the route family");
        return false;
    }
    ret = rtnl_route_set_dst(route, destination);
    if (ret != 0)
    {
        QUAY_LOG_NL_ERROR(ret, "failed to set the route destination");
        return false;
    }

    // create a 'next hop' object (nb once assigned to the route it'll be
    // freed when the route is destructed).
    struct rtnl_nexthop* nextHop = rtnl_route_nh_alloc();
    if (nextHop == nullptr)
    {
        QUAY_LOG_ERROR("failed to create empty next hop");
        return false;
    }

    rtnl_route_nh_set_ifindex(nextHop, rtnl_link_get_ifindex(link));
    if (gateway != nullptr)
        rtnl_route_nh_set_gateway(nextHop, *gateway);

    rtnl_route_add_nexthop(route, nextHop);
    return true;
}

} // namespace


Netlink::Netlink()
    : mSocket(nullptr)
{
    QUAY_LOG_FN_ENTRY();

    // create the netlink socket
    mSocket = nl_socket_alloc();
    if (!mSocket)
    {
        QUAY_LOG_ERROR_EXIT("failed to create netlink socket");
        return;
    }

    // try and connect to the kernel
    int ret = nl_connect(mSocket, NETLINK_ROUTE);
    if (ret != 0)
    {
        QUAY_LOG_NL_ERROR_EXIT(ret, "unable to connect to netlink socket");
        nl_socket_free(mSocket);
        mSocket = nullptr;
        return;
    }

    // set the FD_CLOEXEC flag on the socket
    int fd = nl_socket_get_fd(mSocket);
    if (fd < 0)
    {
        QUAY_LOG_ERROR("invalid socket fd");
        nl_socket_free(mSocket);
        mSocket = nullptr;
    }
    else
    {
        int flags = fcntl(fd, F_GETFD, 0);
        if ((flags < 0) || (fcntl(fd, F_SETFD, flags | FD_CLOEXEC) < 0))
        {
            QUAY_LOG_SYS_ERROR(errno, "failed to set FD_CLOEXEC");
            nl_socket_free(mSocket);
            mSocket = nullptr;
        }
    }

    QUAY_LOG_FN_EXIT();
}

Netlink::~Netlink()
{
    if (mSocket != nullptr)
    {
        nl_socket_free(mSocket);
        mSocket = nullptr;
    }
}

bool Netlink::isValid() const
{
    std::lock_guard<std::mutex> locker(mLock);
    return (mSocket != nullptr);
}

bool Netlink::ifaceExists(const std::string& ifaceName) const
{
    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        QUAY_LOG_ERROR("invalid socket");
        return false;
    }

    NlLink link(mSocket, ifaceName);
    return static_cast<bool>(link);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Brings an interface up
 *
 *      ip link set <ifaceName> up
 */
bool Netlink::ifaceUp(const std::string& ifaceName)
{
    QUAY_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        QUAY_LOG_ERROR_EXIT("invalid socket");
        return false;
    }

    NlLink link(mSocket, ifaceName);
    if (!link)
    {
        QUAY_LOG_ERROR_EXIT("failed to get link '%s'", ifaceName.c_str());
        return false;
    }

    // create an empty link object with just the flags changed
    NlLink changes(rtnl_link_alloc());
    if (!changes)
    {
        QUAY_LOG_ERROR_EXIT("failed to create changes object");
        return false;
    }

    rtnl_link_set_flags(changes, IFF_UP);

    int ret = rtnl_link_change(mSocket, link, changes, 0);
    if (ret != 0)
    {
        QUAY_LOG_NL_ERROR_EXIT(ret, "failed to bring up '%s'", ifaceName.c_str());
        return false;
    }

    QUAY_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Finds the interface the default route goes out of.
 *
 *  This is the equivalent of the following on the command line
 *
 *      ip route show default
 *
 */
boost::optional<std::string> Netlink::defaultRouteIface(int family) const
{
    QUAY_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        QUAY_LOG_ERROR_EXIT("invalid socket");
        return boost::none;
    }

    struct nl_cache* cache = nullptr;
    int ret = rtnl_route_alloc_cache(mSocket, family, 0, &cache);
    if (ret != 0)
    {
        QUAY_LOG_NL_ERROR_EXIT(ret, "failed to get the route table");
        return boost::none;
    }

    int bestIndex = -1;
    uint32_t bestMetric = UINT32_MAX;

    for (struct nl_object* obj = nl_cache_get_first(cache); obj != nullptr;
         obj = nl_cache_get_next(obj))
    {
        struct rtnl_route* route = reinterpret_cast<struct rtnl_route*>(obj);

        if ((rtnl_route_get_table(route) != RT_TABLE_MAIN) ||
            (rtnl_route_get_type(route) != RTN_UNICAST))
            continue;

        struct nl_addr* dst = rtnl_route_get_dst(route);
        if ((dst != nullptr) && (nl_addr_get_prefixlen(dst) != 0))
            continue;

        if (rtnl_route_get_nnexthops(route) < 1)
            continue;

        struct rtnl_nexthop* nextHop = rtnl_route_nexthop_n(route, 0);
        const int ifindex = rtnl_route_nh_get_ifindex(nextHop);
        const uint32_t metric = rtnl_route_get_priority(route);
        if ((ifindex > 0) && ((bestIndex < 0) || (metric < bestMetric)))
        {
            bestIndex = ifindex;
            bestMetric = metric;
        }
    }

    nl_cache_free(cache);

    if (bestIndex < 0)
    {
        QUAY_LOG_INFO("no default route found");
        QUAY_LOG_FN_EXIT();
        return boost::none;
    }

    struct rtnl_link* rawLink = nullptr;
    ret = rtnl_link_get_kernel(mSocket, bestIndex, nullptr, &rawLink);
    if (ret != 0)
    {
        QUAY_LOG_NL_ERROR_EXIT(ret, "failed to get link with index %d", bestIndex);
        return boost::none;
    }

    NlLink link(rawLink);
    const char* name = rtnl_link_get_name(link);
    if (name == nullptr)
    {
        QUAY_LOG_ERROR_EXIT("link with index %d has no name", bestIndex);
        return boost::none;
    }

    QUAY_LOG_INFO("default route is via '%s'", name);

    QUAY_LOG_FN_EXIT();
    return std::string(name);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Creates a 6in4 (sit) tunnel interface, replacing any existing
 *  interface of the same name.
 *
 *      ip tunnel add <name> mode sit local <localV4> remote <remoteV4> ttl 64
 */
bool Netlink::createSitTunnel(const std::string& ifaceName,
                              const std::string& localV4,
                              const std::string& remoteV4)
{
    QUAY_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        QUAY_LOG_ERROR_EXIT("invalid socket");
        return false;
    }

    struct in_addr local;
    struct in_addr remote;
    if ((inet_pton(AF_INET, localV4.c_str(), &local) != 1) ||
        (inet_pton(AF_INET, remoteV4.c_str(), &remote) != 1))
    {
        QUAY_LOG_ERROR_EXIT("invalid tunnel endpoints '%s' -> '%s'",
                            localV4.c_str(), remoteV4.c_str());
        return false;
    }

    // remove any stale tunnel first so the new endpoints take effect
    {
        NlLink existing(mSocket, ifaceName);
        if (existing)
        {
            int ret = rtnl_link_delete(mSocket, existing);
            if (ret != 0)
            {
                QUAY_LOG_NL_ERROR_EXIT(ret, "failed to delete existing link '%s'",
                                       ifaceName.c_str());
                return false;
            }
        }
    }

    NlLink link(rtnl_link_sit_alloc());
    if (!link)
    {
        QUAY_LOG_ERROR_EXIT("failed to allocate sit link");
        return false;
    }

    rtnl_link_set_name(link, ifaceName.c_str());
    rtnl_link_sit_set_local(link, local.s_addr);
    rtnl_link_sit_set_remote(link, remote.s_addr);
    rtnl_link_sit_set_ttl(link, 64);

    int ret = rtnl_link_add(mSocket, link, NLM_F_CREATE | NLM_F_EXCL);
    if (ret != 0)
    {
        QUAY_LOG_NL_ERROR_EXIT(ret, "failed to create sit tunnel '%s'",
                               ifaceName.c_str());
        return false;
    }

    QUAY_LOG_INFO("created sit tunnel '%s' %s -> %s", ifaceName.c_str(),
                  localV4.c_str(), remoteV4.c_str());

    QUAY_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Deletes an interface, it's not an error if it doesn't exist.
 *
 *      ip link del <name>
 */
bool Netlink::deleteLink(const std::string& ifaceName)
{
    QUAY_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        QUAY_LOG_ERROR_EXIT("invalid socket");
        return false;
    }

    NlLink link(mSocket, ifaceName);
    if (!link)
    {
        QUAY_LOG_FN_EXIT();
        return true;
    }

    int ret = rtnl_link_delete(mSocket, link);
    if (ret != 0)
    {
        QUAY_LOG_NL_ERROR_EXIT(ret, "failed to delete link '%s'", ifaceName.c_str());
        return false;
    }

    QUAY_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Adds an address to the interface.
 *
 *      ip addr add <address>/<prefix> dev <ifaceName>
 */
bool Netlink::addIfaceAddress(const std::string& ifaceName,
                              const std::string& addressWithPrefix)
{
    QUAY_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        QUAY_LOG_ERROR_EXIT("invalid socket");
        return false;
    }

    NlLink link(mSocket, ifaceName);
    if (!link)
    {
        QUAY_LOG_ERROR_EXIT("failed to get link '%s'", ifaceName.c_str());
        return false;
    }

    NlAddress local(addressWithPrefix, AF_UNSPEC);
    if (!local)
    {
        QUAY_LOG_FN_EXIT();
        return false;
    }

    NlRouteAddress addr;
    if (!addr)
    {
        QUAY_LOG_ERROR_EXIT("failed to create route address");
        return false;
    }

    rtnl_addr_set_ifindex(addr, rtnl_link_get_ifindex(link));
    rtnl_addr_set_family(addr, nl_addr_get_family(local));
    rtnl_addr_set_prefixlen(addr, nl_addr_get_prefixlen(local));

    int ret = rtnl_addr_set_local(addr, local);
    if (ret != 0)
    {
        QUAY_LOG_NL_ERROR_EXIT(ret, "failed to set local address");
        return false;
    }

    ret = rtnl_addr_add(mSocket, addr, 0);
    if (ret == -NLE_EXIST)
    {
        QUAY_LOG_DEBUG("address %s already on '%s'", addressWithPrefix.c_str(),
                       ifaceName.c_str());
    }
    else if (ret != 0)
    {
        QUAY_LOG_NL_ERROR_EXIT(ret, "failed to add address %s to '%s'",
                               addressWithPrefix.c_str(), ifaceName.c_str());
        return false;
    }

    QUAY_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Adds an IPv6 route.
 *
 *      ip -6 route add <destination> [via <gateway>] dev <ifaceName>
 *
 *  @param[in]  gateway     The next hop, empty for an on-link route.
 */
bool Netlink::addRoute6(const std::string& ifaceName,
                        const std::string& destination,
                        const std::string& gateway)
{
    QUAY_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        QUAY_LOG_ERROR_EXIT("invalid socket");
        return false;
    }

    NlAddress dstAddress(destination, AF_INET6);
    if (!dstAddress)
    {
        QUAY_LOG_FN_EXIT();
        return false;
    }

    NlLink link(mSocket, ifaceName);
    if (!link)
    {
        QUAY_LOG_ERROR_EXIT("failed to get link '%s'", ifaceName.c_str());
        return false;
    }

    NlRoute route;
    if (!route)
    {
        QUAY_LOG_ERROR_EXIT("failed to create empty route");
        return false;
    }

    bool built;
    if (gateway.empty())
    {
        built = buildRoute6(route, link, dstAddress, nullptr);
    }
    else
    {
        NlAddress gwAddress(gateway, AF_INET6);
        built = gwAddress && buildRoute6(route, link, dstAddress, &gwAddress);
    }

    if (!built)
    {
        QUAY_LOG_FN_EXIT();
        return false;
    }

    QUAY_LOG_INFO("adding route '%s'", route.toString().c_str());

    int ret = rtnl_route_add(mSocket, route, 0);
    if (ret == -NLE_EXIST)
    {
        QUAY_LOG_DEBUG("route to %s already exists", destination.c_str());
    }
    else if (ret != 0)
    {
        QUAY_LOG_NL_ERROR_EXIT(ret, "failed to add route");
        return false;
    }

    QUAY_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Removes an on-link IPv6 route, it's not an error if the route or
 *  the interface doesn't exist.
 *
 *      ip -6 route del <destination> dev <ifaceName>
 */
bool Netlink::delRoute6(const std::string& ifaceName,
                        const std::string& destination)
{
    QUAY_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        QUAY_LOG_ERROR_EXIT("invalid socket");
        return false;
    }

    NlAddress dstAddress(destination, AF_INET6);
    if (!dstAddress)
    {
        QUAY_LOG_FN_EXIT();
        return false;
    }

    NlLink link(mSocket, ifaceName);
    if (!link)
    {
        QUAY_LOG_FN_EXIT();
        return true;
    }

    NlRoute route;
    if (!route || !buildRoute6(route, link, dstAddress, nullptr))
    {
        QUAY_LOG_ERROR_EXIT("failed to create route");
        return false;
    }

    int ret = rtnl_route_delete(mSocket, route, 0);
    if ((ret != 0) && (ret != -NLE_OBJ_NOTFOUND))
    {
        QUAY_LOG_NL_ERROR_EXIT(ret, "failed to delete route to %s", destination.c_str());
        return false;
    }

    QUAY_LOG_FN_EXIT();
    return true;
}

// -----------------------------------------------------------------------------
/**
 *  @brief Enables or disables neighbour discovery proxying on the interface
 *
 *      echo "1" > /proc/sys/net/ipv6/conf/<ifaceName>/proxy_ndp
 */
bool Netlink::setProxyNdp(const std::string& ifaceName, bool enable)
{
    // libnl doesn't have an API for editing IPv6 devconf values, so we have
    // to write it manually
    const std::string path = "/proc/sys/net/ipv6/conf/" + ifaceName + "/proxy_ndp";

    return QuayCommon::createTextFile(path, enable ? "1" : "0", 0644);
}

bool Netlink::addProxyNeighbour(const std::string& ifaceName,
                                const std::string& address)
{
    return changeProxyNeighbour(ifaceName, address, true);
}

bool Netlink::delProxyNeighbour(const std::string& ifaceName,
                                const std::string& address)
{
    return changeProxyNeighbour(ifaceName, address, false);
}

// -----------------------------------------------------------------------------
/**
 *  @brief Adds or removes a proxy neighbour entry.
 *
 *      ip -6 neigh add proxy <address> dev <ifaceName>
 *      ip -6 neigh del proxy <address> dev <ifaceName>
 */
bool Netlink::changeProxyNeighbour(const std::string& ifaceName,
                                   const std::string& address, bool add)
{
    QUAY_LOG_FN_ENTRY();

    std::lock_guard<std::mutex> locker(mLock);

    if (mSocket == nullptr)
    {
        QUAY_LOG_ERROR_EXIT("invalid socket");
        return false;
    }

    NlLink link(mSocket, ifaceName);
    if (!link)
    {
        // nothing to remove if the interface has gone
        QUAY_LOG_FN_EXIT();
        return !add;
    }

    NlAddress dst(address, AF_INET6);
    if (!dst)
    {
        QUAY_LOG_FN_EXIT();
        return false;
    }

    NlNeigh neigh;
    if (!neigh)
    {
        QUAY_LOG_ERROR_EXIT("failed to allocate neighbour object");
        return false;
    }

    rtnl_neigh_set_ifindex(neigh, rtnl_link_get_ifindex(link));
    rtnl_neigh_set_family(neigh, AF_INET6);
    rtnl_neigh_set_flags(neigh, NTF_PROXY);

    int ret = rtnl_neigh_set_dst(neigh, dst);
    if (ret != 0)
    {
        QUAY_LOG_NL_ERROR_EXIT(ret, "failed to set neighbour address");
        return false;
    }

    if (add)
    {
        ret = rtnl_neigh_add(mSocket, neigh, NLM_F_CREATE | NLM_F_REPLACE);
        if (ret < 0)
        {
            QUAY_LOG_NL_ERROR_EXIT(ret, "failed to add proxy neighbour %s on '%s'",
                                   address.c_str(), ifaceName.c_str());
            return false;
        }
    }
    else
    {
        ret = rtnl_neigh_delete(mSocket, neigh, 0);
        if ((ret < 0) && (ret != -NLE_OBJ_NOTFOUND))
        {
            QUAY_LOG_NL_ERROR_EXIT(ret, "failed to delete proxy neighbour %s on '%s'",
                                   address.c_str(), ifaceName.c_str());
            return false;
        }
    }

    QUAY_LOG_FN_EXIT();
    return true;
}
