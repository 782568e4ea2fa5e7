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
#include <NetworkPolicyManager.h>
#include <ConfigStore.h>
#include <Settings.h>
#include <FileUtilities.h>
#include <ScratchSpace.h>

#include "FakeHostTools.h"
#include "MockContainerRuntime.h"
#include "MockNetlink.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cstring>
#include <thread>

#include <sys/socket.h>

using namespace QuayCommon;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;


class NetworkPolicyManagerTest : public ::testing::Test
{
protected:
    NetworkPolicyManagerTest()
        : mScratch("/tmp")
        , mTools(std::make_shared<FakeHostTools>())
        , mRuntime(std::make_shared<NiceMock<MockContainerRuntime>>())
        , mNetlink(std::make_shared<NiceMock<MockNetlink>>())
    {
        Json::Value json;
        json["paths"]["stateDir"] = mScratch.path() + "/state";
        json["paths"]["nftRuleset"] = mScratch.path() + "/etc/quay.nft";
        json["paths"]["wireguardDir"] = mScratch.path() + "/wireguard";
        json["paths"]["networkdDir"] = mScratch.path() + "/network";
        json["tools"]["nft"] = FAKE_NFT;
        json["tools"]["iptables"] = FAKE_IPTABLES;
        json["tools"]["iptablesSave"] = FAKE_IPTABLES_SAVE;
        json["tools"]["machinectl"] = FAKE_MACHINECTL;
        json["tools"]["systemctl"] = FAKE_SYSTEMCTL;
        json["tools"]["networkctl"] = FAKE_NETWORKCTL;
        json["network"]["bridge"] = "br0";
        json["network"]["lan4Cidr"] = "192.168.100.0/24";
        json["network"]["lan4Gateway"] = "192.168.100.1";
        json["network"]["natBackend"] = "nftables";
        mSettings = Settings::fromJson(json);

        ON_CALL(*mRuntime, containerExists(_)).WillByDefault(Return(true));
        ON_CALL(*mRuntime, listAddresses(_)).WillByDefault(Return(std::list<std::string>()));
        ON_CALL(*mRuntime, listAddresses("web1"))
            .WillByDefault(Return(std::list<std::string>{ "192.168.100.10", "fe80::10",
                                                          "2001:db8:abcd:100::10" }));
        ON_CALL(*mRuntime, listAddresses("web2"))
            .WillByDefault(Return(std::list<std::string>{ "192.168.100.20" }));

        ON_CALL(*mNetlink, defaultRouteIface(AF_INET))
            .WillByDefault(Return(boost::optional<std::string>(std::string("eth0"))));
        ON_CALL(*mNetlink, ifaceExists(_)).WillByDefault(Return(true));
        ON_CALL(*mNetlink, ifaceUp(_)).WillByDefault(Return(true));
        ON_CALL(*mNetlink, createSitTunnel(_, _, _)).WillByDefault(Return(true));
        ON_CALL(*mNetlink, deleteLink(_)).WillByDefault(Return(true));
        ON_CALL(*mNetlink, addIfaceAddress(_, _)).WillByDefault(Return(true));
        ON_CALL(*mNetlink, addRoute6(_, _, _)).WillByDefault(Return(true));
        ON_CALL(*mNetlink, delRoute6(_, _)).WillByDefault(Return(true));
        ON_CALL(*mNetlink, setProxyNdp(_, _)).WillByDefault(Return(true));
        ON_CALL(*mNetlink, addProxyNeighbour(_, _)).WillByDefault(Return(true));
        ON_CALL(*mNetlink, delProxyNeighbour(_, _)).WillByDefault(Return(true));

        mManager.reset(new NetworkPolicyManager(mSettings, mTools, mRuntime, mNetlink));
    }

    // what's actually on disk, without the WAN auto-detection
    PolicyState persisted() const
    {
        ConfigStore store(mSettings->stateDir(), mSettings->networkDefaults());

        PolicyState state;
        state.config = store.load();
        state.portMaps = store.loadPortMaps();
        state.acls = store.loadAcls();
        return state;
    }

    bool nftContains(const std::string& text) const
    {
        return mTools->nftRuleset.find(text) != std::string::npos;
    }

    ScratchSpace mScratch;
    std::shared_ptr<FakeHostTools> mTools;
    std::shared_ptr<NiceMock<MockContainerRuntime>> mRuntime;
    std::shared_ptr<NiceMock<MockNetlink>> mNetlink;
    std::shared_ptr<Settings> mSettings;
    std::unique_ptr<NetworkPolicyManager> mManager;
};

TEST_F(NetworkPolicyManagerTest, TestPortMapRenderedAndApplied)
{
    PolicyResult result = mManager->addPortMap("web1", Protocol::Tcp, 2222, 22, "192.168.100.10");
    ASSERT_TRUE(result.ok()) << result.detail;

    EXPECT_TRUE(mTools->nftLoaded);
    EXPECT_TRUE(nftContains("iifname != \"br0\" tcp dport 2222 dnat to 192.168.100.10:22\n"));
    EXPECT_TRUE(nftContains("ip daddr 192.168.100.10 tcp dport 22 accept\n"));
    EXPECT_TRUE(nftContains("ip saddr 192.168.100.0/24 oifname \"eth0\" masquerade\n"));

    const PolicyState state = persisted();
    ASSERT_EQ(state.portMaps.size(), 1u);
    EXPECT_EQ(state.portMaps[0].containerName, "web1");
    EXPECT_EQ(state.portMaps[0].hostPort, 2222);

    // the detected WAN interface is cached
    ASSERT_TRUE(state.config.wanIface);
    EXPECT_EQ(state.config.wanIface.get(), "eth0");
}

TEST_F(NetworkPolicyManagerTest, TestPortMapAddressResolved)
{
    ASSERT_TRUE(mManager->addPortMap("web1", Protocol::Udp, 5353, 53).ok());

    const PolicyState state = mManager->getState();
    ASSERT_EQ(state.portMaps.size(), 1u);
    EXPECT_EQ(state.portMaps[0].containerIpv4, "192.168.100.10");
    EXPECT_EQ(state.portMaps[0].protocol, Protocol::Udp);
}

TEST_F(NetworkPolicyManagerTest, TestPortMapKeyIsUnique)
{
    ASSERT_TRUE(mManager->addPortMap("web1", Protocol::Tcp, 8080, 80).ok());
    ASSERT_TRUE(mManager->addPortMap("web2", Protocol::Tcp, 8080, 8000).ok());

    // same port, different protocol is a different key
    ASSERT_TRUE(mManager->addPortMap("web1", Protocol::Udp, 8080, 80).ok());

    const PolicyState state = persisted();
    ASSERT_EQ(state.portMaps.size(), 2u);
    EXPECT_EQ(state.portMaps[0].containerName, "web2");
    EXPECT_EQ(state.portMaps[0].containerIpv4, "192.168.100.20");
    EXPECT_EQ(state.portMaps[0].containerPort, 8000);

    EXPECT_FALSE(nftContains("tcp dport 8080 dnat to 192.168.100.10"));
    EXPECT_TRUE(nftContains("tcp dport 8080 dnat to 192.168.100.20:8000\n"));
}

TEST_F(NetworkPolicyManagerTest, TestValidationBoundary)
{
    ASSERT_TRUE(mManager->addPortMap("web1", Protocol::Tcp, 2222, 22).ok());
    const unsigned loads = mTools->nftLoads;

    EXPECT_EQ(mManager->addPortMap("web1", Protocol::Tcp, 70000, 22).error, PolicyError::Validation);
    EXPECT_EQ(mManager->addPortMap("web1", Protocol::Tcp, 0, 22).error, PolicyError::Validation);
    EXPECT_EQ(mManager->addPortMap("web1", Protocol::Tcp, 2223, 65536).error, PolicyError::Validation);
    EXPECT_EQ(mManager->addPortMap("web1", Protocol::Tcp, 2223, 22, "192.168.100.300").error, PolicyError::Validation);
    EXPECT_EQ(mManager->addPortMap("web1", Protocol::Tcp, 2223, 22, "2001:db8::1").error, PolicyError::Validation);
    EXPECT_EQ(mManager->addPortMap("bad name", Protocol::Tcp, 2223, 22).error, PolicyError::Validation);
    EXPECT_EQ(mManager->addAcl("web1", Protocol::Tcp, 443, "192.168.100.10").error, PolicyError::Validation);

    const PolicyState state = persisted();
    ASSERT_EQ(state.portMaps.size(), 1u);
    EXPECT_EQ(state.portMaps[0].hostPort, 2222);
    EXPECT_TRUE(state.acls.empty());

    // nothing was re-applied
    EXPECT_EQ(mTools->nftLoads, loads);
}

TEST_F(NetworkPolicyManagerTest, TestNotFound)
{
    ON_CALL(*mRuntime, containerExists("ghost")).WillByDefault(Return(false));

    EXPECT_EQ(mManager->addPortMap("ghost", Protocol::Tcp, 2222, 22).error, PolicyError::NotFound);
    EXPECT_EQ(mManager->addPortMap("ghost", Protocol::Tcp, 2222, 22, "192.168.100.30").error,
              PolicyError::NotFound);

    // exists but stopped, so no address
    EXPECT_EQ(mManager->addPortMap("stopped", Protocol::Tcp, 2222, 22).error, PolicyError::NotFound);
    EXPECT_EQ(mManager->addAcl("web2", Protocol::Tcp, 443).error, PolicyError::NotFound);

    EXPECT_EQ(mManager->removePortMap(Protocol::Tcp, 2222).error, PolicyError::NotFound);
    EXPECT_EQ(mManager->removeAcl(Protocol::Tcp, 443, "2001:db8::1").error, PolicyError::NotFound);
    EXPECT_EQ(mManager->refreshPortMaps("web1").error, PolicyError::NotFound);

    EXPECT_TRUE(persisted().portMaps.empty());
}

TEST_F(NetworkPolicyManagerTest, TestFailedApplyLeavesStateUnchanged)
{
    ASSERT_TRUE(mManager->addPortMap("web1", Protocol::Tcp, 2222, 22).ok());
    const std::string installed = mTools->nftRuleset;

    mTools->failTool(FAKE_NFT);

    PolicyResult result = mManager->addPortMap("web2", Protocol::Tcp, 8080, 80);
    EXPECT_EQ(result.error, PolicyError::ExternalTool);
    EXPECT_NE(result.detail.find("simulated failure"), std::string::npos);

    EXPECT_EQ(persisted().portMaps.size(), 1u);
    EXPECT_EQ(mTools->nftRuleset, installed);

    // the operator retry converges on the persisted state
    mTools->healTool(FAKE_NFT);
    ASSERT_TRUE(mManager->reapply().ok());
    EXPECT_EQ(mTools->nftRuleset, installed);
}

TEST_F(NetworkPolicyManagerTest, TestAclWithoutPrefix)
{
    PolicyResult result = mManager->addAcl("web1", Protocol::Tcp, 443, "2001:db8:abcd:100::10");
    ASSERT_TRUE(result.ok()) << result.detail;

    EXPECT_TRUE(mManager->getState().config.ipv6Prefix.empty());
    EXPECT_TRUE(nftContains("ip6 daddr 2001:db8:abcd:100::10 tcp dport 443 accept\n"));
    EXPECT_TRUE(nftContains("meta l4proto ipv6-icmp accept\n"));

    // the resolved address skips the link-local one
    ASSERT_TRUE(mManager->addAcl("web1", Protocol::Udp, 443).ok());
    EXPECT_EQ(persisted().acls.back().containerIpv6, "2001:db8:abcd:100::10");

    ASSERT_TRUE(mManager->removeAcl(Protocol::Tcp, 443, "2001:0db8:abcd:0100::10").ok());
    EXPECT_FALSE(nftContains("tcp dport 443 accept"));
    EXPECT_EQ(persisted().acls.size(), 1u);
}

TEST_F(NetworkPolicyManagerTest, TestSwitchBackendFlushesOutgoing)
{
    ASSERT_TRUE(mManager->setNatBackend(NatBackend::Iptables).ok());
    ASSERT_TRUE(mManager->addPortMap("web1", Protocol::Tcp, 8080, 80).ok());

    EXPECT_FALSE(mTools->nftLoaded);
    EXPECT_EQ(mTools->countRules("nat", "DNAT"), 1u);
    EXPECT_EQ(mTools->countRules("nat", "MASQUERADE"), 1u);

    mTools->commands.clear();
    PolicyResult result = mManager->setNatBackend(NatBackend::Nftables);
    ASSERT_TRUE(result.ok()) << result.detail;

    EXPECT_EQ(mTools->ownedRuleCount(), 0u);
    EXPECT_EQ(mTools->countRules("nat", "DNAT"), 0u);
    EXPECT_EQ(mTools->countRules("nat", "MASQUERADE"), 0u);
    EXPECT_TRUE(nftContains("tcp dport 8080 dnat to 192.168.100.10:80\n"));
    EXPECT_EQ(persisted().config.natBackend, NatBackend::Nftables);

    // the flush happened before the load
    auto save = std::find(mTools->commands.begin(), mTools->commands.end(), FAKE_IPTABLES_SAVE);
    auto load = std::find_if(mTools->commands.begin(), mTools->commands.end(),
                             [](const std::string& cmd)
                             {
                                 return cmd.compare(0, strlen(FAKE_NFT " -f /"), FAKE_NFT " -f /") == 0;
                             });
    ASSERT_TRUE(save != mTools->commands.end());
    ASSERT_TRUE(load != mTools->commands.end());
    EXPECT_LT(save - mTools->commands.begin(), load - mTools->commands.begin());
}

TEST_F(NetworkPolicyManagerTest, TestSwitchBackendRefusedIfFlushFails)
{
    ASSERT_TRUE(mManager->setNatBackend(NatBackend::Iptables).ok());
    ASSERT_TRUE(mManager->addPortMap("web1", Protocol::Tcp, 8080, 80).ok());
    const unsigned loads = mTools->nftLoads;

    mTools->failTool(FAKE_IPTABLES_SAVE);

    EXPECT_EQ(mManager->setNatBackend(NatBackend::Nftables).error, PolicyError::BackendConflict);

    EXPECT_EQ(persisted().config.natBackend, NatBackend::Iptables);
    EXPECT_EQ(mTools->nftLoads, loads);
    EXPECT_FALSE(mTools->nftLoaded);
    EXPECT_EQ(mTools->countRules("nat", "DNAT"), 1u);
}

TEST_F(NetworkPolicyManagerTest, TestSwitchBackendRestoresOnApplyFailure)
{
    ASSERT_TRUE(mManager->setNatBackend(NatBackend::Iptables).ok());
    ASSERT_TRUE(mManager->addPortMap("web1", Protocol::Tcp, 8080, 80).ok());
    const size_t rules = mTools->rules.size();

    mTools->failTool(FAKE_NFT);

    EXPECT_EQ(mManager->setNatBackend(NatBackend::Nftables).error, PolicyError::ExternalTool);
    EXPECT_EQ(persisted().config.natBackend, NatBackend::Iptables);
    EXPECT_EQ(mTools->rules.size(), rules);
}

TEST_F(NetworkPolicyManagerTest, TestContainerDeletedPurgesEntries)
{
    ASSERT_TRUE(mManager->addPortMap("web1", Protocol::Tcp, 8080, 80).ok());
    ASSERT_TRUE(mManager->addAcl("web1", Protocol::Tcp, 443).ok());
    ASSERT_TRUE(mManager->addPortMap("web2", Protocol::Tcp, 2222, 22).ok());

    EXPECT_TRUE(nftContains("192.168.100.10"));

    ASSERT_TRUE(mManager->onContainerDeleted("web1").ok());

    const PolicyState state = persisted();
    ASSERT_EQ(state.portMaps.size(), 1u);
    EXPECT_EQ(state.portMaps[0].containerName, "web2");
    EXPECT_TRUE(state.acls.empty());

    EXPECT_FALSE(nftContains("192.168.100.10"));
    EXPECT_FALSE(nftContains("2001:db8:abcd:100::10"));
    EXPECT_TRUE(nftContains("tcp dport 2222 dnat to 192.168.100.20:22\n"));

    // deleting again has nothing to do
    const unsigned loads = mTools->nftLoads;
    EXPECT_TRUE(mManager->onContainerDeleted("web1").ok());
    EXPECT_EQ(mTools->nftLoads, loads);
}

TEST_F(NetworkPolicyManagerTest, TestContainerDeletedWithIptables)
{
    ASSERT_TRUE(mManager->setNatBackend(NatBackend::Iptables).ok());
    ASSERT_TRUE(mManager->addPortMap("web1", Protocol::Tcp, 8080, 80).ok());
    ASSERT_TRUE(mManager->addPortMap("web2", Protocol::Tcp, 2222, 22).ok());

    ASSERT_TRUE(mManager->onContainerDeleted("web1").ok());

    EXPECT_EQ(mTools->countRules("nat", "192.168.100.10:80"), 0u);
    EXPECT_EQ(mTools->countRules("filter", "192.168.100.10/32"), 0u);
    EXPECT_EQ(mTools->countRules("nat", "192.168.100.20:22"), 1u);
}

TEST_F(NetworkPolicyManagerTest, TestRefreshPortMaps)
{
    ASSERT_TRUE(mManager->addPortMap("web1", Protocol::Tcp, 8080, 80).ok());
    ASSERT_TRUE(mManager->addPortMap("web1", Protocol::Tcp, 8443, 443).ok());

    EXPECT_CALL(*mRuntime, listAddresses("web1"))
        .WillRepeatedly(Return(std::list<std::string>{ "192.168.100.11" }));

    ASSERT_TRUE(mManager->refreshPortMaps("web1").ok());

    for (const PortMapEntry& entry : persisted().portMaps)
        EXPECT_EQ(entry.containerIpv4, "192.168.100.11");
    EXPECT_FALSE(nftContains("192.168.100.10"));
}

TEST_F(NetworkPolicyManagerTest, TestSetLan4)
{
    EXPECT_EQ(mManager->setLan4("10.20.0.0/16", "10.21.0.1").error, PolicyError::Validation);
    EXPECT_EQ(mManager->setLan4("10.20.0.0/16", "10.20.0.0").error, PolicyError::Validation);
    EXPECT_EQ(mManager->setLan4("10.20.0.0/40", "10.20.0.1").error, PolicyError::Validation);

    ASSERT_TRUE(mManager->setLan4("10.20.3.4/16", "10.20.0.1").ok());

    const NetworkConfig config = persisted().config;
    EXPECT_EQ(config.lan4Cidr, "10.20.0.0/16");
    EXPECT_EQ(config.lan4Gateway, "10.20.0.1");
    EXPECT_TRUE(nftContains("ip saddr 10.20.0.0/16 oifname \"eth0\" masquerade\n"));
}

TEST_F(NetworkPolicyManagerTest, TestSetWanInterface)
{
    ON_CALL(*mNetlink, ifaceExists("eth9")).WillByDefault(Return(false));
    EXPECT_EQ(mManager->setWanInterface("eth9").error, PolicyError::NotFound);
    EXPECT_EQ(mManager->setWanInterface("bad iface").error, PolicyError::Validation);

    ASSERT_TRUE(mManager->setWanInterface("ppp0").ok());
    EXPECT_EQ(persisted().config.wanIface.get(), "ppp0");
    EXPECT_TRUE(nftContains("oifname \"ppp0\" masquerade"));

    // back to detecting it from the default route
    ASSERT_TRUE(mManager->setWanInterface("auto").ok());
    EXPECT_EQ(persisted().config.wanIface.get(), "eth0");
}

TEST_F(NetworkPolicyManagerTest, TestNoDefaultRoute)
{
    EXPECT_CALL(*mNetlink, defaultRouteIface(AF_INET))
        .WillRepeatedly(Return(boost::optional<std::string>()));

    ASSERT_TRUE(mManager->addPortMap("web1", Protocol::Tcp, 8080, 80).ok());
    EXPECT_FALSE(nftContains("masquerade"));
    EXPECT_FALSE(persisted().config.wanIface);
}

TEST_F(NetworkPolicyManagerTest, TestSetBridge)
{
    EXPECT_EQ(mManager->setBridge("").error, PolicyError::Validation);

    ASSERT_TRUE(mManager->addPortMap("web1", Protocol::Tcp, 8080, 80).ok());
    ASSERT_TRUE(mManager->setBridge("lxcbr0").ok());

    EXPECT_EQ(persisted().config.bridge, "lxcbr0");
    EXPECT_TRUE(nftContains("iifname != \"lxcbr0\" tcp dport 8080"));
}

TEST_F(NetworkPolicyManagerTest, TestNativeTransportAndProxy)
{
    // the proxy needs a prefix
    EXPECT_EQ(mManager->setIpv6Proxy(true, "eth0").error, PolicyError::Validation);

    TransportRequest request;
    request.method = TransportMethod::Native;
    request.routedPrefix = "2001:db8:abcd:100::/64";

    PolicyResult result = mManager->configureIpv6Transport(request);
    ASSERT_TRUE(result.ok()) << result.detail;

    NetworkConfig config = persisted().config;
    EXPECT_EQ(config.ipv6Prefix, "2001:db8:abcd:100::/64");
    EXPECT_EQ(config.transport.method, TransportMethod::Native);
    EXPECT_TRUE(exists(mScratch.path() + "/network/br0.network.d/quay-ipv6.conf"));

    // the router advert is bound to the bridge
    EXPECT_EQ(mManager->setBridge("lxcbr0").error, PolicyError::Validation);

    EXPECT_CALL(*mNetlink, setProxyNdp("eth0", true)).WillRepeatedly(Return(true));
    EXPECT_CALL(*mNetlink, addProxyNeighbour("eth0", "2001:db8:abcd:100::10")).WillOnce(Return(true));

    // upstream defaults to the WAN interface
    ASSERT_TRUE(mManager->setIpv6Proxy(true, "").ok());
    EXPECT_EQ(persisted().config.ipv6ProxyUpstreamIface, "eth0");
    ASSERT_TRUE(mManager->addAcl("web1", Protocol::Tcp, 443).ok());

    // going back to none clears the prefix and turns the proxy off
    EXPECT_CALL(*mNetlink, delProxyNeighbour("eth0", "2001:db8:abcd:100::10")).WillOnce(Return(true));
    EXPECT_CALL(*mNetlink, setProxyNdp("eth0", false)).WillOnce(Return(true));

    TransportRequest none;
    ASSERT_TRUE(mManager->configureIpv6Transport(none).ok());

    config = persisted().config;
    EXPECT_TRUE(config.ipv6Prefix.empty());
    EXPECT_FALSE(config.ipv6ProxyEnabled);
    EXPECT_EQ(config.transport.method, TransportMethod::None);
    EXPECT_FALSE(exists(mScratch.path() + "/network/br0.network.d/quay-ipv6.conf"));

    // the ACL is kept
    EXPECT_EQ(persisted().acls.size(), 1u);
}

TEST_F(NetworkPolicyManagerTest, TestTransportFailureRestoresPrevious)
{
    TransportRequest native;
    native.method = TransportMethod::Native;
    native.routedPrefix = "2001:db8:abcd:100::/64";
    ASSERT_TRUE(mManager->configureIpv6Transport(native).ok());

    TransportRequest tunnel;
    tunnel.method = TransportMethod::SixInFour;
    tunnel.localV4 = "203.0.113.5";
    tunnel.serverV4 = "198.51.100.1";
    tunnel.clientV6 = "2001:db8:1::2/64";
    tunnel.serverV6 = "2001:db8:1::1";
    tunnel.routedPrefix = "2001:db8:beef::/48";

    EXPECT_CALL(*mNetlink, createSitTunnel("quay6in4", "203.0.113.5", "198.51.100.1"))
        .WillOnce(Return(false));
    EXPECT_CALL(*mNetlink, deleteLink("quay6in4")).WillOnce(Return(true));

    EXPECT_EQ(mManager->configureIpv6Transport(tunnel).error, PolicyError::ExternalTool);

    const NetworkConfig config = persisted().config;
    EXPECT_EQ(config.transport.method, TransportMethod::Native);
    EXPECT_EQ(config.ipv6Prefix, "2001:db8:abcd:100::/64");

    boost::optional<std::string> dropIn =
        readTextFile(mScratch.path() + "/network/br0.network.d/quay-ipv6.conf");
    ASSERT_TRUE(dropIn);
    EXPECT_NE(dropIn->find("Prefix=2001:db8:abcd:100::/64"), std::string::npos);
}

TEST_F(NetworkPolicyManagerTest, TestTransportValidation)
{
    TransportRequest request;
    request.method = TransportMethod::Wireguard;
    request.wgIface = "wg0";
    request.wgConfig = "garbage";
    request.routedPrefix = "2001:db8:abcd:100::/64";

    EXPECT_EQ(mManager->configureIpv6Transport(request).error, PolicyError::Validation);
    EXPECT_TRUE(mTools->commands.empty());
}

TEST_F(NetworkPolicyManagerTest, TestRenderActive)
{
    ASSERT_TRUE(mManager->addPortMap("web1", Protocol::Tcp, 8080, 80).ok());

    std::string rendered;
    ASSERT_TRUE(mManager->renderActive(&rendered).ok());
    EXPECT_EQ(rendered, mTools->nftRuleset);

    ASSERT_TRUE(mManager->setNatBackend(NatBackend::Iptables).ok());
    ASSERT_TRUE(mManager->renderActive(&rendered).ok());
    EXPECT_NE(rendered.find("-t nat -A PREROUTING ! -i br0 -p tcp -m tcp --dport 8080"), std::string::npos);
}

TEST_F(NetworkPolicyManagerTest, TestConcurrentMutationsAreSerialised)
{
    auto addRange = [this](unsigned first)
    {
        for (unsigned port = first; port < first + 20; port++)
            EXPECT_TRUE(mManager->addPortMap("web1", Protocol::Tcp, port, 80).ok());
    };

    std::thread a(addRange, 10000);
    std::thread b(addRange, 20000);
    a.join();
    b.join();

    EXPECT_EQ(persisted().portMaps.size(), 40u);
}

TEST_F(NetworkPolicyManagerTest, TestSeparateManagersShareStateLock)
{
    // each quay-netctl invocation has its own manager, only the state dir
    // lock keeps them from overwriting each other
    auto otherTools = std::make_shared<FakeHostTools>();
    NetworkPolicyManager other(mSettings, otherTools, mRuntime, mNetlink);

    auto addRange = [](NetworkPolicyManager* manager, unsigned first)
    {
        for (unsigned port = first; port < first + 30; port++)
            EXPECT_TRUE(manager->addPortMap("web1", Protocol::Tcp, port, 80).ok());
    };

    std::thread a(addRange, mManager.get(), 10000);
    std::thread b(addRange, &other, 20000);
    a.join();
    b.join();

    EXPECT_EQ(persisted().portMaps.size(), 60u);
    EXPECT_TRUE(exists(mSettings->stateDir() + "/.lock"));
}

TEST_F(NetworkPolicyManagerTest, TestFailedWireguardChangeRestoresConfig)
{
    TransportRequest request;
    request.method = TransportMethod::Wireguard;
    request.wgIface = "wg0";
    request.wgConfig = "[Interface]\nPrivateKey = OLD\n\n[Peer]\nEndpoint = 198.51.100.1:51820\n";
    request.routedPrefix = "2001:db8:abcd:100::/64";
    ASSERT_TRUE(mManager->configureIpv6Transport(request).ok());

    const std::string confPath = mScratch.path() + "/wireguard/wg0.conf";
    ASSERT_TRUE(exists(confPath));

    mTools->failTool(FAKE_NFT);

    request.wgConfig = "[Interface]\nPrivateKey = NEW\n\n[Peer]\nEndpoint = 198.51.100.2:51820\n";
    EXPECT_EQ(mManager->configureIpv6Transport(request).error, PolicyError::ExternalTool);

    const NetworkConfig config = persisted().config;
    EXPECT_EQ(config.transport.method, TransportMethod::Wireguard);
    EXPECT_EQ(config.transport.wgIface, "wg0");

    boost::optional<std::string> conf = readTextFile(confPath);
    ASSERT_TRUE(conf);
    EXPECT_NE(conf->find("PrivateKey = OLD"), std::string::npos);
    EXPECT_EQ(conf->find("NEW"), std::string::npos);

    // the tunnel was restarted with the restored config
    auto lastUnitCmd = std::find_if(mTools->commands.rbegin(), mTools->commands.rend(),
                                    [](const std::string& cmd)
                                    {
                                        return cmd.compare(0, strlen(FAKE_SYSTEMCTL), FAKE_SYSTEMCTL) == 0;
                                    });
    ASSERT_TRUE(lastUnitCmd != mTools->commands.rend());
    EXPECT_EQ(*lastUnitCmd, FAKE_SYSTEMCTL " restart wg-quick@wg0");
}

TEST_F(NetworkPolicyManagerTest, TestProxySyncFailureAfterPersistIsNotFatal)
{
    TransportRequest native;
    native.method = TransportMethod::Native;
    native.routedPrefix = "2001:db8:abcd:100::/64";
    ASSERT_TRUE(mManager->configureIpv6Transport(native).ok());
    ASSERT_TRUE(mManager->setIpv6Proxy(true, "eth0").ok());

    EXPECT_CALL(*mNetlink, addProxyNeighbour("eth0", "2001:db8:abcd:100::10"))
        .WillOnce(Return(false))
        .WillOnce(Return(true));

    // the ACL took effect even though the proxy entry wasn't published
    PolicyResult result = mManager->addAcl("web1", Protocol::Tcp, 443);
    EXPECT_TRUE(result.ok()) << result.detail;
    EXPECT_EQ(persisted().acls.size(), 1u);
    EXPECT_TRUE(nftContains("tcp dport 443 accept"));

    // and apply publishes it
    ASSERT_TRUE(mManager->reapply().ok());
}

TEST_F(NetworkPolicyManagerTest, TestReapplyOnlyFlushesIptables)
{
    ASSERT_TRUE(mManager->addPortMap("web1", Protocol::Tcp, 8080, 80).ok());
    const unsigned flushes = mTools->nftFlushes;
    const unsigned loads = mTools->nftLoads;
    const std::string installed = mTools->nftRuleset;

    ASSERT_TRUE(mManager->reapply().ok());
    EXPECT_EQ(mTools->nftFlushes, flushes);
    EXPECT_EQ(mTools->nftLoads, loads + 1);
    EXPECT_EQ(mTools->nftRuleset, installed);

    ASSERT_TRUE(mManager->setNatBackend(NatBackend::Iptables).ok());
    const size_t owned = mTools->ownedRuleCount();

    mTools->commands.clear();
    ASSERT_TRUE(mManager->reapply().ok());

    auto deleted = std::find_if(mTools->commands.begin(), mTools->commands.end(),
                                [](const std::string& cmd)
                                {
                                    return cmd.find(" -D ") != std::string::npos;
                                });
    EXPECT_TRUE(deleted != mTools->commands.end());
    EXPECT_EQ(mTools->ownedRuleCount(), owned);
}
