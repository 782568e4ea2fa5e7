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
#include <LifecycleSynchronizer.h>
#include <IFirewallBackend.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using ::testing::_;
using ::testing::InSequence;
using ::testing::IsNull;
using ::testing::Return;
using ::testing::Truly;


namespace
{

class MockFirewallBackend : public IFirewallBackend
{
public:
    MOCK_METHOD(NatBackend, type, (), (const, override));
    MOCK_METHOD(std::string, render, (const PolicyState& state), (const, override));
    MOCK_METHOD(PolicyResult, apply, (const PolicyState& desired, const PolicyState* previous), (override));
    MOCK_METHOD(PolicyResult, flush, (), (override));
};

PolicyState twoContainers()
{
    PolicyState state;

    PortMapEntry portMap;
    portMap.containerName = "web1";
    portMap.hostPort = 8080;
    portMap.containerPort = 80;
    portMap.containerIpv4 = "10.0.0.10";
    state.portMaps.push_back(portMap);

    portMap.containerName = "web2";
    portMap.hostPort = 2222;
    portMap.containerPort = 22;
    portMap.containerIpv4 = "10.0.0.20";
    state.portMaps.push_back(portMap);

    Ipv6AclEntry acl;
    acl.containerName = "web1";
    acl.destPort = 443;
    acl.containerIpv6 = "2001:db8::10";
    state.acls.push_back(acl);

    return state;
}

}

TEST(TestLifecycleSynchronizer, TestPurgeContainer)
{
    PolicyState state = twoContainers();

    EXPECT_EQ(LifecycleSynchronizer::purgeContainer("web1", &state), 2u);
    ASSERT_EQ(state.portMaps.size(), 1u);
    EXPECT_EQ(state.portMaps[0].containerName, "web2");
    EXPECT_TRUE(state.acls.empty());

    EXPECT_EQ(LifecycleSynchronizer::purgeContainer("web1", &state), 0u);
    EXPECT_EQ(LifecycleSynchronizer::purgeContainer("web", &state), 0u);
    EXPECT_EQ(state.portMaps.size(), 1u);
}

TEST(TestLifecycleSynchronizer, TestSwitchFlushesBeforeApply)
{
    MockFirewallBackend outgoing;
    MockFirewallBackend incoming;
    ON_CALL(outgoing, type()).WillByDefault(Return(NatBackend::Iptables));
    ON_CALL(incoming, type()).WillByDefault(Return(NatBackend::Nftables));
    EXPECT_CALL(outgoing, type()).Times(::testing::AnyNumber());
    EXPECT_CALL(incoming, type()).Times(::testing::AnyNumber());

    const PolicyState state = twoContainers();

    {
        InSequence seq;
        EXPECT_CALL(outgoing, flush()).WillOnce(Return(PolicyResult::success()));
        EXPECT_CALL(incoming, apply(_, IsNull())).WillOnce(Return(PolicyResult::success()));
    }
    EXPECT_CALL(outgoing, apply(_, _)).Times(0);

    EXPECT_TRUE(LifecycleSynchronizer::switchBackend(&outgoing, &incoming, state, state).ok());
}

TEST(TestLifecycleSynchronizer, TestSwitchRefusedWhenFlushFails)
{
    MockFirewallBackend outgoing;
    MockFirewallBackend incoming;
    ON_CALL(outgoing, type()).WillByDefault(Return(NatBackend::Iptables));
    ON_CALL(incoming, type()).WillByDefault(Return(NatBackend::Nftables));
    EXPECT_CALL(outgoing, type()).Times(::testing::AnyNumber());
    EXPECT_CALL(incoming, type()).Times(::testing::AnyNumber());

    EXPECT_CALL(outgoing, flush())
        .WillOnce(Return(PolicyResult::failure(PolicyError::ExternalTool, "iptables-save: timed out")));
    EXPECT_CALL(incoming, apply(_, _)).Times(0);

    const PolicyResult result =
        LifecycleSynchronizer::switchBackend(&outgoing, &incoming, PolicyState(), PolicyState());
    EXPECT_EQ(result.error, PolicyError::BackendConflict);
    EXPECT_NE(result.detail.find("timed out"), std::string::npos);
}

TEST(TestLifecycleSynchronizer, TestSwitchRestoresOutgoingOnFailure)
{
    MockFirewallBackend outgoing;
    MockFirewallBackend incoming;
    ON_CALL(outgoing, type()).WillByDefault(Return(NatBackend::Nftables));
    ON_CALL(incoming, type()).WillByDefault(Return(NatBackend::Iptables));
    EXPECT_CALL(outgoing, type()).Times(::testing::AnyNumber());
    EXPECT_CALL(incoming, type()).Times(::testing::AnyNumber());

    const PolicyState previous = twoContainers();
    PolicyState next = previous;
    next.portMaps.pop_back();

    {
        InSequence seq;
        EXPECT_CALL(outgoing, flush()).WillOnce(Return(PolicyResult::success()));
        EXPECT_CALL(incoming, apply(_, IsNull()))
            .WillOnce(Return(PolicyResult::failure(PolicyError::ExternalTool, "iptables: exit code 4")));
        EXPECT_CALL(incoming, flush()).WillOnce(Return(PolicyResult::success()));
        EXPECT_CALL(outgoing, apply(Truly([](const PolicyState& state) { return state.portMaps.size() == 2; }),
                                    IsNull()))
            .WillOnce(Return(PolicyResult::success()));
    }

    EXPECT_EQ(LifecycleSynchronizer::switchBackend(&outgoing, &incoming, previous, next).error,
              PolicyError::ExternalTool);
}
