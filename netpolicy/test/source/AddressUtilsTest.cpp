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
#include <AddressUtils.h>

#include <gtest/gtest.h>

#include <arpa/inet.h>


TEST(TestAddressUtils, TestValidateAddress)
{
    EXPECT_EQ(AddressUtils::validateAddress("192.168.100.10").value(), "192.168.100.10");
    EXPECT_EQ(AddressUtils::validateAddress("2001:0db8:0000:0000:0000:0000:0000:0010").value(),
              "2001:db8::10");

    EXPECT_FALSE(AddressUtils::validateAddress(""));
    EXPECT_FALSE(AddressUtils::validateAddress("192.168.100.256"));
    EXPECT_FALSE(AddressUtils::validateAddress("192.168.100"));
    EXPECT_FALSE(AddressUtils::validateAddress(" 10.0.0.1"));
    EXPECT_FALSE(AddressUtils::validateAddress("10.0.0.1/24"));
    EXPECT_FALSE(AddressUtils::validateAddress("not-an-address"));

    // can never be a container address
    EXPECT_FALSE(AddressUtils::validateAddress("0.0.0.0"));
    EXPECT_FALSE(AddressUtils::validateAddress("224.0.0.1"));
    EXPECT_FALSE(AddressUtils::validateAddress("::"));
    EXPECT_FALSE(AddressUtils::validateAddress("ff02::1"));
}

TEST(TestAddressUtils, TestValidateAddressFamily)
{
    EXPECT_TRUE(AddressUtils::validateAddress("10.0.0.1", AF_INET));
    EXPECT_FALSE(AddressUtils::validateAddress("10.0.0.1", AF_INET6));
    EXPECT_TRUE(AddressUtils::validateAddress("fd00::1", AF_INET6));
    EXPECT_FALSE(AddressUtils::validateAddress("fd00::1", AF_INET));
}

TEST(TestAddressUtils, TestValidateCidr)
{
    boost::optional<Cidr> cidr = AddressUtils::validateCidr("192.168.100.0/24");
    ASSERT_TRUE(cidr);
    EXPECT_EQ(cidr->family, AF_INET);
    EXPECT_EQ(cidr->prefixLen, 24u);
    EXPECT_EQ(cidr->toString(), "192.168.100.0/24");

    // host bits are cleared in the network, kept in the address
    cidr = AddressUtils::validateCidr("2001:db8:abcd:100::1/64", AF_INET6);
    ASSERT_TRUE(cidr);
    EXPECT_EQ(cidr->toString(), "2001:db8:abcd:100::/64");
    EXPECT_EQ(cidr->addressWithPrefix(), "2001:db8:abcd:100::1/64");

    cidr = AddressUtils::validateCidr("10.1.2.3/12");
    ASSERT_TRUE(cidr);
    EXPECT_EQ(cidr->network, "10.0.0.0");

    EXPECT_FALSE(AddressUtils::validateCidr("192.168.100.0"));
    EXPECT_FALSE(AddressUtils::validateCidr("192.168.100.0/"));
    EXPECT_FALSE(AddressUtils::validateCidr("/24"));
    EXPECT_FALSE(AddressUtils::validateCidr("192.168.100.0/0"));
    EXPECT_FALSE(AddressUtils::validateCidr("192.168.100.0/33"));
    EXPECT_FALSE(AddressUtils::validateCidr("192.168.100.0/2x"));
    EXPECT_FALSE(AddressUtils::validateCidr("2001:db8::/129"));
    EXPECT_FALSE(AddressUtils::validateCidr("2001:db8::/64", AF_INET));
}

TEST(TestAddressUtils, TestCidrContains)
{
    const Cidr lan = AddressUtils::validateCidr("192.168.100.0/24").value();
    EXPECT_TRUE(AddressUtils::cidrContains(lan, "192.168.100.1"));
    EXPECT_TRUE(AddressUtils::cidrContains(lan, "192.168.100.255"));
    EXPECT_FALSE(AddressUtils::cidrContains(lan, "192.168.101.1"));
    EXPECT_FALSE(AddressUtils::cidrContains(lan, "fd00::1"));

    const Cidr prefix = AddressUtils::validateCidr("2001:db8:abcd:100::/56").value();
    EXPECT_TRUE(AddressUtils::cidrContains(prefix, "2001:db8:abcd:1ff::10"));
    EXPECT_FALSE(AddressUtils::cidrContains(prefix, "2001:db8:abcd:200::10"));
}

TEST(TestAddressUtils, TestLinkLocal)
{
    EXPECT_TRUE(AddressUtils::isLinkLocal("fe80::1"));
    EXPECT_TRUE(AddressUtils::isLinkLocal("169.254.10.1"));
    EXPECT_FALSE(AddressUtils::isLinkLocal("2001:db8::1"));
    EXPECT_FALSE(AddressUtils::isLinkLocal("10.0.0.1"));
    EXPECT_FALSE(AddressUtils::isLinkLocal("rubbish"));
}

TEST(TestAddressUtils, TestPorts)
{
    EXPECT_EQ(AddressUtils::validatePort(1).value(), 1);
    EXPECT_EQ(AddressUtils::validatePort(65535).value(), 65535);
    EXPECT_FALSE(AddressUtils::validatePort(0));
    EXPECT_FALSE(AddressUtils::validatePort(65536));
    EXPECT_FALSE(AddressUtils::validatePort(70000));
}

TEST(TestAddressUtils, TestNames)
{
    EXPECT_TRUE(AddressUtils::isValidIfaceName("br0"));
    EXPECT_TRUE(AddressUtils::isValidIfaceName("wg-home"));
    EXPECT_FALSE(AddressUtils::isValidIfaceName(""));
    EXPECT_FALSE(AddressUtils::isValidIfaceName("averyverylongname"));
    EXPECT_FALSE(AddressUtils::isValidIfaceName("br 0"));
    EXPECT_FALSE(AddressUtils::isValidIfaceName("br\"0"));
    EXPECT_FALSE(AddressUtils::isValidIfaceName("../eth0"));

    EXPECT_TRUE(AddressUtils::isValidContainerName("web1"));
    EXPECT_TRUE(AddressUtils::isValidContainerName("my_box.test-2"));
    EXPECT_FALSE(AddressUtils::isValidContainerName(""));
    EXPECT_FALSE(AddressUtils::isValidContainerName("-web"));
    EXPECT_FALSE(AddressUtils::isValidContainerName(".web"));
    EXPECT_FALSE(AddressUtils::isValidContainerName("web/1"));
    EXPECT_FALSE(AddressUtils::isValidContainerName(std::string(65, 'a')));
}
