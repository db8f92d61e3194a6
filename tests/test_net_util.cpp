#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/NetUtil.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace lanprobe {

class NetUtilTest : public ::testing::Test {
protected:
    std::string temp_dir;

    void SetUp() override {
        char template_path[] = "/tmp/lanprobe_netutil_XXXXXX";
        char* made = mkdtemp(template_path);
        ASSERT_NE(made, nullptr);
        temp_dir = made;
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir);
    }

    std::string write_route_file(const std::string& content) {
        std::string path = temp_dir + "/route";
        std::ofstream f(path);
        f << content;
        return path;
    }
};

TEST_F(NetUtilTest, ParseIpv4) {
    EXPECT_EQ(parse_ipv4("192.168.123.4").value_or(0), 0xC0A87B04u);
    EXPECT_EQ(parse_ipv4("0.0.0.0").value_or(1), 0u);
    EXPECT_EQ(parse_ipv4("255.255.255.255").value_or(0), 0xFFFFFFFFu);
    EXPECT_FALSE(parse_ipv4("256.1.1.1").has_value());
    EXPECT_FALSE(parse_ipv4("1.2.3").has_value());
    EXPECT_FALSE(parse_ipv4("1.2.3.4.5").has_value());
    EXPECT_FALSE(parse_ipv4("1.2.3.04").has_value());
    EXPECT_FALSE(parse_ipv4("a.b.c.d").has_value());
    EXPECT_FALSE(parse_ipv4("").has_value());
    EXPECT_FALSE(parse_ipv4("1.2.3.4 ").has_value());
}

TEST_F(NetUtilTest, FormatIpv4) {
    EXPECT_EQ(format_ipv4(0xC0A87B04u), "192.168.123.4");
    EXPECT_EQ(format_ipv4(0), "0.0.0.0");
}

TEST_F(NetUtilTest, HostnameValidation) {
    EXPECT_TRUE(is_valid_hostname("localhost"));
    EXPECT_TRUE(is_valid_hostname("atomicpi.lan"));
    EXPECT_TRUE(is_valid_hostname("a-b.example.com."));
    EXPECT_TRUE(is_valid_hostname("3com"));
    EXPECT_FALSE(is_valid_hostname(""));
    EXPECT_FALSE(is_valid_hostname("-sT"));
    EXPECT_FALSE(is_valid_hostname("bad-.lan"));
    EXPECT_FALSE(is_valid_hostname("two..dots"));
    EXPECT_FALSE(is_valid_hostname("under_score"));
    EXPECT_FALSE(is_valid_hostname("host name"));
    EXPECT_FALSE(is_valid_hostname(std::string(64, 'a')));
    EXPECT_FALSE(is_valid_hostname(std::string(300, 'a')));
}

TEST_F(NetUtilTest, NetworkSpecMasksHostBits) {
    auto n = parse_network_spec("192.168.123.77/24");
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n->to_string(), "192.168.123.0/24");

    auto single = parse_network_spec("10.1.2.3");
    ASSERT_TRUE(single.has_value());
    EXPECT_EQ(single->to_string(), "10.1.2.3/32");

    auto all = parse_network_spec("10.1.2.3/0");
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(all->to_string(), "0.0.0.0/0");
}

TEST_F(NetUtilTest, NetworkSpecRejectsMalformed) {
    EXPECT_FALSE(parse_network_spec("192.168.1.0/33").has_value());
    EXPECT_FALSE(parse_network_spec("192.168.1.0/").has_value());
    EXPECT_FALSE(parse_network_spec("192.168.1.0/2a").has_value());
    EXPECT_FALSE(parse_network_spec("lan.local/24").has_value());
    EXPECT_FALSE(parse_network_spec("-sS").has_value());
    EXPECT_FALSE(parse_network_spec("").has_value());
}

TEST_F(NetUtilTest, NormalizeMac) {
    EXPECT_EQ(normalize_mac("b8:27:eb:ac:14:3e").value_or(""), "B8:27:EB:AC:14:3E");
    EXPECT_EQ(normalize_mac("B8-27-EB-AC-14-3E").value_or(""), "B8:27:EB:AC:14:3E");
    EXPECT_FALSE(normalize_mac("").has_value());
    EXPECT_FALSE(normalize_mac("B8:27:EB:AC:14").has_value());
    EXPECT_FALSE(normalize_mac("B8:27:EB:AC:14:3G").has_value());
    EXPECT_FALSE(normalize_mac("B827.EBAC.143E.00").has_value());
}

TEST_F(NetUtilTest, NetmaskToPrefix) {
    EXPECT_EQ(netmask_to_prefix(0xFFFFFF00u), 24);
    EXPECT_EQ(netmask_to_prefix(0xFFFFFFFFu), 32);
    EXPECT_EQ(netmask_to_prefix(0), 0);
    EXPECT_EQ(netmask_to_prefix(0xFFFF0F00u), -1);
}

TEST_F(NetUtilTest, InterfaceNetwork) {
    InterfaceInfo info; info.name = "eth0"; info.ipv4 = "192.168.123.3"; info.prefix = 24;
    EXPECT_EQ(info.network().to_string(), "192.168.123.0/24");
}

TEST_F(NetUtilTest, DefaultRouteInterface) {
    auto path = write_route_file(
        "Iface\tDestination\tGateway \tFlags\tRefCnt\tUse\tMetric\tMask\t\tMTU\tWindow\tIRTT\n"
        "wlan0\t0001A8C0\t00000000\t0001\t0\t0\t600\t00FFFFFF\t0\t0\t0\n"
        "eth0\t00000000\t0101A8C0\t0003\t0\t0\t100\t00000000\t0\t0\t0\n");
    auto iface = default_route_interface(path);
    ASSERT_TRUE(iface.has_value());
    EXPECT_EQ(*iface, "eth0");
}

TEST_F(NetUtilTest, DefaultRouteIgnoresDownRoutes) {
    auto path = write_route_file(
        "Iface\tDestination\tGateway \tFlags\tRefCnt\tUse\tMetric\tMask\t\tMTU\tWindow\tIRTT\n"
        "eth0\t00000000\t0101A8C0\t0002\t0\t0\t100\t00000000\t0\t0\t0\n");
    EXPECT_FALSE(default_route_interface(path).has_value());
}

TEST_F(NetUtilTest, DefaultRouteMissingFile) {
    EXPECT_FALSE(default_route_interface(temp_dir + "/does-not-exist").has_value());
}

TEST_F(NetUtilTest, UnknownInterface) {
    EXPECT_FALSE(interface_info("lanprobe-no-such-if0").has_value());
    EXPECT_FALSE(interface_info("").has_value());
}

} // namespace lanprobe

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
