#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/JSONWriter.h"
#include <nlohmann/json.hpp>

namespace lanprobe {

class JSONWriterTest : public ::testing::Test {
protected:
    OpenPortResult ports;
    HostRecord hosts;

    void SetUp() override {
        ports[22] = OpenPort{22, true, "ssh", "The Secure Shell (SSH) Protocol"};
        ports[80] = OpenPort{80, true, "http", "World Wide Web HTTP"};
        ports[8000] = OpenPort{8000, false, PortRegistry::UNKNOWN, ""};

        hosts["B8:27:EB:AC:14:3E"] = {"192.168.123.4"};
        hosts["00:1A:2B:3C:4D:5E"] = {"192.168.123.1", "192.168.123.254"};
    }
};

TEST_F(JSONWriterTest, PortMapCompact) {
    JSONWriter writer;
    EXPECT_EQ(writer.write(ports), R"({"22":"ssh","80":"http","8000":"unknown"})");
}

TEST_F(JSONWriterTest, PortsInNumericOrder) {
    OpenPortResult r;
    r[1024] = OpenPort{1024, false, PortRegistry::UNKNOWN, ""};
    r[9] = OpenPort{9, true, "discard", "Discard"};
    r[100] = OpenPort{100, false, PortRegistry::UNKNOWN, ""};
    EXPECT_EQ(JSONWriter().write(r), R"({"9":"discard","100":"unknown","1024":"unknown"})");
}

TEST_F(JSONWriterTest, EmptyResults) {
    JSONWriter writer;
    EXPECT_EQ(writer.write(OpenPortResult{}), "{}");
    EXPECT_EQ(writer.write(HostRecord{}), "{}");
    EXPECT_EQ(writer.write_detailed(OpenPortResult{}), "[]");
    EXPECT_EQ(writer.write_detailed(std::vector<DiscoveredHost>{}), "[]");
}

TEST_F(JSONWriterTest, HostRecordCompact) {
    EXPECT_EQ(JSONWriter().write(hosts),
              R"({"00:1A:2B:3C:4D:5E":["192.168.123.1","192.168.123.254"],"B8:27:EB:AC:14:3E":["192.168.123.4"]})");
}

TEST_F(JSONWriterTest, DetailedPorts) {
    std::string out = JSONWriter().write_detailed(ports);
    EXPECT_THAT(out, testing::StartsWith(R"([{"port":22,"status":"open","known":true,"keyword":"ssh",)"));
    EXPECT_THAT(out, testing::HasSubstr(R"({"port":8000,"status":"open","known":false,"keyword":"","description":""})"));
}

TEST_F(JSONWriterTest, DetailedHosts) {
    std::vector<DiscoveredHost> list{{"192.168.123.4", "atomicpi.lan", "B8:27:EB:AC:14:3E", "(Raspberry Pi Foundation)"}};
    EXPECT_EQ(JSONWriter().write_detailed(list),
              R"json([{"ip":"192.168.123.4","mac":"B8:27:EB:AC:14:3E","comment":"(Raspberry Pi Foundation)"}])json");
}

TEST_F(JSONWriterTest, PrettyOutput) {
    OpenPortResult r;
    r[22] = OpenPort{22, true, "ssh", ""};
    EXPECT_EQ(JSONWriter(true).write(r), "{\n  \"22\": \"ssh\"\n}\n");

    HostRecord h; h["B8:27:EB:AC:14:3E"] = {"192.168.123.4"};
    EXPECT_EQ(JSONWriter(true).write(h), "{\n  \"B8:27:EB:AC:14:3E\": [\n    \"192.168.123.4\"\n  ]\n}\n");
}

TEST_F(JSONWriterTest, ErrorObjectIsEscaped) {
    EXPECT_EQ(JSONWriter().write_error("Unable to resolve host \"nohost\""),
              R"({"error":"Unable to resolve host \"nohost\""})");
}

TEST_F(JSONWriterTest, PortMapRoundTrip) {
    nlohmann::json parsed;
    ASSERT_NO_THROW(parsed = nlohmann::json::parse(JSONWriter(true).write(ports)));
    ASSERT_TRUE(parsed.is_object());
    std::map<uint16_t, std::string> back;
    for (auto it = parsed.begin(); it != parsed.end(); ++it) {
        ASSERT_TRUE(it.value().is_string());
        back[static_cast<uint16_t>(std::stoi(it.key()))] = it.value().get<std::string>();
    }
    EXPECT_EQ(back, PortScanner::service_names(ports));
}

TEST_F(JSONWriterTest, HostRecordRoundTrip) {
    nlohmann::json parsed = nlohmann::json::parse(JSONWriter().write(hosts));
    ASSERT_TRUE(parsed.is_object());
    HostRecord back = parsed.get<HostRecord>();
    EXPECT_EQ(back, hosts);
}

TEST_F(JSONWriterTest, DetailedRecordsParse) {
    nlohmann::json parsed = nlohmann::json::parse(JSONWriter().write_detailed(ports));
    ASSERT_TRUE(parsed.is_array());
    ASSERT_EQ(parsed.size(), 3u);
    EXPECT_EQ(parsed[0]["port"], 22);
    EXPECT_EQ(parsed[0]["status"], "open");
    EXPECT_EQ(parsed[0]["known"], true);
    EXPECT_EQ(parsed[2]["known"], false);
    EXPECT_EQ(parsed[2]["keyword"], "");
}

TEST_F(JSONWriterTest, EscapedErrorParses) {
    std::string msg = "nmap exited with status 1: \"eth9\"\tnot found\n";
    nlohmann::json parsed = nlohmann::json::parse(JSONWriter(true).write_error(msg));
    EXPECT_EQ(parsed["error"], msg);
}

} // namespace lanprobe

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
