#include "core/sysinfo/cim_query.hpp"
#include "core/sysinfo/environment_info.hpp"
#include "core/sysinfo/registry_info.hpp"
#include "core/sysinfo/wmi_session.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <vector>

using namespace verinfo::sysinfo;

namespace {

std::vector<uint8_t> wideBytes(const wchar_t* text, size_t length) {
    std::vector<uint8_t> bytes(length * sizeof(wchar_t));
    std::memcpy(bytes.data(), text, bytes.size());
    return bytes;
}

}  // namespace

TEST(RegistryInfoTest, FormatsStrings) {
    auto bytes = wideBytes(L"Windows 10 Pro\0", 15);
    EXPECT_EQ(formatRegistryData(REG_SZ, bytes), "Windows 10 Pro");
    EXPECT_EQ(formatRegistryData(REG_EXPAND_SZ, bytes), "Windows 10 Pro");
}

TEST(RegistryInfoTest, FormatsNumbers) {
    DWORD dword = 19045;
    std::vector<uint8_t> dword_bytes(sizeof(dword));
    std::memcpy(dword_bytes.data(), &dword, sizeof(dword));
    EXPECT_EQ(formatRegistryData(REG_DWORD, dword_bytes), "19045");

    uint64_t qword = 133'000'000'000ull;
    std::vector<uint8_t> qword_bytes(sizeof(qword));
    std::memcpy(qword_bytes.data(), &qword, sizeof(qword));
    EXPECT_EQ(formatRegistryData(REG_QWORD, qword_bytes), "133000000000");
}

TEST(RegistryInfoTest, JoinsMultiStrings) {
    auto bytes = wideBytes(L"one\0two\0three\0\0", 15);
    EXPECT_EQ(formatRegistryData(REG_MULTI_SZ, bytes), "one, two, three");
}

TEST(RegistryInfoTest, BinaryAsHex) {
    std::vector<uint8_t> bytes = {0x00, 0xAB, 0x10};
    EXPECT_EQ(formatRegistryData(REG_BINARY, bytes), "00 AB 10");
}

TEST(RegistryInfoTest, ReadsProductName) {
    auto product = getRegistryInfo("ProductName");
    EXPECT_FALSE(product.empty());
    EXPECT_NE(product, kNoData);
}

TEST(RegistryInfoTest, MissingValueIsNoData) {
    EXPECT_EQ(getRegistryInfo("VerinfoValueThatDoesNotExist"), kNoData);
}

TEST(CimQueryTest, ReadsOperatingSystemCaption) {
    auto caption = cimQueryOS("Caption");
    EXPECT_NE(caption.find("Windows"), std::string::npos);
}

TEST(CimQueryTest, ReadsProcessorCores) {
    auto cores = cimQueryProc("NumberOfLogicalProcessors");
    ASSERT_FALSE(cores.empty());
    EXPECT_GT(std::stoi(cores), 0);
}

TEST(CimQueryTest, InvalidPropertyNameIsRejected) {
    EXPECT_EQ(cimQuerySys("Name FROM Win32_Process"), to_string(WmiStage::InvalidProperty));
}

TEST(CimQueryTest, UnknownPropertyReturnsError) {
    auto result = cimQueryOS("PropertyThatDoesNotExist");
    EXPECT_FALSE(result.empty());
    EXPECT_NE(result, kNoData);
}

TEST(EnvironmentInfoTest, ReadsVariable) {
    ASSERT_EQ(_wputenv_s(L"VERINFO_TEST_VARIABLE", L"value \u00E4"), 0);
    EXPECT_EQ(getEnvironment("VERINFO_TEST_VARIABLE"), "value \xC3\xA4");
}

TEST(EnvironmentInfoTest, UnsetVariableIsEmpty) {
    EXPECT_TRUE(getEnvironment("VERINFO_VARIABLE_THAT_IS_NOT_SET").empty());
}

TEST(EnvironmentInfoTest, SpecialFoldersExist) {
    for (auto folder : {SpecialFolder::Windows, SpecialFolder::System, SpecialFolder::Temp,
                        SpecialFolder::UserProfile}) {
        auto path = getSpecialFolder(folder);
        ASSERT_FALSE(path.empty()) << to_string(folder);
        EXPECT_TRUE(std::filesystem::exists(std::filesystem::path(
            std::u8string(reinterpret_cast<const char8_t*>(path.data()), path.size()))))
            << path;
    }
}
