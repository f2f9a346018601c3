#include "core/sysinfo/cim_class.hpp"

#include <gtest/gtest.h>

using namespace verinfo::sysinfo;

TEST(CimClassTest, ClassNames) {
    EXPECT_EQ(to_string(CimClass::OperatingSystem), "Win32_OperatingSystem");
    EXPECT_EQ(to_string(CimClass::ComputerSystem), "Win32_ComputerSystem");
    EXPECT_EQ(to_string(CimClass::Processor), "Win32_Processor");
}

TEST(CimClassTest, FromShortNames) {
    EXPECT_EQ(cimClassFromString("os"), CimClass::OperatingSystem);
    EXPECT_EQ(cimClassFromString("sys"), CimClass::ComputerSystem);
    EXPECT_EQ(cimClassFromString("PROC"), CimClass::Processor);
}

TEST(CimClassTest, FromFullNames) {
    EXPECT_EQ(cimClassFromString("win32_operatingsystem"), CimClass::OperatingSystem);
    EXPECT_EQ(cimClassFromString("Win32_Processor"), CimClass::Processor);
}

TEST(CimClassTest, UnknownClass) {
    EXPECT_FALSE(cimClassFromString("Win32_BIOS").has_value());
    EXPECT_FALSE(cimClassFromString("").has_value());
}

TEST(CimClassTest, ValidPropertyNames) {
    EXPECT_TRUE(isValidPropertyName("Caption"));
    EXPECT_TRUE(isValidPropertyName("NumberOfLogicalProcessors"));
    EXPECT_TRUE(isValidPropertyName("_private1"));
}

TEST(CimClassTest, InvalidPropertyNames) {
    EXPECT_FALSE(isValidPropertyName(""));
    EXPECT_FALSE(isValidPropertyName("1Caption"));
    EXPECT_FALSE(isValidPropertyName("Caption FROM Win32_Process"));
    EXPECT_FALSE(isValidPropertyName("*"));
    EXPECT_FALSE(isValidPropertyName("Name;"));
}

TEST(CimClassTest, BuildSelectQuery) {
    EXPECT_EQ(buildSelectQuery(CimClass::OperatingSystem, "Caption"),
              "SELECT Caption FROM Win32_OperatingSystem");
    EXPECT_EQ(buildSelectQuery(CimClass::Processor, "MaxClockSpeed"),
              "SELECT MaxClockSpeed FROM Win32_Processor");
}

TEST(CimClassTest, BuildSelectQueryRejectsInjection) {
    EXPECT_FALSE(buildSelectQuery(CimClass::ComputerSystem, "* FROM Win32_Process").has_value());
}
