#include "core/i18n/i18n.hpp"

#include <gtest/gtest.h>

#include "core/i18n/locale_detector.hpp"
#include "core/util/debugger.hpp"
#include "test_languages.hpp"

using namespace verinfo::i18n;
using verinfo::test::TempDirectory;

class I18nTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_.writeTable("en-US", {
                                     {"MsgText_Error_Caption", "Error"},
                                     {"OsInfo_Title", "Operating system"},
                                     {"HardwareInfo_UptimeString", "{0} days, {1} hours, {2} minutes"},
                                     {"Broken_Pattern", "{0 oops"},
                                     {"Typed_Pattern", "{0,number} days"},
                                 });
        dir_.writeTable("de-DE", {
                                     {"MsgText_Error_Caption", "Fehler"},
                                     {"HardwareInfo_UptimeString", "{0} Tage, {1} Stunden, {2} Minuten"},
                                 });
        setMissingResourceMode(MissingResourceMode::Placeholder);
    }

    void TearDown() override { setMissingResourceMode(MissingResourceMode::Auto); }

    TempDirectory dir_{"i18n"};
};

TEST_F(I18nTest, InitWithDefaultCulture) {
    ASSERT_TRUE(init(dir_.path(), "en-US", "en-US").has_value());

    EXPECT_EQ(currentCulture(), "en-US");
    EXPECT_EQ(defaultCulture(), "en-US");
    EXPECT_EQ(languagesDirectory(), dir_.path());
    EXPECT_EQ(getStringResource("OsInfo_Title"), "Operating system");
}

TEST_F(I18nTest, CultureTableOverridesDefault) {
    ASSERT_TRUE(init(dir_.path(), "de-DE", "en-US").has_value());

    EXPECT_EQ(currentCulture(), "de-DE");
    EXPECT_EQ(getStringResource("MsgText_Error_Caption"), "Fehler");
}

TEST_F(I18nTest, MissingTranslationFallsBackToDefault) {
    ASSERT_TRUE(init(dir_.path(), "de-DE", "en-US").has_value());

    EXPECT_EQ(getStringResource("OsInfo_Title"), "Operating system");
}

TEST_F(I18nTest, SameLanguageOtherRegionIsUsed) {
    ASSERT_TRUE(init(dir_.path(), "de-AT", "en-US").has_value());

    EXPECT_EQ(currentCulture(), "de-DE");
}

TEST_F(I18nTest, UnknownCultureUsesDefault) {
    ASSERT_TRUE(init(dir_.path(), "ja-JP", "en-US").has_value());

    EXPECT_EQ(currentCulture(), "en-US");
}

TEST_F(I18nTest, InitFailsWithoutDefaultTable) {
    TempDirectory empty("i18n_empty");

    auto result = init(empty.path(), "en-US", "en-US");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), I18nError::StringTableNotFound);
}

TEST_F(I18nTest, InitFailsWithInvalidDefaultTable) {
    TempDirectory broken("i18n_broken");
    broken.writeFile("Strings.en-US.xaml", "<ResourceDictionary><unclosed>");

    auto result = init(broken.path(), "en-US", "en-US");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), I18nError::StringTableInvalid);
}

TEST_F(I18nTest, ReloadSwitchesCulture) {
    ASSERT_TRUE(init(dir_.path(), "en-US", "en-US").has_value());
    ASSERT_TRUE(reload("de-DE").has_value());

    EXPECT_EQ(currentCulture(), "de-DE");
    EXPECT_EQ(compositeResource("HardwareInfo_UptimeString").format({"1", "2", "3"}),
              "1 Tage, 2 Stunden, 3 Minuten");
}

TEST_F(I18nTest, MissingKeyReturnsPlaceholder) {
    ASSERT_TRUE(init(dir_.path(), "en-US", "en-US").has_value());

    EXPECT_EQ(getStringResource("Does_Not_Exist"), "Resource not found: Does_Not_Exist");
}

TEST_F(I18nTest, MissingKeyInAutoModeWithoutDebuggerReturnsPlaceholder) {
    if (verinfo::isDebuggerAttached()) {
        GTEST_SKIP() << "Auto mode throws while a debugger is attached";
    }
    ASSERT_TRUE(init(dir_.path(), "en-US", "en-US").has_value());
    setMissingResourceMode(MissingResourceMode::Auto);

    EXPECT_EQ(getStringResource("Does_Not_Exist"), "Resource not found: Does_Not_Exist");
}

TEST_F(I18nTest, MissingKeyThrowsInThrowMode) {
    ASSERT_TRUE(init(dir_.path(), "en-US", "en-US").has_value());
    setMissingResourceMode(MissingResourceMode::Throw);

    try {
        (void)getStringResource("Does_Not_Exist");
        FAIL() << "expected ResourceNotFound";
    } catch (const ResourceNotFound& ex) {
        EXPECT_EQ(ex.key(), "Does_Not_Exist");
        EXPECT_STREQ(ex.what(), "Resource not found: Does_Not_Exist");
    }
}

TEST_F(I18nTest, FindStringResourceDoesNotThrow) {
    ASSERT_TRUE(init(dir_.path(), "en-US", "en-US").has_value());
    setMissingResourceMode(MissingResourceMode::Throw);

    EXPECT_FALSE(findStringResource("Does_Not_Exist").has_value());
    EXPECT_EQ(findStringResource("OsInfo_Title"), "Operating system");
}

TEST_F(I18nTest, CompositeResourceFormats) {
    ASSERT_TRUE(init(dir_.path(), "en-US", "en-US").has_value());

    auto format = compositeResource("HardwareInfo_UptimeString");

    EXPECT_EQ(format.argumentCount(), 3u);
    EXPECT_EQ(format.format({"0", "5", "42"}), "0 days, 5 hours, 42 minutes");
}

TEST_F(I18nTest, CompositeResourceWithBadPattern) {
    ASSERT_TRUE(init(dir_.path(), "en-US", "en-US").has_value());

    auto format = compositeResource("Broken_Pattern");

    EXPECT_EQ(format.pattern(), "Error creating composite format for key: Broken_Pattern");
}

TEST_F(I18nTest, CompositeResourceWithTypedArgument) {
    ASSERT_TRUE(init(dir_.path(), "en-US", "en-US").has_value());

    auto format = compositeResource("Typed_Pattern");

    EXPECT_EQ(format.argumentCount(), 0u);
    EXPECT_EQ(format.pattern(), "Error creating composite format for key: Typed_Pattern");
}

TEST_F(I18nTest, CompositeResourceForMissingKeyInThrowMode) {
    ASSERT_TRUE(init(dir_.path(), "en-US", "en-US").has_value());
    setMissingResourceMode(MissingResourceMode::Throw);

    auto format = compositeResource("Does_Not_Exist");

    EXPECT_EQ(format.pattern(), "Error creating composite format for key: Does_Not_Exist");
}

TEST(DebuggerTest, NotAttachedWhenRunByTestDriver) {
    EXPECT_FALSE(verinfo::isDebuggerAttached());
}

TEST(LocaleDetectorTest, LanguageSubtag) {
    EXPECT_EQ(languageSubtag("pt-BR"), "pt");
    EXPECT_EQ(languageSubtag("de_DE"), "de");
    EXPECT_EQ(languageSubtag("fr"), "fr");
}

TEST(LocaleDetectorTest, DetectedCultureIsNotEmpty) {
    EXPECT_FALSE(detectSystemCulture().empty());
}
