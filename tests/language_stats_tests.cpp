#include "core/i18n/language_stats.hpp"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "core/i18n/i18n.hpp"
#include "core/util/string_utils.hpp"
#include "test_languages.hpp"

using namespace verinfo::i18n;
using verinfo::test::makeXaml;
using verinfo::test::TempDirectory;

TEST(LanguagePercentTest, TruncatesTowardZero) {
    EXPECT_EQ(languagePercent(7, 8), 87u);  // 87.5
    EXPECT_EQ(languagePercent(2, 3), 66u);  // 66.67
    EXPECT_EQ(languagePercent(1, 3), 33u);
    EXPECT_EQ(languagePercent(199, 200), 99u);
}

TEST(LanguagePercentTest, CompleteAndOverComplete) {
    EXPECT_EQ(languagePercent(10, 10), 100u);
    EXPECT_EQ(languagePercent(11, 10), 110u);
}

TEST(LanguagePercentTest, ZeroTotalIsZero) {
    EXPECT_EQ(languagePercent(5, 0), 0u);
}

TEST(LanguagePercentTest, FormatPercent) {
    EXPECT_EQ(formatPercent(87), "87 %");
    EXPECT_EQ(formatPercent(0), "0 %");
}

TEST(CompareKeysTest, ReportsMissingAndExtraKeys) {
    auto reference = ResourceDictionary::parse(makeXaml({{"a", "1"}, {"b", "2"}, {"c", "3"}}));
    auto other = ResourceDictionary::parse(makeXaml({{"b", "x"}, {"d", "y"}}));
    ASSERT_TRUE(reference.has_value());
    ASSERT_TRUE(other.has_value());

    auto comparison = compareKeys(*reference, *other);

    std::vector<std::string> missing = {"a", "c"};
    std::vector<std::string> extra = {"d"};
    EXPECT_EQ(comparison.missing_keys, missing);
    EXPECT_EQ(comparison.extra_keys, extra);
    EXPECT_FALSE(comparison.sameKeys());
}

TEST(CompareKeysTest, SameKeysWithDifferentValues) {
    auto reference = ResourceDictionary::parse(makeXaml({{"a", "1"}, {"b", "2"}}));
    auto other = ResourceDictionary::parse(makeXaml({{"b", "zwei"}, {"a", "eins"}}));
    ASSERT_TRUE(reference.has_value());
    ASSERT_TRUE(other.has_value());

    EXPECT_TRUE(compareKeys(*reference, *other).sameKeys());
}

TEST(CompareKeysTest, KeysAreCaseSensitive) {
    auto reference = ResourceDictionary::parse(makeXaml({{"Key", "1"}}));
    auto other = ResourceDictionary::parse(makeXaml({{"key", "1"}}));
    ASSERT_TRUE(reference.has_value());
    ASSERT_TRUE(other.has_value());

    auto comparison = compareKeys(*reference, *other);

    EXPECT_EQ(comparison.missing_keys.size(), 1u);
    EXPECT_EQ(comparison.extra_keys.size(), 1u);
}

class LanguageStatsTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 8 keys in the default table
        dir_.writeTable("en-US", {
                                     {"MsgText_Error_Caption", "Error"},
                                     {"K1", "1"},
                                     {"K2", "2"},
                                     {"K3", "3"},
                                     {"K4", "4"},
                                     {"K5", "5"},
                                     {"K6", "6"},
                                     {"K7", "7"},
                                 });
        // 7 of 8
        dir_.writeTable("de-DE", {
                                     {"MsgText_Error_Caption", "Fehler"},
                                     {"K1", "1"},
                                     {"K2", "2"},
                                     {"K3", "3"},
                                     {"K4", "4"},
                                     {"K5", "5"},
                                     {"K6", "6"},
                                 });
        // 2 of 8 plus one key the default does not have
        dir_.writeTable("fr-FR", {{"K1", "1"}, {"Extra", "x"}});
        dir_.writeTable("it-IT", {});
        dir_.writeFile("Strings.nl-NL.xaml", "<ResourceDictionary><broken>");

        setMissingResourceMode(MissingResourceMode::Placeholder);
        ASSERT_TRUE(init(dir_.path(), "en-US", "en-US").has_value());
    }

    void TearDown() override { setMissingResourceMode(MissingResourceMode::Auto); }

    TempDirectory dir_{"language_stats"};
};

TEST_F(LanguageStatsTest, TotalDefaultLanguageCount) {
    EXPECT_EQ(getTotalDefaultLanguageCount(), 8u);
}

TEST_F(LanguageStatsTest, PercentOfPartialTranslation) {
    EXPECT_EQ(getLanguagePercent("de-DE"), "87 %");
    EXPECT_EQ(getLanguagePercent("fr-FR"), "25 %");
}

TEST_F(LanguageStatsTest, PercentOfDefaultCulture) {
    EXPECT_EQ(getLanguagePercent("en-US"), "100 %");
}

TEST_F(LanguageStatsTest, MissingTableReturnsErrorCaption) {
    EXPECT_EQ(getLanguagePercent("ja-JP"), "Error");
}

TEST_F(LanguageStatsTest, EmptyTableReturnsErrorCaption) {
    EXPECT_EQ(getLanguagePercent("it-IT"), "Error");
}

TEST_F(LanguageStatsTest, MalformedTableReturnsErrorCaption) {
    EXPECT_EQ(getLanguagePercent("nl-NL"), "Error");
}

TEST_F(LanguageStatsTest, ErrorCaptionIsLocalized) {
    ASSERT_TRUE(reload("de-DE").has_value());

    EXPECT_EQ(getLanguagePercent("ja-JP"), "Fehler");
}

TEST_F(LanguageStatsTest, CompareWithCurrentCulture) {
    ASSERT_TRUE(reload("de-DE").has_value());

    auto comparison = compareLanguageDictionaries();

    ASSERT_TRUE(comparison.has_value());
    std::vector<std::string> missing = {"K7"};
    EXPECT_EQ(comparison->missing_keys, missing);
    EXPECT_TRUE(comparison->extra_keys.empty());
}

TEST_F(LanguageStatsTest, CompareWithExplicitCulture) {
    auto comparison = compareLanguageDictionaries("fr-FR");

    ASSERT_TRUE(comparison.has_value());
    EXPECT_EQ(comparison->missing_keys.size(), 7u);
    std::vector<std::string> extra = {"Extra"};
    EXPECT_EQ(comparison->extra_keys, extra);
}

TEST_F(LanguageStatsTest, CompareDefaultWithItself) {
    auto comparison = compareLanguageDictionaries("en-US");

    ASSERT_TRUE(comparison.has_value());
    EXPECT_TRUE(comparison->sameKeys());
}

TEST_F(LanguageStatsTest, CompareWithMissingTable) {
    auto comparison = compareLanguageDictionaries("ja-JP");

    ASSERT_FALSE(comparison.has_value());
    EXPECT_EQ(comparison.error(), ResourceError::FileNotFound);
}

TEST_F(LanguageStatsTest, CoverageListsEveryCulture) {
    auto coverage = languageCoverage();

    ASSERT_EQ(coverage.size(), 5u);
    EXPECT_EQ(coverage[0], std::make_pair(std::string("de-DE"), std::string("87 %")));
    EXPECT_EQ(coverage[1], std::make_pair(std::string("en-US"), std::string("100 %")));
    EXPECT_EQ(coverage[2], std::make_pair(std::string("fr-FR"), std::string("25 %")));
    EXPECT_EQ(coverage[3], std::make_pair(std::string("it-IT"), std::string("Error")));
    EXPECT_EQ(coverage[4], std::make_pair(std::string("nl-NL"), std::string("Error")));
}

/// Captures "level|message" lines from the default logger
class LanguageComparisonLogTest : public LanguageStatsTest {
protected:
    void SetUp() override {
        LanguageStatsTest::SetUp();
        previous_ = spdlog::default_logger();
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_);
        sink->set_pattern("%l|%v");
        auto logger = std::make_shared<spdlog::logger>("capture", sink);
        logger->set_level(spdlog::level::info);
        spdlog::set_default_logger(logger);
    }

    void TearDown() override {
        spdlog::set_default_logger(previous_);
        LanguageStatsTest::TearDown();
    }

    std::vector<std::string> lines() const {
        std::vector<std::string> result;
        std::istringstream input(stream_.str());
        std::string line;
        while (std::getline(input, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            result.push_back(line);
        }
        return result;
    }

    std::string tablePath(std::string_view culture) const {
        return verinfo::pathToUtf8(dictionaryPath(dir_.path(), culture));
    }

    static std::string separator() { return "info|" + std::string(80, '-'); }

    std::ostringstream stream_;
    std::shared_ptr<spdlog::logger> previous_;
};

TEST_F(LanguageComparisonLogTest, MissingKeysAreLogged) {
    ASSERT_TRUE(compareLanguageDictionaries("de-DE").has_value());

    std::string en = tablePath("en-US");
    std::string de = tablePath("de-DE");
    std::vector<std::string> expected = {
        "info|Comparing " + en + " and " + de,
        separator(),
        "warning|[verinfo] " + de + " is missing the following keys",
        "warning|Key: K7    Value: \"7\"",
        separator(),
    };
    EXPECT_EQ(lines(), expected);
}

TEST_F(LanguageComparisonLogTest, ExtraKeysAreLoggedAfterMissingKeys) {
    ASSERT_TRUE(compareLanguageDictionaries("fr-FR").has_value());

    std::string en = tablePath("en-US");
    std::string fr = tablePath("fr-FR");
    std::vector<std::string> expected = {
        "info|Comparing " + en + " and " + fr,
        separator(),
        "warning|[verinfo] " + fr + " is missing the following keys",
        "warning|Key: K2    Value: \"2\"",
        "warning|Key: K3    Value: \"3\"",
        "warning|Key: K4    Value: \"4\"",
        "warning|Key: K5    Value: \"5\"",
        "warning|Key: K6    Value: \"6\"",
        "warning|Key: K7    Value: \"7\"",
        "warning|Key: MsgText_Error_Caption    Value: \"Error\"",
        separator(),
        "warning|[verinfo] " + fr + " has keys that " + en + " does not have.",
        "warning|Key: Extra    Value: \"x\"",
        separator(),
    };
    EXPECT_EQ(lines(), expected);
}

TEST_F(LanguageComparisonLogTest, SameKeysAreLoggedOnce) {
    ASSERT_TRUE(compareLanguageDictionaries("en-US").has_value());

    std::string en = tablePath("en-US");
    std::vector<std::string> expected = {
        "info|Comparing " + en + " and " + en,
        "info|" + en + " and " + en + " have the same keys",
    };
    EXPECT_EQ(lines(), expected);
}
