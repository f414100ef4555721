// EN: Unit tests for source URL parsing and tab resolution
// FR: Tests unitaires de l'analyse d'URL source et de la résolution d'onglet

#include <gtest/gtest.h>
#include "consolidation/address_resolver.hpp"
#include "infrastructure/logging/logger.hpp"
#include "fakes/fake_sheets_service.hpp"

using namespace SHC::Consolidation;
using SHC::Testing::FakeSheetsService;

class AddressResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        SHC::Logger::getInstance().setLogLevel(SHC::LogLevel::ERROR);
    }

    FakeSheetsService service_;
};

TEST_F(AddressResolverTest, ParsesCanonicalUrlWithGid) {
    auto address = parseSheetUrl("https://docs.google.com/spreadsheets/d/1AbC-d_E/edit#gid=12345");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->spreadsheet_id, "1AbC-d_E");
    EXPECT_EQ(address->tab_id, 12345);
}

TEST_F(AddressResolverTest, MissingGidDefaultsToZero) {
    auto address = parseSheetUrl("https://docs.google.com/spreadsheets/d/abc123/edit");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->spreadsheet_id, "abc123");
    EXPECT_EQ(address->tab_id, 0);
}

TEST_F(AddressResolverTest, LegacyIdParameter) {
    auto address = parseSheetUrl("https://docs.google.com/open?id=legacyId_9&gid=7");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->spreadsheet_id, "legacyId_9");
    EXPECT_EQ(address->tab_id, 7);
}

TEST_F(AddressResolverTest, CanonicalPatternWinsOverLegacy) {
    auto address = parseSheetUrl("https://docs.google.com/spreadsheets/d/canonical/edit?usp=x&id=legacy");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->spreadsheet_id, "canonical");
}

TEST_F(AddressResolverTest, NoSpreadsheetId) {
    EXPECT_FALSE(parseSheetUrl("https://example.com/calendar").has_value());
    EXPECT_FALSE(parseSheetUrl("").has_value());
}

TEST_F(AddressResolverTest, SourceKey) {
    SourceDescriptor descriptor;
    descriptor.spreadsheet_id = "abc";
    descriptor.tab_id = 42;
    EXPECT_EQ(descriptor.key(), "abc_42");
    EXPECT_EQ(SourceDescriptor::sourceKey("abc", 0), "abc_0");
}

TEST_F(AddressResolverTest, ResolvesMatchingTab) {
    service_.addTab("ss1", "Summary", 0);
    service_.addTab("ss1", "Appointments", 99);

    AddressResolver resolver(service_);
    auto source = resolver.resolve({"https://docs.google.com/spreadsheets/d/ss1/edit#gid=99", "Acme"});

    ASSERT_TRUE(source.has_value());
    EXPECT_EQ(source->tab_name, "Appointments");
    EXPECT_EQ(source->tab_id, 99);
    EXPECT_EQ(source->display_name, "Acme");
    EXPECT_EQ(source->key(), "ss1_99");
}

TEST_F(AddressResolverTest, FallsBackToFirstTab) {
    service_.addTab("ss1", "First", 5);
    service_.addTab("ss1", "Second", 6);

    AddressResolver resolver(service_);
    auto source = resolver.resolve({"https://docs.google.com/spreadsheets/d/ss1/edit#gid=404", "Acme"});

    ASSERT_TRUE(source.has_value());
    EXPECT_EQ(source->tab_name, "First");
    // EN: The identity keeps the gid from the URL
    // FR: L'identité conserve le gid de l'URL
    EXPECT_EQ(source->key(), "ss1_404");
}

TEST_F(AddressResolverTest, FailuresYieldNothing) {
    service_.addSpreadsheet("empty");
    AddressResolver resolver(service_);

    EXPECT_FALSE(resolver.resolve({"https://example.com/not-a-sheet", "A"}).has_value());
    EXPECT_FALSE(resolver.resolve({"https://docs.google.com/spreadsheets/d/unknown/edit", "B"}).has_value());
    EXPECT_FALSE(resolver.resolve({"https://docs.google.com/spreadsheets/d/empty/edit", "C"}).has_value());

    service_.addTab("ss1", "Tab", 0);
    service_.failOn(FakeSheetsService::Operation::FETCH_TABS, "ss1");
    EXPECT_FALSE(resolver.resolve({"https://docs.google.com/spreadsheets/d/ss1/edit", "D"}).has_value());
}
