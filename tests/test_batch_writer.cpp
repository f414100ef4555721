// EN: Unit tests for BatchWriter: padding, flush triggers, prepend ordering, write-then-persist
// FR: Tests unitaires du BatchWriter : complétion, déclencheurs de flush, écriture en tête, écriture puis persistance

#include <gtest/gtest.h>
#include "consolidation/batch_writer.hpp"
#include "consolidation/row_fingerprint.hpp"
#include "infrastructure/logging/logger.hpp"
#include "fakes/fake_sheets_service.hpp"

#include <algorithm>
#include <filesystem>

using namespace SHC::Consolidation;
using SHC::Sheets::Row;
using SHC::Sheets::Rows;
using SHC::Testing::FakeSheetsService;

class BatchWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        SHC::Logger::getInstance().setLogLevel(SHC::LogLevel::ERROR);
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("shc_batch_writer_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);

        config_.destination_spreadsheet_id = "destination";
        config_.destination_tab_name = "Sheet1";
        config_.ledger_path = (test_dir_ / "processed_rows.json").string();
        config_.flush_every_sources = 25;
        service_.addSpreadsheet("destination");
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    static std::vector<std::string> fingerprints(const Rows& rows) {
        std::vector<std::string> result;
        for (const auto& row : rows) result.push_back(fingerprintRow(row));
        return result;
    }

    size_t readsOf(const std::string& range) const {
        const auto& reads = service_.rangesRead();
        return static_cast<size_t>(std::count(reads.begin(), reads.end(), range));
    }

    std::filesystem::path test_dir_;
    SHC::ConsolidatorConfig config_;
    FakeSheetsService service_;
};

TEST_F(BatchWriterTest, PadRowExtendsOnly) {
    EXPECT_EQ(BatchWriter::padRow(Row{"a"}, 3), (Row{"a", "", ""}));
    EXPECT_EQ(BatchWriter::padRow(Row{"a", "b", "c"}, 3), (Row{"a", "b", "c"}));
    EXPECT_EQ(BatchWriter::padRow(Row{"a", "b", "c", "d"}, 3), (Row{"a", "b", "c", "d"}));
    EXPECT_EQ(BatchWriter::padRow(Row{}, 2), (Row{"", ""}));
}

TEST_F(BatchWriterTest, HeaderCapturedOnce) {
    FingerprintLedger ledger(config_.ledger_path);
    BatchWriter writer(config_, service_, ledger);

    EXPECT_FALSE(writer.hasHeader());
    EXPECT_EQ(writer.headerWidth(), 0u);

    writer.captureHeader(Row{"Name", "Phone", "Date"});
    writer.captureHeader(Row{"Other"});

    ASSERT_TRUE(writer.hasHeader());
    EXPECT_EQ(writer.header(), (Row{"Name", "Phone", "Date", "Company Name"}));
    EXPECT_EQ(writer.headerWidth(), 3u);
}

TEST_F(BatchWriterTest, StagePadsAndLabelsRows) {
    FingerprintLedger ledger(config_.ledger_path);
    BatchWriter writer(config_, service_, ledger);
    writer.captureHeader(Row{"Name", "Phone", "Date"});

    const Rows rows = {{"Jane"}, {"John", "555", "2024-01-01"}, {"Max", "1", "2", "extra"}};
    writer.stage("src_0", rows, fingerprints(rows), "Acme");

    ASSERT_EQ(writer.pendingRows(), 3u);
    EXPECT_EQ(writer.pendingBatch()[0], (Row{"Jane", "", "", "Acme"}));
    EXPECT_EQ(writer.pendingBatch()[1], (Row{"John", "555", "2024-01-01", "Acme"}));
    EXPECT_EQ(writer.pendingBatch()[2], (Row{"Max", "1", "2", "extra", "Acme"}));
    EXPECT_TRUE(writer.isPending("src_0", fingerprintRow(Row{"Jane"})));
    EXPECT_FALSE(writer.isPending("src_1", fingerprintRow(Row{"Jane"})));
}

TEST_F(BatchWriterTest, StageRejectsMismatchedFingerprints) {
    FingerprintLedger ledger(config_.ledger_path);
    BatchWriter writer(config_, service_, ledger);
    writer.captureHeader(Row{"Name"});

    EXPECT_THROW(writer.stage("src_0", Rows{{"a"}, {"b"}}, {"only-one"}, "Acme"), std::invalid_argument);
}

TEST_F(BatchWriterTest, ShouldFlushAtThresholdOrEnd) {
    FingerprintLedger ledger(config_.ledger_path);
    BatchWriter writer(config_, service_, ledger);

    // EN: Nothing pending never flushes
    // FR: Rien en attente ne déclenche jamais de flush
    EXPECT_FALSE(writer.shouldFlush(25, 60));
    EXPECT_FALSE(writer.shouldFlush(60, 60));

    writer.captureHeader(Row{"Name"});
    writer.stage("src_0", Rows{{"a"}}, {"fa"}, "Acme");

    EXPECT_FALSE(writer.shouldFlush(1, 60));
    EXPECT_FALSE(writer.shouldFlush(24, 60));
    EXPECT_TRUE(writer.shouldFlush(25, 60));
    EXPECT_TRUE(writer.shouldFlush(50, 60));
    EXPECT_FALSE(writer.shouldFlush(59, 60));
    EXPECT_TRUE(writer.shouldFlush(60, 60));
    EXPECT_TRUE(writer.shouldFlush(3, 3));
}

TEST_F(BatchWriterTest, FlushWithNothingPending) {
    FingerprintLedger ledger(config_.ledger_path);
    BatchWriter writer(config_, service_, ledger);

    EXPECT_EQ(writer.flush(), FlushResult::NOTHING_TO_FLUSH);
    EXPECT_EQ(service_.mutations(), 0u);
    EXPECT_FALSE(std::filesystem::exists(config_.ledger_path));
}

TEST_F(BatchWriterTest, FirstFlushCreatesTabAndWritesHeader) {
    FingerprintLedger ledger(config_.ledger_path);
    BatchWriter writer(config_, service_, ledger);
    writer.captureHeader(Row{"Name", "Phone"});

    const Rows rows = {{"Jane", "1"}, {"John"}};
    writer.stage("src_0", rows, fingerprints(rows), "Acme");

    ASSERT_EQ(writer.flush(), FlushResult::SUCCESS);

    EXPECT_EQ(service_.calls(FakeSheetsService::Operation::CREATE_TAB), 1u);
    EXPECT_EQ(service_.createdGrid(), std::make_pair(size_t{1000}, size_t{26}));

    const Rows expected = {
        {"Name", "Phone", "Company Name"},
        {"Jane", "1", "Acme"},
        {"John", "", "Acme"},
    };
    EXPECT_EQ(service_.grid("destination", "Sheet1"), expected);
    EXPECT_EQ(writer.pendingRows(), 0u);

    auto reloaded = FingerprintLedger::load(config_.ledger_path);
    EXPECT_TRUE(reloaded.contains("src_0", fingerprintRow(rows[0])));
    EXPECT_TRUE(reloaded.contains("src_0", fingerprintRow(rows[1])));
}

TEST_F(BatchWriterTest, ExistingHeaderIsNeverOverwritten) {
    service_.addTab("destination", "Sheet1", 7, Rows{{"Existing", "Header"}});
    FingerprintLedger ledger(config_.ledger_path);
    BatchWriter writer(config_, service_, ledger);
    writer.captureHeader(Row{"Name"});
    writer.stage("src_0", Rows{{"Jane"}}, {"f1"}, "Acme");

    ASSERT_EQ(writer.flush(), FlushResult::SUCCESS);

    const auto& grid = service_.grid("destination", "Sheet1");
    ASSERT_EQ(grid.size(), 2u);
    EXPECT_EQ(grid[0], (Row{"Existing", "Header"}));
    EXPECT_EQ(grid[1], (Row{"Jane", "Acme"}));
    EXPECT_EQ(service_.calls(FakeSheetsService::Operation::CREATE_TAB), 0u);
}

TEST_F(BatchWriterTest, FlushPrependsBelowHeader) {
    service_.addTab("destination", "Sheet1", 7, Rows{
        {"Name", "Company Name"},
        {"Old1", "Acme"},
        {"Old2", "Acme"},
    });
    FingerprintLedger ledger(config_.ledger_path);
    BatchWriter writer(config_, service_, ledger);
    writer.captureHeader(Row{"Name"});
    writer.stage("src_0", Rows{{"New1"}, {"New2"}}, {"f1", "f2"}, "Globex");

    ASSERT_EQ(writer.flush(), FlushResult::SUCCESS);

    const Rows expected = {
        {"Name", "Company Name"},
        {"New1", "Globex"},
        {"New2", "Globex"},
        {"Old1", "Acme"},
        {"Old2", "Acme"},
    };
    EXPECT_EQ(service_.grid("destination", "Sheet1"), expected);
    EXPECT_EQ(service_.calls(FakeSheetsService::Operation::INSERT_ROWS), 1u);
    ASSERT_FALSE(service_.writes().empty());
    EXPECT_EQ(service_.writes().back().range, "'Sheet1'!A2");
}

TEST_F(BatchWriterTest, LaterBatchesLandAboveEarlierOnes) {
    FingerprintLedger ledger(config_.ledger_path);
    BatchWriter writer(config_, service_, ledger);
    writer.captureHeader(Row{"Name"});

    writer.stage("src_0", Rows{{"First"}}, {"f1"}, "Acme");
    ASSERT_EQ(writer.flush(), FlushResult::SUCCESS);
    writer.stage("src_1", Rows{{"Second"}}, {"f2"}, "Globex");
    ASSERT_EQ(writer.flush(), FlushResult::SUCCESS);

    const Rows expected = {
        {"Name", "Company Name"},
        {"Second", "Globex"},
        {"First", "Acme"},
    };
    EXPECT_EQ(service_.grid("destination", "Sheet1"), expected);

    // EN: Destination preparation happens once per writer
    // FR: La préparation de la destination n'a lieu qu'une fois par writer
    EXPECT_EQ(readsOf("'Sheet1'!A1:A1"), 1u);
    EXPECT_EQ(writer.statistics().flushes, 2u);
    EXPECT_EQ(writer.statistics().rows_written, 2u);
}

TEST_F(BatchWriterTest, DestinationFailureLeavesLedgerUntouched) {
    FingerprintLedger ledger(config_.ledger_path);
    BatchWriter writer(config_, service_, ledger);
    writer.captureHeader(Row{"Name"});
    writer.stage("src_0", Rows{{"Jane"}}, {"f1"}, "Acme");

    service_.failOn(FakeSheetsService::Operation::WRITE_RANGE);

    EXPECT_EQ(writer.flush(), FlushResult::DESTINATION_ERROR);
    EXPECT_EQ(writer.pendingRows(), 0u);
    EXPECT_FALSE(writer.isPending("src_0", "f1"));
    EXPECT_FALSE(ledger.contains("src_0", "f1"));
    EXPECT_FALSE(std::filesystem::exists(config_.ledger_path));
    EXPECT_EQ(writer.statistics().failed_flushes, 1u);
}

TEST_F(BatchWriterTest, MissingDestinationSpreadsheetIsDestinationError) {
    config_.destination_spreadsheet_id = "does-not-exist";
    FingerprintLedger ledger(config_.ledger_path);
    BatchWriter writer(config_, service_, ledger);
    writer.captureHeader(Row{"Name"});
    writer.stage("src_0", Rows{{"Jane"}}, {"f1"}, "Acme");

    EXPECT_EQ(writer.flush(), FlushResult::DESTINATION_ERROR);
    EXPECT_FALSE(ledger.contains("src_0", "f1"));
}

TEST_F(BatchWriterTest, LedgerFailureAfterWriteIsReported) {
    config_.ledger_path = (test_dir_ / "missing" / "processed_rows.json").string();
    FingerprintLedger ledger(config_.ledger_path);
    BatchWriter writer(config_, service_, ledger);
    writer.captureHeader(Row{"Name"});
    writer.stage("src_0", Rows{{"Jane"}}, {"f1"}, "Acme");

    EXPECT_EQ(writer.flush(), FlushResult::LEDGER_ERROR);
    EXPECT_EQ(service_.grid("destination", "Sheet1").size(), 2u);
    EXPECT_EQ(writer.pendingRows(), 0u);
}

TEST_F(BatchWriterTest, FlushResultNames) {
    EXPECT_EQ(flushResultToString(FlushResult::SUCCESS), "SUCCESS");
    EXPECT_EQ(flushResultToString(FlushResult::NOTHING_TO_FLUSH), "NOTHING_TO_FLUSH");
    EXPECT_EQ(flushResultToString(FlushResult::DESTINATION_ERROR), "DESTINATION_ERROR");
    EXPECT_EQ(flushResultToString(FlushResult::LEDGER_ERROR), "LEDGER_ERROR");
}
