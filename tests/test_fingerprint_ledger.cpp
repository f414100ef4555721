// EN: Unit tests for the persisted fingerprint ledger
// FR: Tests unitaires du registre d'empreintes persisté

#include <gtest/gtest.h>
#include "consolidation/fingerprint_ledger.hpp"
#include "infrastructure/logging/logger.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

#include <nlohmann/json.hpp>

using namespace SHC::Consolidation;

class FingerprintLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        SHC::Logger::getInstance().setLogLevel(SHC::LogLevel::ERROR);
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("shc_ledger_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        ledger_path_ = (test_dir_ / "processed_rows.json").string();
    }

    void TearDown() override {
        SHC::Logger::getInstance().resetOutput();
        std::filesystem::remove_all(test_dir_);
    }

    void writeFile(const std::string& content) {
        std::ofstream out(ledger_path_);
        out << content;
    }

    std::string readFile(const std::string& filename) {
        std::ifstream file(filename);
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    std::filesystem::path test_dir_;
    std::string ledger_path_;
};

TEST_F(FingerprintLedgerTest, MissingFileStartsEmpty) {
    auto ledger = FingerprintLedger::load(ledger_path_);
    EXPECT_EQ(ledger.sourceCount(), 0u);
    EXPECT_FALSE(ledger.contains("ss_0", "abc"));
    EXPECT_FALSE(std::filesystem::exists(ledger_path_));
}

TEST_F(FingerprintLedgerTest, CorruptOrEmptyFileStartsEmpty) {
    writeFile("{ not json");
    EXPECT_EQ(FingerprintLedger::load(ledger_path_).sourceCount(), 0u);

    writeFile("");
    EXPECT_EQ(FingerprintLedger::load(ledger_path_).sourceCount(), 0u);

    writeFile("[\"a\", \"b\"]");
    EXPECT_EQ(FingerprintLedger::load(ledger_path_).sourceCount(), 0u);
}

TEST_F(FingerprintLedgerTest, WrongShapeEntriesAreSkipped) {
    writeFile(R"({"good_0": ["f1", 7, "f2"], "bad_0": "f3", "empty_1": []})");

    auto ledger = FingerprintLedger::load(ledger_path_);
    EXPECT_TRUE(ledger.contains("good_0", "f1"));
    EXPECT_TRUE(ledger.contains("good_0", "f2"));
    EXPECT_EQ(ledger.fingerprintCount("good_0"), 2u);
    EXPECT_FALSE(ledger.hasSource("bad_0"));
    EXPECT_TRUE(ledger.hasSource("empty_1"));
}

TEST_F(FingerprintLedgerTest, NonStringFingerprintsAreLogged) {
    const std::string log_path = (test_dir_ / "ledger.ndjson").string();
    auto& logger = SHC::Logger::getInstance();
    ASSERT_TRUE(logger.setOutputFile(log_path));
    logger.setLogLevel(SHC::LogLevel::WARN);
    writeFile(R"({"good_0": ["f1", 7, null, "f2"]})");

    auto ledger = FingerprintLedger::load(ledger_path_);
    logger.resetOutput();
    EXPECT_EQ(ledger.fingerprintCount("good_0"), 2u);

    std::ifstream file(log_path);
    std::string line;
    bool reported = false;
    while (std::getline(file, line)) {
        const auto entry = nlohmann::json::parse(line);
        if (entry["level"] == "WARN" && entry.value("source", "") == "good_0") {
            EXPECT_EQ(entry["dropped"], "2");
            reported = true;
        }
    }
    EXPECT_TRUE(reported);
}

TEST_F(FingerprintLedgerTest, CommitPersistsAtomically) {
    {
        FingerprintLedger ledger(ledger_path_);
        ASSERT_TRUE(ledger.commit("ss_0", {"f1", "f2", "f1"}));
        EXPECT_EQ(ledger.fingerprintCount("ss_0"), 2u);
    }

    EXPECT_FALSE(std::filesystem::exists(ledger_path_ + ".tmp"));

    auto reloaded = FingerprintLedger::load(ledger_path_);
    EXPECT_TRUE(reloaded.contains("ss_0", "f1"));
    EXPECT_TRUE(reloaded.contains("ss_0", "f2"));
    EXPECT_FALSE(reloaded.contains("ss_1", "f1"));
}

TEST_F(FingerprintLedgerTest, FileFormatIsIndentedObjectOfArrays) {
    FingerprintLedger ledger(ledger_path_);
    ASSERT_TRUE(ledger.commit(PendingFingerprints{{"b_2", {"y"}}, {"a_1", {"x", "z"}}}));

    const std::string content = readFile(ledger_path_);
    EXPECT_NE(content.find("\n  \"a_1\": [\n    \"x\",\n    \"z\"\n  ]"), std::string::npos) << content;

    const auto document = nlohmann::json::parse(content);
    ASSERT_TRUE(document.is_object());
    EXPECT_EQ(document["a_1"], nlohmann::json::array({"x", "z"}));
    EXPECT_EQ(document["b_2"], nlohmann::json::array({"y"}));
}

TEST_F(FingerprintLedgerTest, RegisteredSourcePersistsAsEmptyList) {
    FingerprintLedger ledger(ledger_path_);
    ledger.registerSource("quiet_0");
    ASSERT_TRUE(ledger.commit("busy_0", {"f"}));

    const auto document = nlohmann::json::parse(readFile(ledger_path_));
    ASSERT_TRUE(document.contains("quiet_0"));
    EXPECT_TRUE(document["quiet_0"].empty());
}

TEST_F(FingerprintLedgerTest, CommitMergesWithExistingEntries) {
    writeFile(R"({"ss_0": ["old"]})");

    auto ledger = FingerprintLedger::load(ledger_path_);
    ASSERT_TRUE(ledger.commit("ss_0", {"new"}));

    auto reloaded = FingerprintLedger::load(ledger_path_);
    EXPECT_TRUE(reloaded.contains("ss_0", "old"));
    EXPECT_TRUE(reloaded.contains("ss_0", "new"));
}

TEST_F(FingerprintLedgerTest, PersistenceFailureKeepsMemoryAndReportsFalse) {
    FingerprintLedger ledger((test_dir_ / "missing" / "ledger.json").string());
    EXPECT_FALSE(ledger.commit("ss_0", {"f1"}));
    EXPECT_TRUE(ledger.contains("ss_0", "f1"));
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "missing"));
}
