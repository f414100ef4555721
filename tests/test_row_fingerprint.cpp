// EN: Unit tests for row fingerprints (SHA-256 over concatenated cells)
// FR: Tests unitaires des empreintes de ligne (SHA-256 sur les cellules concaténées)

#include <gtest/gtest.h>
#include "consolidation/row_fingerprint.hpp"

using namespace SHC::Consolidation;
using SHC::Sheets::Row;

TEST(RowFingerprintTest, KnownDigest) {
    EXPECT_EQ(sha256Hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha256Hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(RowFingerprintTest, CellsAreConcatenatedWithoutSeparator) {
    EXPECT_EQ(fingerprintRow(Row{"a", "bc"}), sha256Hex("abc"));
    EXPECT_EQ(fingerprintRow(Row{}), sha256Hex(""));

    // EN: Known collision kept for compatibility with existing ledgers
    // FR: Collision connue conservée pour la compatibilité avec les registres existants
    EXPECT_EQ(fingerprintRow(Row{"ab", ""}), fingerprintRow(Row{"a", "b"}));
}

TEST(RowFingerprintTest, DeterministicAndLowercaseHex) {
    const Row row{"2024-05-01", "Jane Doe", "jane@example.com", "Booked"};
    const auto first = fingerprintRow(row);
    const auto second = fingerprintRow(Row(row));

    EXPECT_EQ(first, second);
    ASSERT_EQ(first.size(), 64u);
    for (char c : first) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << c;
    }
}

TEST(RowFingerprintTest, DifferentRowsDiffer) {
    EXPECT_NE(fingerprintRow(Row{"Jane", "Booked"}), fingerprintRow(Row{"Jane", "Cancelled"}));
    EXPECT_NE(fingerprintRow(Row{"x"}), fingerprintRow(Row{"X"}));
}

TEST(RowFingerprintTest, Utf8CellsHashAsBytes) {
    EXPECT_EQ(fingerprintRow(Row{"Société", "Zoë"}), sha256Hex("SociétéZoë"));
}
