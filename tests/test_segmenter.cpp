#include <gtest/gtest.h>
#include <payslip_pdf/segmenter.h>
#include <payslip_pdf/errors.h>

using payslip_pdf::Segmenter;

TEST(SegmenterTest, SplitsOnDelimiterAndDropsTrailingPiece) {
    auto records = Segmenter::segment("\nA\n\n\n1B\n\n\n1TRAILER");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].text, "\nA");
    EXPECT_EQ(records[1].text, "B");
}

TEST(SegmenterTest, RecordCountEqualsDelimiterCount) {
    std::string text = "\n";
    for (int i = 0; i < 7; ++i) {
        text += "PAYSLIP " + std::to_string(i) + "\n\n\n1";
    }
    text += "\n";

    EXPECT_EQ(Segmenter::count_delimiters(text), 7u);
    EXPECT_EQ(Segmenter::segment(text).size(), 7u);
}

TEST(SegmenterTest, KeepsOrderAndIndex) {
    auto records = Segmenter::segment("R0\n\n\n1R1\n\n\n1R2\n\n\n1");

    ASSERT_EQ(records.size(), 3u);
    for (size_t i = 0; i < records.size(); ++i) {
        EXPECT_EQ(records[i].index, i);
        EXPECT_EQ(records[i].text, "R" + std::to_string(i));
    }
}

TEST(SegmenterTest, EmptyPiecesAreRecords) {
    auto records = Segmenter::segment("\n\n\n1\n\n\n1X\n\n\n1");

    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].text, "");
    EXPECT_EQ(records[1].text, "");
    EXPECT_EQ(records[2].text, "X");
}

TEST(SegmenterTest, TrailingContentIsNotValidated) {
    auto records = Segmenter::segment("ONLY\n\n\n1this looks like a payslip but is dropped");

    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].text, "ONLY");
}

TEST(SegmenterTest, DelimiterNeedsExactlyThreeNewlines) {
    EXPECT_THROW(Segmenter::segment("A\n\n1B\n\n1"), payslip_pdf::NoRecordsFoundError);

    // four newlines contain the delimiter, the extra one stays in the record
    auto records = Segmenter::segment("A\n\n\n\n1B");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].text, "A\n");
}

TEST(SegmenterTest, NoDelimiterMeansNoRecords) {
    EXPECT_THROW(Segmenter::segment("\njust some text\n"), payslip_pdf::NoRecordsFoundError);
    EXPECT_THROW(Segmenter::segment(""), payslip_pdf::NoRecordsFoundError);
    EXPECT_EQ(Segmenter::count_delimiters("\njust some text\n"), 0u);
}
