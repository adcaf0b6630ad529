#include <gtest/gtest.h>

#include "ReportFixtures.h"
#include "ReportStore.h"

#include <QDir>
#include <QTemporaryDir>

using schema::Column;
using schema::RowStatus;

TEST(ReportStore, ParsesRowsInDocumentOrder)
{
    auto const doc = fixtures::document({
        fixtures::row(1, fixtures::url(1)),
        fixtures::row(2, fixtures::url(2), "成功", {}, "100.00"),
        fixtures::row(3, fixtures::url(3), "失败", "AAC 对比失败"),
    });

    auto const r = ReportStore::parse(doc);
    ASSERT_EQ(r.rows.size(), 3u);
    EXPECT_EQ(r.rows[0].url(), fixtures::url(1));
    EXPECT_EQ(r.rows[0].status(), RowStatus::Pending);
    EXPECT_EQ(r.rows[1].status(), RowStatus::Success);
    EXPECT_EQ(r.rows[1].precision(), "100.00");
    EXPECT_EQ(r.rows[2].get(Column::Reason), "AAC 对比失败");
    EXPECT_EQ(r.lines[r.headerIndex], fixtures::kHeader);
}

TEST(ReportStore, SerializeReproducesDocumentByteForByte)
{
    auto const doc = fixtures::document({
        fixtures::row(1, fixtures::url(1), "跳过", "按规则跳过", {}, "已跳过"),
        fixtures::row(2, fixtures::url(2), "成功", {}, "99.87", "严格阈值未通过"),
        fixtures::row(3, fixtures::url(3)),
    });
    EXPECT_EQ(ReportStore::serialize(ReportStore::parse(doc)), doc);
}

TEST(ReportStore, KeepsMissingTrailingNewline)
{
    auto doc = fixtures::kHeader + "\n" + fixtures::kSeparator + "\n" + fixtures::row(1, fixtures::url(1));
    EXPECT_EQ(ReportStore::serialize(ReportStore::parse(doc)), doc);
}

TEST(ReportStore, CrlfDocumentKeepsItsLineEndings)
{
    auto const doc = "# t\r\n\r\n" + fixtures::kHeader + "\r\n" + fixtures::kSeparator + "\r\n"
        + fixtures::row(1, fixtures::url(1)) + "\r\n"
        + fixtures::row(2, fixtures::url(2), "失败", "无输出") + "\r\n"
        + "\r\nfooter\r\n";

    auto r = ReportStore::parse(doc);
    ASSERT_EQ(r.rows.size(), 2u);
    EXPECT_EQ(r.rows[0].url(), fixtures::url(1));
    EXPECT_EQ(ReportStore::serialize(r), doc);

    r.rows[0].setStatus(RowStatus::Success);
    auto const text = ReportStore::serialize(r);
    EXPECT_NE(text.find("| 1 | " + fixtures::url(1) + " | 成功 |"), std::string::npos);
    EXPECT_EQ(text.find("|\n"), std::string::npos);
}

TEST(ReportStore, DataRegionEndsAtFirstNonTableLine)
{
    auto const doc = fixtures::kHeader + "\n" + fixtures::kSeparator + "\n"
        + fixtures::row(1, fixtures::url(1)) + "\n"
        + "表格之后的说明\n"
        + "| 不是数据 | 行 |\n";

    auto const r = ReportStore::parse(doc);
    ASSERT_EQ(r.rows.size(), 1u);
    EXPECT_EQ(r.lines[r.tableEnd], "表格之后的说明");
    EXPECT_EQ(ReportStore::serialize(r), doc);
}

TEST(ReportStore, ColumnOrderIsFree)
{
    auto const doc = std::string("| 序号 | 状态 | URL | 失败原因 | Tao样本数 | FFmpeg样本数 | 样本数差异 | max_err | psnr(dB) | 精度(%) | 备注 |\n")
        + fixtures::kSeparator + "\n"
        + "| 1 | 失败 | https://x/y.aac | 无输出 |  |  |  |  |  |  |  |\n";

    auto const r = ReportStore::parse(doc);
    ASSERT_EQ(r.rows.size(), 1u);
    EXPECT_EQ(r.rows[0].url(), "https://x/y.aac");
    EXPECT_EQ(r.rows[0].status(), RowStatus::Failure);
}

TEST(ReportStore, MissingHeaderIsFormatError)
{
    try {
        ReportStore::parse("# 空报告\n\n没有表格\n");
        FAIL() << "expected ReportFormatError";
    } catch (ReportFormatError const& e) {
        EXPECT_EQ(e.kind(), ReportFormatError::Kind::MissingHeader);
    }
}

TEST(ReportStore, MissingSeparatorIsFormatError)
{
    try {
        ReportStore::parse(fixtures::kHeader + "\n" + fixtures::row(1, fixtures::url(1)) + "\n");
        FAIL() << "expected ReportFormatError";
    } catch (ReportFormatError const& e) {
        EXPECT_EQ(e.kind(), ReportFormatError::Kind::MissingSeparator);
    }
}

TEST(ReportStore, MissingColumnNamesTheColumn)
{
    auto const doc = std::string("| 序号 | URL | 状态 | 失败原因 | Tao样本数 | FFmpeg样本数 | 样本数差异 | max_err | psnr(dB) | 备注 |\n")
        + "| --- | --- | --- | --- | --- | --- | --- | --- | --- | --- |\n";
    try {
        ReportStore::parse(doc);
        FAIL() << "expected ReportFormatError";
    } catch (ReportFormatError const& e) {
        EXPECT_EQ(e.kind(), ReportFormatError::Kind::MissingColumn);
        EXPECT_EQ(e.column(), "精度(%)");
    }
}

TEST(ReportStore, SplitRowTrimsAndDropsOuterCells)
{
    auto const cells = ReportStore::splitRow("  |  a | b  |  | c |  ");
    ASSERT_EQ(cells.size(), 4u);
    EXPECT_EQ(cells[0], "a");
    EXPECT_EQ(cells[1], "b");
    EXPECT_EQ(cells[2], "");
    EXPECT_EQ(cells[3], "c");

    EXPECT_TRUE(ReportStore::splitRow("|").empty());
}

TEST(ReportStore, WriteThenLoadGivesTheSameRows)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    auto const path = fixtures::pathIn(dir, "report.md");
    fixtures::writeFile(path, fixtures::pendingDocument(3));

    ReportStore store(path);
    auto report = store.load();
    report.rows[1].setStatus(RowStatus::Failure);
    report.rows[1].set(Column::Reason, "打开输入失败");
    store.write(report);

    auto const again = store.load();
    ASSERT_EQ(again.rows.size(), 3u);
    EXPECT_EQ(again.rows[1].status(), RowStatus::Failure);
    EXPECT_EQ(again.rows[1].get(Column::Reason), "打开输入失败");
    EXPECT_EQ(again.rows[0], report.rows[0]);

    // the replacement is committed, no temporary left behind
    EXPECT_EQ(QDir(dir.path()).entryList(QDir::Files).size(), 1);
}

TEST(ReportStore, LoadMissingFileIsIoError)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    ReportStore store(fixtures::pathIn(dir, "absent.md"));
    EXPECT_THROW(store.load(), ReportIoError);
}

TEST(ReportStore, WriteIntoMissingDirectoryIsIoError)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    auto const report = ReportStore::parse(fixtures::pendingDocument(1));
    ReportStore store(fixtures::pathIn(dir, "no/such/dir/report.md"));
    EXPECT_THROW(store.write(report), ReportIoError);
}
