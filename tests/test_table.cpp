#include <gtest/gtest.h>
#include "gridcsv/core.hpp"

using namespace gridcsv;
using namespace gridcsv::core;

class TableTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    Table table;
};

TEST_F(TableTest, EmptyTable) {
    EXPECT_EQ(table.rowCount(), 0u);
    EXPECT_EQ(table.columnCount(), 0u);
    EXPECT_FALSE(table.hasCurrentRow());
    EXPECT_TRUE(table.columns().empty());
}

TEST_F(TableTest, SetCellBeforeAddRowThrows) {
    EXPECT_THROW(table.setCell("Region", "Sydney"), std::out_of_range);

    // The failed call must not register the column
    EXPECT_EQ(table.columnCount(), 0u);
}

TEST_F(TableTest, ColumnsKeepFirstUseOrder) {
    table.addRow();
    table.setCell("A", 1);
    table.addRow();
    table.setCell("B", 2);
    table.addRow();
    table.setCell("A", 3);

    std::vector<std::string> expected = {"A", "B"};
    EXPECT_EQ(table.columns().names(), expected);
}

TEST_F(TableTest, ColumnsAreNotSorted) {
    table.addRow();
    table.setCell("Zebra", 1);
    table.setCell("Apple", 2);
    table.setCell("Mango", 3);

    std::vector<std::string> expected = {"Zebra", "Apple", "Mango"};
    EXPECT_EQ(table.columns().names(), expected);
}

TEST_F(TableTest, OverwriteReplacesValue) {
    table.addRow();
    table.setCell("Sales", 100);
    table.setCell("Sales", 200);

    EXPECT_EQ(table.cell(0, "Sales"), CellValue(200));
    EXPECT_EQ(table.columnCount(), 1u);
    EXPECT_EQ(table.row(0).cells.size(), 1u);
}

TEST_F(TableTest, CellsGoToCurrentRow) {
    table.addRow();
    table.setCell("Region", "Sydney");
    table.addRow();
    table.setCell("Region", "Oslo");

    EXPECT_EQ(table.cell(0, "Region"), CellValue("Sydney"));
    EXPECT_EQ(table.cell(1, "Region"), CellValue("Oslo"));
}

TEST_F(TableTest, MissingCellReadsAsNull) {
    table.addRow();
    table.setCell("A", 1);
    table.addRow();
    table.setCell("C", 2);

    EXPECT_TRUE(table.cell(0, "C").isNull());
    EXPECT_TRUE(table.cell(1, "A").isNull());
    EXPECT_TRUE(table.cell(0, "Unknown").isNull());

    // Reading does not fill the sparse row
    EXPECT_EQ(table.row(0).findCell("C"), nullptr);
}

TEST_F(TableTest, RowIndexOutOfRange) {
    table.addRow();
    EXPECT_THROW(table.row(1), std::out_of_range);
    EXPECT_THROW(table.cell(5, "A"), std::out_of_range);
}

TEST_F(TableTest, Clear) {
    table.addRow();
    table.setCell("A", 1);
    table.clear();

    EXPECT_EQ(table.rowCount(), 0u);
    EXPECT_EQ(table.columnCount(), 0u);
    EXPECT_THROW(table.setCell("A", 1), std::out_of_range);
}

TEST_F(TableTest, ColumnRegistryIndexing) {
    ColumnRegistry registry;
    EXPECT_EQ(registry.add("first"), 0u);
    EXPECT_EQ(registry.add("second"), 1u);
    EXPECT_EQ(registry.add("first"), 0u);

    EXPECT_TRUE(registry.contains("second"));
    EXPECT_FALSE(registry.contains("third"));
    EXPECT_EQ(registry.indexOf("second"), std::optional<std::size_t>(1));
    EXPECT_FALSE(registry.indexOf("third").has_value());
    EXPECT_EQ(registry.size(), 2u);

    registry.clear();
    EXPECT_TRUE(registry.empty());
    EXPECT_FALSE(registry.contains("first"));
}
