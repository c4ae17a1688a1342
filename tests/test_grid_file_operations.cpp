// Google Test for read_grid_from_file / write_grid_to_file
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

#include "grid.hpp"
#include "grid_file_operations.hpp"

class GridFileTest : public ::testing::Test {
protected:
    std::string path_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = ::testing::TempDir() + "grid_" + info->name() + ".state";
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    void write_raw(const std::string& content) {
        std::ofstream out(path_);
        out << content;
    }
};

TEST_F(GridFileTest, WriteThenRead) {
    Grid g({{2, 1, 7}, {8, 0, 6}, {3, 4, 5}});
    write_grid_to_file(g, path_);
    EXPECT_EQ(read_grid_from_file(path_), g);
}

TEST_F(GridFileTest, WrittenLayout) {
    write_grid_to_file(Grid(), path_);
    std::ifstream in(path_);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "3\n1 2 3\n4 5 6\n7 8 0\n");
}

TEST_F(GridFileTest, ReadsSingleLine) {
    write_raw("3 2 3 4 7 0 1 8 5 6");
    EXPECT_EQ(read_grid_from_file(path_), Grid({{2, 3, 4}, {7, 0, 1}, {8, 5, 6}}));
}

TEST_F(GridFileTest, MissingFileThrows) {
    EXPECT_THROW(read_grid_from_file(path_ + ".missing"), std::runtime_error);
}

TEST_F(GridFileTest, WrongSideLengthThrows) {
    write_raw("4\n1 2 3 4\n5 6 7 8\n9 10 11 12\n13 14 15 0\n");
    EXPECT_THROW(read_grid_from_file(path_), InvalidGridError);
}

TEST_F(GridFileTest, TruncatedContentThrows) {
    write_raw("3\n1 2 3\n4 5 6\n7 8\n");
    EXPECT_THROW(read_grid_from_file(path_), InvalidGridError);
}

TEST_F(GridFileTest, InvalidValuesThrow) {
    write_raw("3\n1 2 3\n4 5 6\n7 8 8\n");
    EXPECT_THROW(read_grid_from_file(path_), InvalidGridError);
}
