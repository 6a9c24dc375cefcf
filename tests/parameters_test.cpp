#include "integration_errors.hpp"
#include "parameters.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <limits>
#include <string>

// Test fixture for parameter sets and parameter files
class ParametersTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Use /tmp directory for test outputs
        test_output_dir = "/tmp/parameters_test_outputs";
        std::filesystem::create_directories(test_output_dir);
    }

    void TearDown() override {
        try {
            std::filesystem::remove_all(test_output_dir);
        } catch (const std::filesystem::filesystem_error &e) {
            std::cerr << "Warning: Could not remove test directory: " << e.what() << std::endl;
        }
    }

    std::string writeFile(const std::string &name, const std::string &contents) {
        std::string path = test_output_dir + "/" + name;
        std::ofstream out(path);
        out << contents;
        return path;
    }

    std::string test_output_dir;
};

// ============================================================================
// PARAMETER SET
// ============================================================================

TEST_F(ParametersTest, SetAndGet) {
    Parameters p{{"c1", 2.0}, {"T_ambient", 290.0}};

    EXPECT_EQ(p.size(), 2u);
    EXPECT_DOUBLE_EQ(p.get("c1"), 2.0);
    EXPECT_TRUE(p.contains("T_ambient"));
    EXPECT_FALSE(p.contains("c2"));

    p.set("c1", 3.0);
    EXPECT_DOUBLE_EQ(p.get("c1"), 3.0);
}

TEST_F(ParametersTest, MissingNameIsConfigurationError) {
    Parameters p{{"c1", 2.0}};
    try {
        (void)p.get("c4");
        FAIL() << "Expected ConfigurationError";
    } catch (const ConfigurationError &e) {
        EXPECT_NE(std::string(e.what()).find("c4"), std::string::npos);
    }
}

TEST_F(ParametersTest, RejectsNonFiniteOrUnnamedValues) {
    Parameters p;
    EXPECT_THROW(p.set("c1", std::numeric_limits<double>::quiet_NaN()), ConfigurationError);
    EXPECT_THROW(p.set("c1", std::numeric_limits<double>::infinity()), ConfigurationError);
    EXPECT_THROW(p.set("", 1.0), ConfigurationError);
    EXPECT_TRUE(p.empty());
}

TEST_F(ParametersTest, RequireListsEveryMissingName) {
    Parameters p{{"c1", 2.0}};
    EXPECT_NO_THROW(p.require({"c1"}));

    try {
        p.require({"c1", "c2", "c3"});
        FAIL() << "Expected ConfigurationError";
    } catch (const ConfigurationError &e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("c2"), std::string::npos);
        EXPECT_NE(msg.find("c3"), std::string::npos);
        EXPECT_EQ(msg.find("c1"), std::string::npos);
    }
}

TEST_F(ParametersTest, MergeOverridesAndAdds) {
    Parameters base{{"c1", 2.0}, {"c2", 0.05}};
    Parameters overrides{{"c2", 0.1}, {"c6", 1.0}};

    base.merge(overrides);

    EXPECT_EQ(base.size(), 3u);
    EXPECT_DOUBLE_EQ(base.get("c1"), 2.0);
    EXPECT_DOUBLE_EQ(base.get("c2"), 0.1);
    EXPECT_DOUBLE_EQ(base.get("c6"), 1.0);
}

TEST_F(ParametersTest, NamesAreSorted) {
    Parameters p{{"c2", 1.0}, {"T_ambient", 290.0}, {"c1", 2.0}};
    EXPECT_EQ(p.names(), (std::vector<std::string>{"T_ambient", "c1", "c2"}));
}

// ============================================================================
// PARAMETER FILE
// ============================================================================

TEST_F(ParametersTest, ReadsFileWithCommentsAndBlankLines) {
    std::string path = writeFile("pv.csv",
                                 "# PV cell overrides\n"
                                 "Name , Value\n"
                                 "\n"
                                 "T_ambient, 295\n"
                                 "# coupling\n"
                                 "c6,1.5e-1\n");

    Parameters p = read_parameter_file(path);

    EXPECT_EQ(p.size(), 2u);
    EXPECT_DOUBLE_EQ(p.get("T_ambient"), 295.0);
    EXPECT_DOUBLE_EQ(p.get("c6"), 0.15);
}

TEST_F(ParametersTest, HeaderColumnsInAnyOrder) {
    std::string path = writeFile("swapped.csv", "value,parameter,unit\n2.0,c1,K/s\n");
    Parameters p = read_parameter_file(path);
    EXPECT_DOUBLE_EQ(p.get("c1"), 2.0);
}

TEST_F(ParametersTest, MissingFileIsConfigurationError) {
    EXPECT_THROW(read_parameter_file(test_output_dir + "/does_not_exist.csv"),
                 ConfigurationError);
}

TEST_F(ParametersTest, MalformedFilesAreRejected) {
    EXPECT_THROW(read_parameter_file(writeFile("empty.csv", "# nothing\n\n")),
                 ConfigurationError);
    EXPECT_THROW(read_parameter_file(writeFile("header.csv", "foo,bar\nc1,2\n")),
                 ConfigurationError);
    EXPECT_THROW(read_parameter_file(writeFile("value.csv", "name,value\nc1,abc\n")),
                 ConfigurationError);
    EXPECT_THROW(read_parameter_file(writeFile("trailing.csv", "name,value\nc1,2.0K\n")),
                 ConfigurationError);
    EXPECT_THROW(read_parameter_file(writeFile("short.csv", "name,value\nc1\n")),
                 ConfigurationError);
    EXPECT_THROW(read_parameter_file(writeFile("dup.csv", "name,value\nc1,2\nc1,3\n")),
                 ConfigurationError);
    EXPECT_THROW(read_parameter_file(writeFile("nan.csv", "name,value\nc1,nan\n")),
                 ConfigurationError);
}
