#include "core/errors.hpp"
#include "core/tempdir.hpp"
#include "fixtures.hpp"
#include "output/assembler.hpp"
#include "pipeline/parameter_database.hpp"

#include <gtest/gtest.h>

using namespace paramdb;

namespace
{

// A parameter file with parameters for version 1 only and datalabels for
// versions 1 and 2, served by fake mdbtools.
class ParameterDatabaseTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        const auto f = dir.path();
        input = (f / "$_parameters_HRU.par").string();
        test::writeFile(input, "access");

        test::writeFile(f / "schema.sql",
                        test::parameterDdl("Parameterlijst_V1") +
                            test::datalabelDdl("Datalabel_V1") +
                            test::datalabelDdl("Datalabel_V2"));
        test::writeFile(f / "tables.txt",
                        "Parameterlijst_V1\nDatalabel_V1\nDatalabel_V2\n"
                        "~TMPCLP42\n");
        test::writeFile(f / "Parameterlijst_V1.sql",
                        test::parameterInsert("Parameterlijst_V1", 1,
                                              "Min fan", 0, 100, 20, "%"));
        test::writeFile(f / "Datalabel_V1.sql",
                        test::datalabelInsert("Datalabel_V1", 0, "Temp",
                                              "Supply temp", "°C"));
        test::writeFile(f / "Datalabel_V2.sql",
                        test::datalabelInsert("Datalabel_V2", 1, "Airflow",
                                              "Airflow", "M3/h") +
                            test::datalabelInsert("Datalabel_V2", 0, "Temp",
                                                  "Supply temp", "°C") +
                            test::datalabelInsert("Datalabel_V2", 2, "Status",
                                                  "Status", "-"));

        const std::string s = f.string();
        cfg = defaultConfig();
        cfg.tools.schemaTool = test::writeScript(
            f, "fake-mdb-schema", "cat \"" + s + "/schema.sql\"\n");
        cfg.tools.tablesTool = test::writeScript(
            f, "fake-mdb-tables", "cat \"" + s + "/tables.txt\"\n");
        cfg.tools.exportTool = test::writeScript(
            f, "fake-mdb-export",
            "for last; do :; done\ncat \"" + s + "/$last.sql\"\n");
        cfg.tools.timeout = std::chrono::seconds(10);
    }

    core::TempDir dir;
    std::string input;
    Config cfg;
};

} // namespace

TEST_F(ParameterDatabaseTest, LoadsEveryVersion)
{
    ParameterDatabase pdb(input, cfg);
    pdb.load();

    EXPECT_EQ(pdb.versions(), (std::vector<int>{1, 2}));
    EXPECT_EQ(pdb.tables().size(), 3u);

    ASSERT_EQ(pdb.parameters(1).size(), 1u);
    EXPECT_EQ(pdb.parameters(1)[0].gb.text, "Min fan");
    // Version 2 has no parameter table of its own.
    ASSERT_EQ(pdb.parameters(2).size(), 1u);
    EXPECT_EQ(pdb.parameters(2)[0].gb.text, "Min fan");

    const auto& labels = pdb.datalabels(2);
    ASSERT_EQ(labels.size(), 3u);
    EXPECT_EQ(labels[0].index, 0);
    EXPECT_EQ(labels[1].gb.text, "Airflow");
}

TEST_F(ParameterDatabaseTest, SensorsForVersion)
{
    ParameterDatabase pdb(input, cfg);
    pdb.load();

    auto sensors = pdb.sensors(2);
    ASSERT_EQ(sensors.size(), 3u);
    EXPECT_EQ(sensors[0].deviceClass, std::optional<std::string>("temperature"));
    EXPECT_EQ(sensors[1].unitOfMeasurement, std::optional<std::string>("m³/h"));
    EXPECT_EQ(sensors[1].valueTemplate, "{{ value_json[\"Airflow (M3/h)\"] }}");
    EXPECT_FALSE(sensors[2].unitOfMeasurement);

    auto doc = output::assemble(sensors);
    ASSERT_EQ(doc.size(), 3u);
    EXPECT_EQ(doc[1]["unique_id"], "itho_432432_Airflow");
}

TEST_F(ParameterDatabaseTest, UnknownVersion)
{
    ParameterDatabase pdb(input, cfg);
    pdb.load();

    try
    {
        pdb.datalabels(7);
        FAIL() << "expected UnknownVersion";
    }
    catch (const UnknownVersion& e)
    {
        EXPECT_EQ(e.version(), 7);
        EXPECT_NE(std::string(e.what()).find("7"), std::string::npos);
    }
    EXPECT_THROW(pdb.parameters(0), UnknownVersion);
    EXPECT_THROW(pdb.sensors(3), UnknownVersion);
}

TEST_F(ParameterDatabaseTest, NothingBeforeLoad)
{
    ParameterDatabase pdb(input, cfg);
    EXPECT_TRUE(pdb.versions().empty());
    EXPECT_THROW(pdb.datalabels(1), UnknownVersion);
}

TEST_F(ParameterDatabaseTest, FindBeforeParseFails)
{
    ParameterDatabase pdb(input, cfg);
    EXPECT_THROW(pdb.findParameters(), Error);
}

TEST_F(ParameterDatabaseTest, MissingToolsFailEarly)
{
    cfg.tools.tablesTool = "paramdb-no-such-mdb-tables";
    EXPECT_THROW({ ParameterDatabase pdb(input, cfg); }, ToolUnavailable);
}
