#include "catalog/loader.hpp"
#include "core/errors.hpp"
#include "fixtures.hpp"

#include <gtest/gtest.h>

using namespace paramdb;

namespace
{

class LoaderTest : public ::testing::Test
{
  protected:
    void parameters(const std::string& table, const std::string& rows)
    {
        db.applyScript(test::parameterDdl(table) + rows, table);
        tables.push_back(table);
    }

    void datalabels(const std::string& table, const std::string& rows)
    {
        db.applyScript(test::datalabelDdl(table) + rows, table);
        tables.push_back(table);
    }

    catalog::CatalogLoader loader(catalog::LoaderOptions opts = {}) const
    {
        return catalog::CatalogLoader(db, tables, opts);
    }

    store::Store db;
    std::vector<std::string> tables;
};

} // namespace

TEST_F(LoaderTest, ParametersOrderedByIndexWithEveryColumn)
{
    const std::string t = "Parameterlijst_V1";
    parameters(t, test::parameterInsert(t, 2, "Max fan", 0, 100, 80, "%") +
                      test::parameterInsert(t, 1, "Min fan", 0, 100, 20, "%"));

    auto rows = loader().readParameters(t);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].index, 1);
    EXPECT_EQ(rows[1].index, 2);

    const auto& p = rows[0];
    EXPECT_EQ(p.order, 1);
    EXPECT_EQ(p.name, "par1");
    EXPECT_EQ(p.factoryName, "fab1");
    EXPECT_DOUBLE_EQ(p.min, 0);
    EXPECT_DOUBLE_EQ(p.max, 100);
    EXPECT_DOUBLE_EQ(p.defaultValue, 20);
    EXPECT_EQ(p.gb.text, "Min fan");
    EXPECT_EQ(p.gb.description, "description");
    EXPECT_EQ(p.gb.unit, "%");
    EXPECT_EQ(p.nl.text, "nl Min fan");
    EXPECT_EQ(p.d.description, "Beschreibung");
    EXPECT_EQ(p.passwordLevel, 2);
    EXPECT_EQ(p.text(catalog::Language::D).text, "d Min fan");
}

TEST_F(LoaderTest, DatalabelsCarryTooltipsAndVisibility)
{
    const std::string t = "Datalabel_V1";
    datalabels(t, test::datalabelInsert(t, 0, "Temp", "Supply temp", "°C"));

    auto rows = loader().readDatalabels(t);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].index, 0);
    EXPECT_EQ(rows[0].name, "label0");
    EXPECT_EQ(rows[0].gb.description, "Supply temp");
    EXPECT_EQ(rows[0].gb.unit, "°C");
    EXPECT_EQ(rows[0].nl.description, "nl Supply temp");
    EXPECT_TRUE(rows[0].visible);
}

TEST_F(LoaderTest, NullTextReadsAsEmpty)
{
    const std::string t = "Datalabel_V1";
    datalabels(t, "INSERT INTO \"Datalabel_V1\" (\"Index\", \"Visible\") "
                  "VALUES (4, 0);\n");

    auto rows = loader().readDatalabels(t);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_TRUE(rows[0].gb.text.empty());
    EXPECT_TRUE(rows[0].gb.unit.empty());
    EXPECT_FALSE(rows[0].visible);
}

TEST_F(LoaderTest, RepeatedIndexIsSchemaMismatch)
{
    const std::string t = "Datalabel_V1";
    datalabels(t, test::datalabelInsert(t, 1, "a", "a", "") +
                      test::datalabelInsert(t, 1, "b", "b", ""));
    EXPECT_THROW(loader().readDatalabels(t), SchemaMismatch);
}

TEST_F(LoaderTest, MissingIndexIsSchemaMismatch)
{
    const std::string t = "Datalabel_V1";
    datalabels(t, "INSERT INTO \"Datalabel_V1\" (\"Naam\") VALUES ('x');\n");
    EXPECT_THROW(loader().readDatalabels(t), SchemaMismatch);
}

TEST_F(LoaderTest, UnexpectedColumnIsSchemaMismatch)
{
    db.applyScript("CREATE TABLE \"Datalabel_V1\" (\"Index\" INTEGER, "
                   "\"Naam\" TEXT, \"Kleur\" TEXT);",
                   "schema");
    tables.push_back("Datalabel_V1");
    try
    {
        loader().readDatalabels("Datalabel_V1");
        FAIL() << "expected SchemaMismatch";
    }
    catch (const SchemaMismatch& e)
    {
        EXPECT_NE(std::string(e.what()).find("Kleur"), std::string::npos);
    }
}

TEST_F(LoaderTest, MissingColumnIsSchemaMismatch)
{
    // Same columns as a parameter table minus Paswoordnivo.
    std::string ddl = test::parameterDdl("Parameterlijst_V1");
    ddl.replace(ddl.find(", \"Paswoordnivo\" INTEGER"),
                std::string(", \"Paswoordnivo\" INTEGER").size(), "");
    db.applyScript(ddl, "schema");
    tables.push_back("Parameterlijst_V1");
    EXPECT_THROW(loader().readParameters("Parameterlijst_V1"), SchemaMismatch);
}

TEST_F(LoaderTest, TableNameResolution)
{
    parameters("parameterlijst_V2", "");
    datalabels("Datalabel_V2", "");
    auto l = loader();
    EXPECT_EQ(l.parameterTable(2), "parameterlijst_V2");
    EXPECT_FALSE(l.parameterTable(1));
    EXPECT_EQ(l.datalabelTable(2), "Datalabel_V2");
    EXPECT_FALSE(l.datalabelTable(3));
}

// Only parameter tables accept the lower-case spelling.
TEST_F(LoaderTest, LowerCaseDatalabelTableNotResolved)
{
    parameters("parameterlijst_V2", "");
    datalabels("datalabel_V2", "");
    auto l = loader();
    EXPECT_EQ(l.parameterTable(2), "parameterlijst_V2");
    EXPECT_FALSE(l.datalabelTable(2));
}

TEST_F(LoaderTest, SchemaMismatchNamesVersion)
{
    datalabels("Datalabel_V1",
               test::datalabelInsert("Datalabel_V1", 1, "a", "a", ""));
    db.applyScript("CREATE TABLE \"Datalabel_V2\" (\"Index\" INTEGER, "
                   "\"Naam\" TEXT);",
                   "schema");
    tables.push_back("Datalabel_V2");
    try
    {
        loader().loadDatalabels({1, 2});
        FAIL() << "expected SchemaMismatch";
    }
    catch (const SchemaMismatch& e)
    {
        const std::string msg = e.what();
        EXPECT_EQ(msg.rfind("Version 2: ", 0), 0u) << msg;
        EXPECT_NE(msg.find("Datalabel_V2"), std::string::npos);
    }
}

TEST_F(LoaderTest, MissingVersionReusesPreviousTable)
{
    parameters("Parameterlijst_V1",
               test::parameterInsert("Parameterlijst_V1", 1, "one", 0, 1, 0));
    parameters("Parameterlijst_V3",
               test::parameterInsert("Parameterlijst_V3", 1, "three", 0, 1, 0) +
                   test::parameterInsert("Parameterlijst_V3", 2, "more", 0, 1,
                                         0));

    auto cat = loader().loadParameters({1, 2, 3});
    ASSERT_EQ(cat.size(), 3u);
    ASSERT_EQ(cat.at(2).size(), 1u);
    EXPECT_EQ(cat.at(2)[0].gb.text, "one");
    EXPECT_EQ(cat.at(3).size(), 2u);
}

TEST_F(LoaderTest, MissingVersionEmptyWithoutCarryOver)
{
    datalabels("Datalabel_V1",
               test::datalabelInsert("Datalabel_V1", 1, "a", "a", ""));
    datalabels("Datalabel_V3",
               test::datalabelInsert("Datalabel_V3", 1, "c", "c", ""));

    catalog::LoaderOptions opts;
    opts.carryOverMissingTables = false;
    auto cat = loader(opts).loadDatalabels({1, 2, 3});
    ASSERT_EQ(cat.size(), 3u);
    EXPECT_EQ(cat.at(1).size(), 1u);
    EXPECT_TRUE(cat.at(2).empty());
    EXPECT_EQ(cat.at(3)[0].gb.text, "c");
}

TEST_F(LoaderTest, NothingToCarryOverIsQueryError)
{
    datalabels("Datalabel_V2",
               test::datalabelInsert("Datalabel_V2", 1, "b", "b", ""));
    EXPECT_THROW(loader().loadDatalabels({1, 2}), QueryError);
}

TEST_F(LoaderTest, NoVersionsGiveEmptyCatalog)
{
    EXPECT_TRUE(loader().loadParameters({}).empty());
    EXPECT_TRUE(loader().loadDatalabels({}).empty());
}
