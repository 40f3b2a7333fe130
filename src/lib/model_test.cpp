#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include "gtest/gtest.h"

#include "cdl/model.hpp"

using namespace cdl::model;


TEST(cdl_model, DataTypeOf)
{
    EXPECT_EQ(REAL_DATATYPE, DataTypeOf(1.0));
    EXPECT_EQ(INTEGER_DATATYPE, DataTypeOf(1));
    EXPECT_EQ(BOOLEAN_DATATYPE, DataTypeOf(true));
    EXPECT_EQ(STRING_DATATYPE, DataTypeOf(std::string("x")));
    EXPECT_EQ(ENUMERATION_DATATYPE, DataTypeOf(EnumerationValue("on")));
    EXPECT_STREQ("real", DataTypeName(REAL_DATATYPE));
    EXPECT_STREQ("enumeration", DataTypeName(ENUMERATION_DATATYPE));
}

TEST(cdl_model, ConvertValue)
{
    EXPECT_TRUE(IsAssignable(INTEGER_DATATYPE, REAL_DATATYPE));
    EXPECT_FALSE(IsAssignable(REAL_DATATYPE, INTEGER_DATATYPE));
    EXPECT_FALSE(IsAssignable(BOOLEAN_DATATYPE, INTEGER_DATATYPE));
    EXPECT_TRUE(IsAssignable(STRING_DATATYPE, STRING_DATATYPE));

    const auto real = ConvertValue(3, REAL_DATATYPE);
    EXPECT_EQ(REAL_DATATYPE, DataTypeOf(real));
    EXPECT_EQ(3.0, boost::get<double>(real));
    EXPECT_EQ(ScalarValue(std::string("s")), ConvertValue(std::string("s"), STRING_DATATYPE));
    EXPECT_THROW(ConvertValue(3.5, INTEGER_DATATYPE), std::invalid_argument);
    EXPECT_THROW(ConvertValue(true, REAL_DATATYPE), std::invalid_argument);
}

TEST(cdl_model, EnumerationValue)
{
    const EnumerationValue on("on");
    EXPECT_EQ("on", on.Literal());
    EXPECT_EQ(EnumerationValue("on"), on);
    EXPECT_NE(EnumerationValue("off"), on);
    std::ostringstream s;
    s << on;
    EXPECT_EQ("on", s.str());
}

TEST(cdl_model, IsWithinBounds)
{
    ValueAttributes a;
    EXPECT_TRUE(IsWithinBounds(1e300, a));
    a.min = -1.0;
    a.max = 1.0;
    EXPECT_TRUE(IsWithinBounds(0.5, a));
    EXPECT_TRUE(IsWithinBounds(1, a));
    EXPECT_TRUE(IsWithinBounds(-1.0, a));
    EXPECT_FALSE(IsWithinBounds(2, a));
    EXPECT_FALSE(IsWithinBounds(-1.5, a));
    EXPECT_TRUE(IsWithinBounds(true, a));
    EXPECT_TRUE(IsWithinBounds(std::string("anything"), a));

    ValueAttributes e;
    EXPECT_TRUE(IsWithinBounds(EnumerationValue("any"), e));
    e.enumerationLiterals = {"off", "on"};
    EXPECT_TRUE(IsWithinBounds(EnumerationValue("on"), e));
    EXPECT_FALSE(IsWithinBounds(EnumerationValue("standby"), e));
}

TEST(cdl_model, ConnectorRef)
{
    const ConnectorRef boundary("", "u");
    const ConnectorRef child("gain", "u");
    EXPECT_TRUE(boundary.IsBoundary());
    EXPECT_FALSE(child.IsBoundary());
    EXPECT_NE(boundary, child);
    EXPECT_EQ(child, ConnectorRef("gain", "u"));
    EXPECT_TRUE(boundary < child);
    std::ostringstream s;
    s << boundary << ' ' << child;
    EXPECT_EQ("u gain.u", s.str());
}

TEST(cdl_model, BlockDescription)
{
    const auto gain = std::make_shared<BlockDescription>(
        "Gain",
        std::vector<ParameterDescription>{
            ParameterDescription("k", REAL_DATATYPE, ScalarValue(1.0))},
        std::vector<ConnectorDescription>{
            ConnectorDescription("u", REAL_DATATYPE, INPUT_CAUSALITY),
            ConnectorDescription("y", REAL_DATATYPE, OUTPUT_CAUSALITY,
                ValueAttributes(), ScalarValue(0.0))},
        "Multiplies its input by k");
    EXPECT_EQ("Gain", gain->TypeName());
    EXPECT_EQ(ELEMENTARY_BLOCK, gain->Kind());
    EXPECT_EQ("Multiplies its input by k", gain->Description());
    ASSERT_NE(nullptr, gain->FindConnector("y"));
    EXPECT_EQ(OUTPUT_CAUSALITY, gain->FindConnector("y")->Causality());
    EXPECT_EQ(ScalarValue(0.0), *gain->FindConnector("y")->Start());
    EXPECT_EQ(nullptr, gain->FindConnector("k"));
    ASSERT_NE(nullptr, gain->FindParameter("k"));
    EXPECT_EQ(FIXED_VARIABILITY, gain->FindParameter("k")->Variability());
    EXPECT_TRUE(gain->Children().empty());

    ValueMap overrides;
    overrides["k"] = 2.0;
    const BlockDescription composite(
        "Doubler",
        std::vector<ParameterDescription>(),
        std::vector<ConnectorDescription>{
            ConnectorDescription("u", REAL_DATATYPE, INPUT_CAUSALITY),
            ConnectorDescription("y", REAL_DATATYPE, OUTPUT_CAUSALITY)},
        std::vector<BlockInstance>{BlockInstance("g", gain, overrides)},
        std::vector<Connection>{
            Connection(ConnectorRef("", "u"), ConnectorRef("g", "u")),
            Connection(ConnectorRef("g", "y"), ConnectorRef("", "y"))});
    EXPECT_EQ(COMPOSITE_BLOCK, composite.Kind());
    ASSERT_NE(nullptr, composite.FindChild("g"));
    EXPECT_EQ(gain, composite.FindChild("g")->TypePtr());
    EXPECT_EQ(ScalarValue(2.0), composite.FindChild("g")->Overrides().at("k"));
    EXPECT_EQ(nullptr, composite.FindChild("h"));
    EXPECT_EQ(2u, composite.Connections().size());

    EXPECT_THROW(BlockInstance("g", nullptr), std::invalid_argument);
}

TEST(cdl_model, Names)
{
    EXPECT_TRUE(IsValidInstanceName("gain"));
    EXPECT_TRUE(IsValidInstanceName("Gain_2"));
    EXPECT_FALSE(IsValidInstanceName(""));
    EXPECT_FALSE(IsValidInstanceName("2nd"));
    EXPECT_FALSE(IsValidInstanceName("_x"));
    EXPECT_FALSE(IsValidInstanceName("a.b"));

    EXPECT_EQ("gain", JoinInstancePath("", "gain"));
    EXPECT_EQ("outer.inner", JoinInstancePath("outer", "inner"));
    EXPECT_EQ("outer.inner.y", QualifiedConnectorName("outer.inner", "y"));
    EXPECT_EQ("y", QualifiedConnectorName("", "y"));
}
