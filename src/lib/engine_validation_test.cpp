#include <sstream>
#include <string>
#include <vector>
#include "gtest/gtest.h"

#include "cdl/engine/validation.hpp"
#include "test_blocks.hpp"

using namespace cdl::model;
using cdl::engine::Severity;
using cdl::engine::ValidationRule;


namespace
{
    typedef std::vector<Connection> Connections;

    Connection Connect(
        const std::string& srcInstance, const std::string& srcConnector,
        const std::string& dstInstance, const std::string& dstConnector)
    {
        return Connection(
            ConnectorRef(srcInstance, srcConnector),
            ConnectorRef(dstInstance, dstConnector));
    }

    std::shared_ptr<const BlockDescription> MakeComposite(
        const std::vector<BlockInstance>& children,
        const Connections& connections)
    {
        return std::make_shared<BlockDescription>(
            "Composite",
            std::vector<ParameterDescription>(),
            std::vector<ConnectorDescription>{
                cdl_test::RealInput("u"), cdl_test::RealOutput("y")},
            children,
            connections);
    }

    cdl::engine::ValidationReport Check(const BlockDescription& block)
    {
        return cdl::engine::Validate(block, cdl_test::MakeTestRegistry());
    }

    bool HasIssue(
        const cdl::engine::ValidationReport& report,
        ValidationRule rule,
        const std::string& location)
    {
        for (const auto& issue : report.IssuesFor(rule)) {
            if (issue.Location() == location) return true;
        }
        return false;
    }
}


TEST(cdl_engine_validation, ValidPassThrough)
{
    const auto block = cdl_test::ScaledPassThrough("PassThrough", 2.0);
    const auto report = Check(*block);
    EXPECT_FALSE(report.HasErrors());
    EXPECT_TRUE(report.Issues().empty()) << report.ToString();
}

TEST(cdl_engine_validation, ValidElementaryRoot)
{
    EXPECT_TRUE(Check(*cdl_test::GainType()).Issues().empty());
}

TEST(cdl_engine_validation, UnknownBlockType)
{
    const auto report = Check(*cdl_test::PassThroughType("Mystery"));
    ASSERT_EQ(1u, report.ErrorCount());
    EXPECT_TRUE(HasIssue(report, ValidationRule::unknown_block_type, ""));

    const auto composite = MakeComposite(
        {BlockInstance("m", cdl_test::PassThroughType("Mystery"))},
        {Connect("", "u", "m", "u"), Connect("m", "y", "", "y")});
    EXPECT_TRUE(HasIssue(Check(*composite), ValidationRule::unknown_block_type, "m"));
}

TEST(cdl_engine_validation, UnconnectedInput)
{
    const auto block = MakeComposite(
        {BlockInstance("a", cdl_test::AddType())},
        {Connect("", "u", "a", "u1"), Connect("a", "y", "", "y")});
    const auto report = Check(*block);
    ASSERT_EQ(1u, report.ErrorCount());
    EXPECT_TRUE(HasIssue(report, ValidationRule::unconnected_input, "a.u2"));
}

TEST(cdl_engine_validation, UnconnectedOutputAndUnusedInput)
{
    const auto block = MakeComposite(
        {BlockInstance("c", cdl_test::ConstantType(), {{"value", ScalarValue(1.0)}})},
        Connections());
    const auto report = Check(*block);
    EXPECT_EQ(1u, report.ErrorCount());
    EXPECT_EQ(1u, report.WarningCount());
    EXPECT_TRUE(HasIssue(report, ValidationRule::unconnected_output, "y"));
    const auto unused = report.IssuesFor(ValidationRule::unused_input);
    ASSERT_EQ(1u, unused.size());
    EXPECT_EQ(Severity::warning, unused.front().Severity());
    EXPECT_EQ("u", unused.front().Location());
}

TEST(cdl_engine_validation, MultipleSources)
{
    const auto block = MakeComposite(
        {BlockInstance("g1", cdl_test::GainType()), BlockInstance("g2", cdl_test::GainType())},
        {
            Connect("", "u", "g1", "u"),
            Connect("", "u", "g2", "u"),
            Connect("g1", "y", "", "y"),
            Connect("g2", "y", "", "y"),
        });
    const auto report = Check(*block);
    ASSERT_EQ(1u, report.ErrorCount());
    EXPECT_TRUE(HasIssue(report, ValidationRule::multiple_sources, "y"));
}

TEST(cdl_engine_validation, AlgebraicLoop)
{
    const auto block = MakeComposite(
        {
            BlockInstance("A", cdl_test::AddType()),
            BlockInstance("B", cdl_test::GainType()),
        },
        {
            Connect("", "u", "A", "u1"),
            Connect("B", "y", "A", "u2"),
            Connect("A", "y", "B", "u"),
            Connect("A", "y", "", "y"),
        });
    const auto report = Check(*block);
    const auto loops = report.IssuesFor(ValidationRule::algebraic_loop);
    ASSERT_EQ(1u, loops.size());
    EXPECT_EQ(Severity::error, loops.front().Severity());
    EXPECT_NE(std::string::npos, loops.front().Message().find("A -> B -> A"));
    EXPECT_EQ(1u, report.ErrorCount());
}

TEST(cdl_engine_validation, TypeMismatch)
{
    const auto boolSource = std::make_shared<BlockDescription>(
        "BoolSource",
        std::vector<ParameterDescription>(),
        std::vector<ConnectorDescription>{
            ConnectorDescription("y", BOOLEAN_DATATYPE, OUTPUT_CAUSALITY)});
    const auto intSource = std::make_shared<BlockDescription>(
        "IntSource",
        std::vector<ParameterDescription>(),
        std::vector<ConnectorDescription>{
            ConnectorDescription("y", INTEGER_DATATYPE, OUTPUT_CAUSALITY)});
    const auto block = MakeComposite(
        {
            BlockInstance("b", boolSource),
            BlockInstance("i", intSource),
            BlockInstance("a", cdl_test::AddType()),
        },
        {
            Connect("b", "y", "a", "u1"),
            Connect("i", "y", "a", "u2"),
            Connect("", "u", "", "y"),
        });
    const auto report = Check(*block);
    // bool -> real is an error, int -> real is fine.
    EXPECT_TRUE(HasIssue(report, ValidationRule::type_mismatch, "a.u1"));
    EXPECT_FALSE(HasIssue(report, ValidationRule::type_mismatch, "a.u2"));
    // Boundary-to-boundary connection
    EXPECT_TRUE(HasIssue(report, ValidationRule::illegal_connection, "y"));
    // Neither source type is registered.
    EXPECT_TRUE(HasIssue(report, ValidationRule::unknown_block_type, "b"));
    EXPECT_TRUE(HasIssue(report, ValidationRule::unknown_block_type, "i"));
}

TEST(cdl_engine_validation, EnumerationLiterals)
{
    ValueAttributes modes;
    modes.enumerationLiterals = {"off", "on"};
    ValueAttributes levels;
    levels.enumerationLiterals = {"low", "high"};
    const auto source = std::make_shared<BlockDescription>(
        "Mode",
        std::vector<ParameterDescription>(),
        std::vector<ConnectorDescription>{
            ConnectorDescription("y", ENUMERATION_DATATYPE, OUTPUT_CAUSALITY, modes)});
    const auto sink = std::make_shared<BlockDescription>(
        "Level",
        std::vector<ParameterDescription>(),
        std::vector<ConnectorDescription>{
            ConnectorDescription("u", ENUMERATION_DATATYPE, INPUT_CAUSALITY, levels),
            cdl_test::RealOutput("y")});
    const auto block = MakeComposite(
        {BlockInstance("s", source), BlockInstance("l", sink)},
        {Connect("s", "y", "l", "u"), Connect("l", "y", "", "y")});
    EXPECT_TRUE(HasIssue(Check(*block), ValidationRule::type_mismatch, "l.u"));
}

TEST(cdl_engine_validation, DanglingReferencesAndIllegalConnections)
{
    const auto block = MakeComposite(
        {BlockInstance("g", cdl_test::GainType())},
        {
            Connect("", "u", "g", "u"),
            Connect("nope", "y", "", "y"),
            Connect("g", "nope", "", "y"),
            Connect("g", "u", "", "y"),
            Connect("", "y", "g", "u"),
            Connect("g", "y", "", "missing"),
        });
    const auto report = Check(*block);
    EXPECT_EQ(3u, report.IssuesFor(ValidationRule::dangling_reference).size());
    EXPECT_EQ(2u, report.IssuesFor(ValidationRule::illegal_connection).size());
    // Only the valid connection to g.u counts.
    EXPECT_FALSE(HasIssue(report, ValidationRule::multiple_sources, "g.u"));
    EXPECT_TRUE(HasIssue(report, ValidationRule::unconnected_output, "y"));
}

TEST(cdl_engine_validation, Names)
{
    const auto gain = cdl_test::GainType();
    const auto block = MakeComposite(
        {BlockInstance("g", gain), BlockInstance("g", gain), BlockInstance("1st", gain)},
        {Connect("", "u", "g", "u"), Connect("", "u", "1st", "u"), Connect("g", "y", "", "y")});
    const auto report = Check(*block);
    EXPECT_TRUE(HasIssue(report, ValidationRule::duplicate_name, "g"));
    EXPECT_TRUE(HasIssue(report, ValidationRule::invalid_name, "1st"));

    const BlockDescription duplicates(
        "Duplicates",
        {ParameterDescription("k", REAL_DATATYPE, ScalarValue(1.0)),
         ParameterDescription("k", REAL_DATATYPE, ScalarValue(2.0))},
        {cdl_test::RealInput("u"), cdl_test::RealOutput("u")});
    const auto report2 = cdl::engine::Validate(duplicates, cdl::engine::ImplementationRegistry());
    EXPECT_TRUE(HasIssue(report2, ValidationRule::duplicate_name, "k"));
    EXPECT_TRUE(HasIssue(report2, ValidationRule::duplicate_name, "u"));
}

TEST(cdl_engine_validation, Parameters)
{
    ValueAttributes bounded;
    bounded.min = 0.0;
    bounded.max = 10.0;
    const auto type = std::make_shared<BlockDescription>(
        "Gain",
        std::vector<ParameterDescription>{
            ParameterDescription("k", REAL_DATATYPE, boost::none, FIXED_VARIABILITY, bounded),
            ParameterDescription("n", INTEGER_DATATYPE, ScalarValue(1), CONSTANT_VARIABILITY),
            ParameterDescription("c", REAL_DATATYPE, boost::none, CONSTANT_VARIABILITY),
        },
        std::vector<ConnectorDescription>{cdl_test::RealInput("u"), cdl_test::RealOutput("y")});

    const auto check = [&] (const ValueMap& overrides) {
        return Check(*MakeComposite(
            {BlockInstance("g", type, overrides)},
            {Connect("", "u", "g", "u"), Connect("g", "y", "", "y")}));
    };

    // Constant without value, and k has neither default nor override.
    auto report = check(ValueMap());
    EXPECT_TRUE(HasIssue(report, ValidationRule::missing_parameter, "g.c"));
    EXPECT_TRUE(HasIssue(report, ValidationRule::missing_parameter, "g.k"));

    ValueMap overrides;
    overrides["k"] = 20.0;
    overrides["n"] = 2;
    overrides["x"] = 1.0;
    report = check(overrides);
    EXPECT_FALSE(HasIssue(report, ValidationRule::missing_parameter, "g.k"));
    EXPECT_TRUE(HasIssue(report, ValidationRule::out_of_bounds, "g.k"));
    EXPECT_TRUE(HasIssue(report, ValidationRule::constant_override, "g.n"));
    EXPECT_TRUE(HasIssue(report, ValidationRule::dangling_reference, "g.x"));

    overrides.clear();
    overrides["k"] = std::string("big");
    EXPECT_TRUE(HasIssue(check(overrides), ValidationRule::type_mismatch, "g.k"));

    // Integers are accepted for real parameters.
    overrides["k"] = 3;
    EXPECT_FALSE(HasIssue(check(overrides), ValidationRule::type_mismatch, "g.k"));
}

TEST(cdl_engine_validation, NestedLocations)
{
    const auto inner = MakeComposite(
        {BlockInstance("a", cdl_test::AddType())},
        {Connect("", "u", "a", "u1"), Connect("a", "y", "", "y")});
    const auto outer = std::make_shared<BlockDescription>(
        "Outer",
        std::vector<ParameterDescription>(),
        std::vector<ConnectorDescription>{
            cdl_test::RealInput("u"), cdl_test::RealOutput("y")},
        std::vector<BlockInstance>{BlockInstance("inner", inner)},
        Connections{Connect("", "u", "inner", "u"), Connect("inner", "y", "", "y")});
    const auto report = Check(*outer);
    ASSERT_EQ(1u, report.ErrorCount());
    EXPECT_TRUE(HasIssue(report, ValidationRule::unconnected_input, "inner.a.u2"));
}

TEST(cdl_engine_validation, ReportFormatting)
{
    cdl::engine::ValidationReport report;
    report.Add(cdl::engine::ValidationIssue(
        Severity::warning, ValidationRule::unused_input, "u", "Input 'u' is not used"));
    report.Add(cdl::engine::ValidationIssue(
        Severity::error, ValidationRule::algebraic_loop, "", "Algebraic loop: A -> A"));
    EXPECT_TRUE(report.HasErrors());
    EXPECT_EQ(1u, report.ErrorCount());
    EXPECT_EQ(1u, report.WarningCount());
    EXPECT_EQ(
        "warning [unused_input] u: Input 'u' is not used\n"
        "error [algebraic_loop] (root): Algebraic loop: A -> A\n",
        report.ToString());

    const cdl::engine::ValidationError error(report);
    EXPECT_EQ(1u, error.Report().ErrorCount());
    const std::string msg = error.what();
    EXPECT_NE(std::string::npos, msg.find("algebraic_loop"));
    EXPECT_EQ(std::string::npos, msg.find("unused_input"));
}

TEST(cdl_engine_validation, TwoCycle)
{
    // A.u <- B.y and B.u <- A.y, nothing else feeding them.
    const auto block = MakeComposite(
        {BlockInstance("A", cdl_test::GainType()), BlockInstance("B", cdl_test::GainType())},
        {Connect("B", "y", "A", "u"), Connect("A", "y", "B", "u"), Connect("A", "y", "", "y")});
    const auto report = Check(*block);
    EXPECT_EQ(1u, report.ErrorCount());
    const auto loops = report.IssuesFor(ValidationRule::algebraic_loop);
    ASSERT_EQ(1u, loops.size());
    EXPECT_EQ("", loops.front().Location());
    EXPECT_NE(std::string::npos, loops.front().Message().find("A -> B -> A"));
    EXPECT_TRUE(HasIssue(report, ValidationRule::unused_input, "u"));
}
