#include <memory>
#include <string>
#include <vector>
#include "gtest/gtest.h"

#include "cdl/engine/execution.hpp"
#include "cdl/error.hpp"
#include "cdl/protobuf.hpp"
#include "state.pb.h"
#include "test_blocks.hpp"

using namespace cdl::model;
using cdl::engine::ContextState;
using cdl::engine::ExecutionContext;
using cdl::engine::ExecutionOptions;


namespace
{
    // u -> acc -> inner(k=2) -> y, where inner is a composite.
    std::shared_ptr<const BlockDescription> MakeIntegratorChain()
    {
        return std::make_shared<BlockDescription>(
            "IntegratorChain",
            std::vector<ParameterDescription>(),
            std::vector<ConnectorDescription>{
                cdl_test::RealInput("u"), cdl_test::RealOutput("y")},
            std::vector<BlockInstance>{
                BlockInstance("acc", cdl_test::AccumulatorType()),
                BlockInstance("inner", cdl_test::ScaledPassThrough("Inner", 2.0))},
            std::vector<Connection>{
                Connection(ConnectorRef("", "u"), ConnectorRef("acc", "u")),
                Connection(ConnectorRef("acc", "y"), ConnectorRef("inner", "u")),
                Connection(ConnectorRef("inner", "y"), ConnectorRef("", "y"))});
    }

    double Real(const ScalarValue& v)
    {
        return boost::get<double>(v);
    }
}


TEST(cdl_engine_snapshot, SnapshotAndRestore)
{
    const auto block = MakeIntegratorChain();
    const auto registry = cdl_test::MakeTestRegistry();
    ExecutionContext context(block, registry);
    context.Initialize();
    context.SetInput("u", 1.0);
    context.Step();
    context.Step();
    EXPECT_EQ(4.0, Real(context.GetOutput("y")));

    const auto snapshot = context.Snapshot();

    auto restored = ExecutionContext::Restore(block, registry, snapshot);
    EXPECT_EQ(ContextState::stepping, restored.State());
    EXPECT_EQ(2u, restored.StepCount());
    EXPECT_EQ(4.0, Real(restored.GetOutput("y")));
    EXPECT_EQ(2.0, Real(restored.GetValue("acc", "y")));
    EXPECT_EQ(4.0, Real(restored.GetValue("inner.gain", "y")));
    // The input value is part of the snapshot.
    EXPECT_EQ(1.0, Real(restored.GetValue("", "u")));

    // Both contexts continue identically, including the accumulator state.
    context.Step();
    restored.Step();
    EXPECT_EQ(3u, restored.StepCount());
    EXPECT_EQ(Real(context.GetOutput("y")), Real(restored.GetOutput("y")));
    EXPECT_EQ(6.0, Real(restored.GetOutput("y")));

    // The original is unaffected by the restored copy.
    restored.SetInput("u", 10.0);
    restored.Step();
    EXPECT_EQ(26.0, Real(restored.GetOutput("y")));
    EXPECT_EQ(6.0, Real(context.GetOutput("y")));
}

TEST(cdl_engine_snapshot, InitializedSnapshot)
{
    const auto block = MakeIntegratorChain();
    const auto registry = cdl_test::MakeTestRegistry();
    ExecutionContext context(block, registry);
    context.Initialize();
    context.SetInput("u", 5.0);
    auto restored = ExecutionContext::Restore(block, registry, context.Snapshot());
    EXPECT_EQ(ContextState::initialized, restored.State());
    EXPECT_EQ(0u, restored.StepCount());
    restored.Step();
    EXPECT_EQ(10.0, Real(restored.GetOutput("y")));
}

TEST(cdl_engine_snapshot, SnapshotPreconditions)
{
    const auto registry = cdl_test::MakeTestRegistry();
    ExecutionContext context(MakeIntegratorChain(), registry);
    EXPECT_THROW(context.Snapshot(), cdl::error::PreconditionViolation);

    context.Initialize();
    EXPECT_THROW(context.Step(), cdl::error::ExecutionError);
    EXPECT_EQ(ContextState::faulted, context.State());
    EXPECT_THROW(context.Snapshot(), cdl::error::PreconditionViolation);
}

TEST(cdl_engine_snapshot, RestoreErrors)
{
    const auto block = MakeIntegratorChain();
    const auto registry = cdl_test::MakeTestRegistry();

    EXPECT_THROW(
        ExecutionContext::Restore(block, registry, "\xFF\xFF garbage"),
        cdl::engine::SnapshotError);

    ExecutionContext context(block, registry);
    context.Initialize();
    const auto snapshot = context.Snapshot();

    // Different block type
    EXPECT_THROW(
        ExecutionContext::Restore(
            cdl_test::ScaledPassThrough("PassThrough", 2.0), registry, snapshot),
        cdl::engine::SnapshotError);

    // Same type name, but the snapshot refers to an instance it lacks.
    cdlproto::state::Snapshot pb;
    cdl::protobuf::ParseFromString(snapshot, pb);
    auto signal = pb.add_signal();
    signal->set_instance_path("nope");
    signal->set_connector("y");
    signal->mutable_value()->set_real_value(1.0);
    std::string tampered;
    cdl::protobuf::SerializeToString(pb, tampered);
    EXPECT_THROW(
        ExecutionContext::Restore(block, registry, tampered),
        cdl::engine::SnapshotError);

    // State for an instance which is not elementary
    cdlproto::state::Snapshot pb2;
    cdl::protobuf::ParseFromString(snapshot, pb2);
    pb2.add_instance_state()->set_instance_path("inner");
    cdl::protobuf::SerializeToString(pb2, tampered);
    EXPECT_THROW(
        ExecutionContext::Restore(block, registry, tampered),
        cdl::engine::SnapshotError);

    // A value of the wrong type for its connector
    cdlproto::state::Snapshot pbWrongType;
    cdl::protobuf::ParseFromString(snapshot, pbWrongType);
    auto wrongType = pbWrongType.add_signal();
    wrongType->set_instance_path("");
    wrongType->set_connector("y");
    wrongType->mutable_value()->set_string_value("oops");
    cdl::protobuf::SerializeToString(pbWrongType, tampered);
    EXPECT_THROW(
        ExecutionContext::Restore(block, registry, tampered),
        cdl::engine::SnapshotError);

    // A value without any of its fields set
    cdlproto::state::Snapshot pb3;
    cdl::protobuf::ParseFromString(snapshot, pb3);
    auto empty = pb3.add_signal();
    empty->set_instance_path("acc");
    empty->set_connector("y");
    empty->mutable_value();
    cdl::protobuf::SerializeToString(pb3, tampered);
    EXPECT_THROW(
        ExecutionContext::Restore(block, registry, tampered),
        cdl::engine::SnapshotError);
}

TEST(cdl_engine_snapshot, RestoreConvertsAndChecksValues)
{
    ValueAttributes modes;
    modes.enumerationLiterals = {"off", "on"};
    const auto block = std::make_shared<BlockDescription>(
        "Switch",
        std::vector<ParameterDescription>(),
        std::vector<ConnectorDescription>{
            cdl_test::RealInput("u"),
            ConnectorDescription("mode", ENUMERATION_DATATYPE, INPUT_CAUSALITY, modes),
            cdl_test::RealOutput("y")});
    auto registry = cdl_test::MakeTestRegistry();
    registry.RegisterFunction("Switch", [] (const ValueMap&, const ValueMap& in, ValueMap& out) {
        out["y"] = in.at("u");
    });
    ExecutionContext context(block, registry);
    context.Initialize();
    context.SetInput("u", 1.0);
    context.SetInput("mode", EnumerationValue("on"));
    const auto snapshot = context.Snapshot();

    // An integer is accepted for a real connector, and stored as a real.
    cdlproto::state::Snapshot pb;
    cdl::protobuf::ParseFromString(snapshot, pb);
    auto u = pb.add_signal();
    u->set_instance_path("");
    u->set_connector("u");
    u->mutable_value()->set_integer_value(3);
    std::string modified;
    cdl::protobuf::SerializeToString(pb, modified);
    const auto restored = ExecutionContext::Restore(block, registry, modified);
    EXPECT_EQ(ScalarValue(3.0), restored.GetValue("", "u"));

    // An enumeration literal which the connector does not declare
    cdlproto::state::Snapshot pbLiteral;
    cdl::protobuf::ParseFromString(snapshot, pbLiteral);
    auto mode = pbLiteral.add_signal();
    mode->set_instance_path("");
    mode->set_connector("mode");
    mode->mutable_value()->set_enumeration_value("maybe");
    cdl::protobuf::SerializeToString(pbLiteral, modified);
    EXPECT_THROW(
        ExecutionContext::Restore(block, registry, modified),
        cdl::engine::SnapshotError);
}

TEST(cdl_engine_snapshot, HistoryStartsEmpty)
{
    const auto block = MakeIntegratorChain();
    const auto registry = cdl_test::MakeTestRegistry();
    ExecutionOptions options;
    options.historyDepth = 4;
    ExecutionContext context(block, registry, options);
    context.Initialize();
    context.SetInput("u", 1.0);
    context.Step();
    context.Step();
    EXPECT_EQ(2u, context.GetHistory("", "y").size());

    auto restored = ExecutionContext::Restore(block, registry, context.Snapshot(), options);
    EXPECT_TRUE(restored.GetHistory("", "y").empty());
    EXPECT_TRUE(restored.GetHistory("acc", "y").empty());
    EXPECT_TRUE(restored.GetHistory("inner.gain", "y").empty());
    EXPECT_TRUE(restored.GetHistory("", "u").empty());

    restored.Step();
    const auto y = restored.GetHistory("", "y");
    ASSERT_EQ(1u, y.size());
    EXPECT_EQ(3u, y[0].step);
    EXPECT_EQ(ScalarValue(6.0), y[0].value);
}

TEST(cdl_engine_snapshot, ValueTypes)
{
    const auto block = std::make_shared<BlockDescription>(
        "Mixed",
        std::vector<ParameterDescription>(),
        std::vector<ConnectorDescription>{
            ConnectorDescription("i", INTEGER_DATATYPE, INPUT_CAUSALITY),
            ConnectorDescription("b", BOOLEAN_DATATYPE, INPUT_CAUSALITY),
            ConnectorDescription("s", STRING_DATATYPE, INPUT_CAUSALITY),
            ConnectorDescription("e", ENUMERATION_DATATYPE, INPUT_CAUSALITY),
            cdl_test::RealOutput("y")});
    auto registry = cdl_test::MakeTestRegistry();
    registry.RegisterFunction("Mixed", [] (const ValueMap&, const ValueMap&, ValueMap& out) {
        out["y"] = 0.0;
    });

    ExecutionContext context(block, registry);
    context.Initialize();
    context.SetInput("i", 7);
    context.SetInput("b", true);
    context.SetInput("s", std::string("text"));
    context.SetInput("e", EnumerationValue("on"));
    context.Step();

    const auto restored = ExecutionContext::Restore(block, registry, context.Snapshot());
    EXPECT_EQ(ScalarValue(7), restored.GetValue("", "i"));
    EXPECT_EQ(ScalarValue(true), restored.GetValue("", "b"));
    EXPECT_EQ(ScalarValue(std::string("text")), restored.GetValue("", "s"));
    EXPECT_EQ(ScalarValue(EnumerationValue("on")), restored.GetValue("", "e"));
    EXPECT_EQ(ScalarValue(0.0), restored.GetOutput("y"));
}
