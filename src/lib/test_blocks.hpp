// Block types and implementations shared by the engine tests.
#ifndef CDL_TEST_BLOCKS_HPP
#define CDL_TEST_BLOCKS_HPP

#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "boost/variant/get.hpp"

#include "cdl/engine/registry.hpp"
#include "cdl/model.hpp"


namespace cdl_test
{

using namespace cdl::model;


inline ConnectorDescription RealInput(
    const std::string& name,
    const boost::optional<ScalarValue>& start = boost::none)
{
    return ConnectorDescription(
        name, REAL_DATATYPE, INPUT_CAUSALITY, ValueAttributes(), start);
}


inline ConnectorDescription RealOutput(
    const std::string& name,
    const boost::optional<ScalarValue>& start = boost::none)
{
    return ConnectorDescription(
        name, REAL_DATATYPE, OUTPUT_CAUSALITY, ValueAttributes(), start);
}


// y = k*u
inline std::shared_ptr<const BlockDescription> GainType()
{
    return std::make_shared<BlockDescription>(
        "Gain",
        std::vector<ParameterDescription>{
            ParameterDescription("k", REAL_DATATYPE, ScalarValue(1.0))},
        std::vector<ConnectorDescription>{RealInput("u"), RealOutput("y")});
}


// y = u1 + u2
inline std::shared_ptr<const BlockDescription> AddType()
{
    return std::make_shared<BlockDescription>(
        "Add",
        std::vector<ParameterDescription>(),
        std::vector<ConnectorDescription>{
            RealInput("u1"), RealInput("u2"), RealOutput("y")});
}


// y = sum of all u so far
inline std::shared_ptr<const BlockDescription> AccumulatorType()
{
    return std::make_shared<BlockDescription>(
        "Accumulator",
        std::vector<ParameterDescription>(),
        std::vector<ConnectorDescription>{RealInput("u"), RealOutput("y")});
}


// y = value (no inputs)
inline std::shared_ptr<const BlockDescription> ConstantType()
{
    return std::make_shared<BlockDescription>(
        "Constant",
        std::vector<ParameterDescription>{
            ParameterDescription("value", REAL_DATATYPE)},
        std::vector<ConnectorDescription>{RealOutput("y")});
}


// Same interface as Gain, but the implementation is chosen by the test.
inline std::shared_ptr<const BlockDescription> PassThroughType(const std::string& typeName)
{
    return std::make_shared<BlockDescription>(
        typeName,
        std::vector<ParameterDescription>(),
        std::vector<ConnectorDescription>{RealInput("u"), RealOutput("y")});
}


class Accumulator : public cdl::engine::Implementation
{
public:
    Accumulator() : m_sum(0.0) { }

    void Evaluate(
        const ValueMap& parameters,
        const ValueMap& inputs,
        ValueMap& outputs) override
    {
        m_sum += boost::get<double>(inputs.at("u"));
        outputs["y"] = m_sum;
    }

    ValueMap SaveState() const override
    {
        ValueMap state;
        state["sum"] = m_sum;
        return state;
    }

    void RestoreState(const ValueMap& state) override
    {
        m_sum = boost::get<double>(state.at("sum"));
    }

private:
    double m_sum;
};


/*
Registers:
    Gain, Add, Accumulator, Constant    as described above
    Throws                              throws std::runtime_error
    NaN                                 produces y = NaN
    Undeclared                          produces a value for "z"
    WrongType                           produces a boolean y
*/
inline cdl::engine::ImplementationRegistry MakeTestRegistry()
{
    cdl::engine::ImplementationRegistry registry;
    registry.RegisterFunction("Gain",
        [] (const ValueMap& p, const ValueMap& in, ValueMap& out) {
            out["y"] = boost::get<double>(p.at("k")) * boost::get<double>(in.at("u"));
        });
    registry.RegisterFunction("Add",
        [] (const ValueMap&, const ValueMap& in, ValueMap& out) {
            out["y"] = boost::get<double>(in.at("u1")) + boost::get<double>(in.at("u2"));
        });
    registry.Register("Accumulator", [] () {
        return std::unique_ptr<cdl::engine::Implementation>(std::make_unique<Accumulator>());
    });
    registry.RegisterFunction("Constant",
        [] (const ValueMap& p, const ValueMap&, ValueMap& out) {
            out["y"] = p.at("value");
        });
    registry.RegisterFunction("Throws",
        [] (const ValueMap&, const ValueMap&, ValueMap&) {
            throw std::runtime_error("block failure");
        });
    registry.RegisterFunction("NaN",
        [] (const ValueMap&, const ValueMap&, ValueMap& out) {
            out["y"] = std::numeric_limits<double>::quiet_NaN();
        });
    registry.RegisterFunction("Undeclared",
        [] (const ValueMap&, const ValueMap& in, ValueMap& out) {
            out["y"] = in.at("u");
            out["z"] = 1.0;
        });
    registry.RegisterFunction("WrongType",
        [] (const ValueMap&, const ValueMap&, ValueMap& out) {
            out["y"] = true;
        });
    return registry;
}


// A composite with one input u and one output y, where y = k*u.
inline std::shared_ptr<const BlockDescription> ScaledPassThrough(
    const std::string& typeName, double k)
{
    ValueMap overrides;
    overrides["k"] = k;
    return std::make_shared<BlockDescription>(
        typeName,
        std::vector<ParameterDescription>(),
        std::vector<ConnectorDescription>{RealInput("u"), RealOutput("y")},
        std::vector<BlockInstance>{BlockInstance("gain", GainType(), overrides)},
        std::vector<Connection>{
            Connection(ConnectorRef("", "u"), ConnectorRef("gain", "u")),
            Connection(ConnectorRef("gain", "y"), ConnectorRef("", "y"))});
}


} // namespace
#endif // header guard
