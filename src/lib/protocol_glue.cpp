/*
Copyright 2024-present, the CDL engine contributors.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include <cdl/protocol/glue.hpp>

#include <stdexcept>


namespace
{
    class ScalarValueConverterVisitor : public boost::static_visitor<>
    {
    public:
        explicit ScalarValueConverterVisitor(cdlproto::state::ScalarValue& value)
            : m_value(&value) { }
        void operator()(const double& value)      const { m_value->set_real_value(value); }
        void operator()(const int& value)         const { m_value->set_integer_value(value); }
        void operator()(const bool& value)        const { m_value->set_boolean_value(value); }
        void operator()(const std::string& value) const { m_value->set_string_value(value); }
        void operator()(const cdl::model::EnumerationValue& value) const
        {
            m_value->set_enumeration_value(value.Literal());
        }
    private:
        cdlproto::state::ScalarValue* m_value;
    };
}


void cdl::protocol::ConvertToProto(
    const cdl::model::ScalarValue& source,
    cdlproto::state::ScalarValue& target)
{
    target.Clear();
    boost::apply_visitor(ScalarValueConverterVisitor(target), source);
}


cdl::model::ScalarValue cdl::protocol::FromProto(
    const cdlproto::state::ScalarValue& source)
{
    if (source.has_real_value())                return source.real_value();
    else if (source.has_integer_value())        return source.integer_value();
    else if (source.has_boolean_value())        return source.boolean_value();
    else if (source.has_string_value())         return source.string_value();
    else if (source.has_enumeration_value()) {
        return cdl::model::EnumerationValue(source.enumeration_value());
    } else {
        throw std::runtime_error("Corrupt or empty ScalarValue protocol buffer");
    }
}


void cdl::protocol::ConvertToProto(
    const cdl::model::ValueMap& source,
    google::protobuf::RepeatedPtrField<cdlproto::state::NamedValue>& target)
{
    target.Clear();
    for (const auto& entry : source) {
        auto nv = target.Add();
        nv->set_name(entry.first);
        ConvertToProto(entry.second, *nv->mutable_value());
    }
}


cdl::model::ValueMap cdl::protocol::FromProto(
    const google::protobuf::RepeatedPtrField<cdlproto::state::NamedValue>& source)
{
    cdl::model::ValueMap result;
    for (const auto& nv : source) {
        result[nv.name()] = FromProto(nv.value());
    }
    return result;
}
