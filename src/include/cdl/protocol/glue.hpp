/**
\file
\brief  Glue code that relates public APIs and the snapshot format.
\copyright
    Copyright 2024-present, the CDL engine contributors.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef CDL_PROTOCOL_GLUE_HPP
#define CDL_PROTOCOL_GLUE_HPP

#include <cdl/model.hpp>

#ifdef _MSC_VER
#   pragma warning(push, 0)
#endif
#include <state.pb.h>
#ifdef _MSC_VER
#   pragma warning(pop)
#endif


namespace cdl
{
namespace protocol
{


/// Converts a ScalarValue to a protocol buffer (in place).
void ConvertToProto(
    const cdl::model::ScalarValue& source,
    cdlproto::state::ScalarValue& target);


/**
\brief  Converts a protocol buffer to a ScalarValue.
\throws std::runtime_error if the buffer holds no value.
*/
cdl::model::ScalarValue FromProto(const cdlproto::state::ScalarValue& source);


/// Converts a ValueMap to a sequence of NamedValue protocol buffers.
void ConvertToProto(
    const cdl::model::ValueMap& source,
    google::protobuf::RepeatedPtrField<cdlproto::state::NamedValue>& target);


/// Converts a sequence of NamedValue protocol buffers to a ValueMap.
cdl::model::ValueMap FromProto(
    const google::protobuf::RepeatedPtrField<cdlproto::state::NamedValue>& source);


}}      // namespace
#endif  // header guard
