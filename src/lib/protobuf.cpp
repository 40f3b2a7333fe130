/*
Copyright 2024-present, the CDL engine contributors.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include <cdl/protobuf.hpp>


void cdl::protobuf::SerializeToString(
    const google::protobuf::MessageLite& source,
    std::string& target)
{
    target.clear();
    if (!source.SerializeToString(&target)) {
        throw SerializationException("Failed to serialize message");
    }
}


void cdl::protobuf::ParseFromString(
    const std::string& source,
    google::protobuf::MessageLite& target)
{
    if (!target.ParseFromString(source)) {
        throw SerializationException("Failed to parse message");
    }
}


cdl::protobuf::SerializationException::SerializationException(const std::string& msg)
    : std::runtime_error(msg)
{
}
