/**
\file
\brief Main header file for cdl::protobuf.
\copyright
    Copyright 2024-present, the CDL engine contributors.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef CDL_PROTOBUF_HPP
#define CDL_PROTOBUF_HPP

#include <stdexcept>
#include <string>

#ifdef _MSC_VER
#   pragma warning(push, 0)
#endif
#include <google/protobuf/message_lite.h>
#ifdef _MSC_VER
#   pragma warning(pop)
#endif


namespace cdl
{

/// Functions for serialising Protobuf messages to byte strings.
namespace protobuf
{


/**
\brief  Serializes a Protobuf message into a byte string.

Any existing contents of `target` will be replaced.

\throws SerializationException on failure.
*/
void SerializeToString(
    const google::protobuf::MessageLite& source,
    std::string& target);


/**
\brief  Deserializes a Protobuf message from a byte string.
\throws SerializationException on failure.
*/
void ParseFromString(
    const std::string& source,
    google::protobuf::MessageLite& target);


/// Exception that signals failure to serialize or deserialize a message.
class SerializationException : public std::runtime_error
{
public:
    explicit SerializationException(const std::string& msg);
};


}}      // namespace
#endif  // header guard
