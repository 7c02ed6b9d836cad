// Copyright 2024 Robert A. Dunnagan
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <sstream>

#define ASSERT(cond) { if (!(cond)) throw ::jsondoc::Assert{#cond}; }

#include <cpptrace/cpptrace.hpp>

namespace jsondoc {

class JsonDocException : public cpptrace::exception_with_message
{
  public:
    JsonDocException(std::string&& msg) : cpptrace::exception_with_message(std::forward<std::string>(msg)) {}
    JsonDocException() : JsonDocException{""} {}
};

class Assert : public cpptrace::exception_with_message
{
  public:
    Assert(std::string&& msg) : cpptrace::exception_with_message(std::forward<std::string>(msg)) {}
};

struct WrongType : public JsonDocException
{
    static std::string make_message(const std::string_view& actual) {
        std::stringstream ss;
        ss << "type=" << actual;
        return ss.str();
    }

    static std::string make_message(const std::string_view& actual, const std::string_view& expected) {
        std::stringstream ss;
        ss << "type=" << actual << ", expected=" << expected;
        return ss.str();
    }

    WrongType(const std::string_view& actual) : JsonDocException(make_message(actual)) {}
    WrongType(const std::string_view& actual, const std::string_view& expected) : JsonDocException(make_message(actual, expected)) {}
};

} // namespace jsondoc
