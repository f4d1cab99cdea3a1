// -*- mode:c++;indent-tabs-mode:nil;c-basic-offset:4;coding:utf-8 -*-
// vi: set et ft=cpp ts=4 sts=4 sw=4 fenc=utf-8 :vi
//
// Copyright 2024 Mozilla Foundation
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

#include "json.h"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

#define ARRAYLEN(A) \
    ((sizeof(A) / sizeof(*(A))) / ((unsigned)!(sizeof(A) % sizeof(*(A)))))

#define STRING(sl) std::string(sl, sizeof(sl) - 1)

using jpatch::Json;
using jpatch::JsonObject;

#define BENCH(ITERATIONS, WORK_PER_RUN, CODE) \
    do { \
        auto start = std::chrono::high_resolution_clock::now(); \
        for (int __i = 0; __i < ITERATIONS; ++__i) { \
            std::atomic_signal_fence(std::memory_order_acq_rel); \
            CODE; \
        } \
        auto end = std::chrono::high_resolution_clock::now(); \
        auto duration = \
          std::chrono::duration_cast<std::chrono::nanoseconds>(end - start); \
        long long work = (WORK_PER_RUN) * (ITERATIONS); \
        double nanos = (duration.count() + work - 1) / (double)work; \
        printf("%10g ns %2dx %s\n", nanos, (ITERATIONS), #CODE); \
    } while (0)

static Json
parseOrDie(const std::string& text, int code)
{
    std::pair<Json::Status, Json> res = Json::parse(text);
    if (res.first != Json::success) {
        printf("error: Json::parse returned Json::%s: %s\n",
               Json::StatusToString(res.first),
               text.c_str());
        exit(code);
    }
    return res.second;
}

void
object_test()
{
    Json obj;
    obj["content"] = "hello";
    if (obj.toString() != "{\"content\":\"hello\"}")
        exit(1);
}

void
deep_test()
{
    Json A1;
    A1[0] = 0;
    A1[1] = 10;
    A1[2] = 20;
    A1[3] = 3.14;
    A1[4] = 40;
    Json A2;
    A2[0] = std::move(A1);
    Json A3;
    A3[0] = std::move(A2);
    Json obj;
    obj["content"] = std::move(A3);
    if (obj.toString() != "{\"content\":[[[0,10,20,3.14,40]]]}")
        exit(2);
}

void
parse_test()
{
    std::pair<Json::Status, Json> res =
      Json::parse("{ \"content\":[[[0,10,20,3.14,40]]]}");
    if (res.first != Json::success)
        exit(3);
    if (res.second.toString() != "{\"content\":[[[0,10,20,3.14,40]]]}")
        exit(4);
    if (res.second.toStringPretty() !=
        R"({"content": [[[0, 10, 20, 3.14, 40]]]})")
        exit(5);
    res = Json::parse("{ \"a\": 1, \"b\": [2,   3]}");
    if (res.second.toString() != R"({"a":1,"b":[2,3]})")
        exit(6);
    if (res.second.toStringPretty() !=
        R"({
  "a": 1,
  "b": [2, 3]
})")
        exit(7);
}

void
insertion_order_test()
{
    Json json = parseOrDie(R"({"zeta":1,"alpha":2,"mid":{"y":0,"x":1}})", 20);
    if (json.toString() != R"({"zeta":1,"alpha":2,"mid":{"y":0,"x":1}})")
        exit(21);
    json["beta"] = 3;
    json["zeta"] = 9;
    if (json.toString() !=
        R"({"zeta":9,"alpha":2,"mid":{"y":0,"x":1},"beta":3})")
        exit(22);
    if (!json.getObject().erase("alpha") || json.getObject().erase("alpha"))
        exit(23);
    if (json.toString() != R"({"zeta":9,"mid":{"y":0,"x":1},"beta":3})")
        exit(24);
}

void
duplicate_key_test()
{
    // first position, last value
    Json json = parseOrDie(R"({"a":1,"b":2,"a":3})", 30);
    if (json.getObject().size() != 2)
        exit(31);
    if (json.toString() != R"({"a":3,"b":2})")
        exit(32);
}

void
object_members_test()
{
    JsonObject obj;
    if (!obj.empty() || obj.find("k"))
        exit(40);
    if (!obj.set("k", Json(1)))
        exit(41);
    if (obj.set("k", Json(2)))
        exit(42);
    if (obj.size() != 1 || obj.find("k")->getLong() != 2)
        exit(43);
    obj["other"] = "x";
    if (!obj.contains("other") || obj.size() != 2)
        exit(44);
    size_t n = 0;
    for (const JsonObject::value_type& member : obj) {
        if (n == 0 && member.first != "k")
            exit(45);
        if (n == 1 && member.first != "other")
            exit(46);
        ++n;
    }
    obj.clear();
    if (!obj.empty())
        exit(47);
}

static const int kManyKeys = 50000;

static std::string
manyKeys(bool reversed)
{
    std::string b = "{";
    for (int i = 0; i < kManyKeys; ++i) {
        int k = reversed ? kManyKeys - 1 - i : i;
        if (i)
            b += ',';
        b += "\"key";
        b += std::to_string(k);
        b += "\":";
        b += std::to_string(k);
    }
    b += '}';
    return b;
}

void
many_keys_test()
{
    Json forward = parseOrDie(manyKeys(false), 100);
    Json backward = parseOrDie(manyKeys(true), 100);
    JsonObject& obj = forward.getObject();
    if (obj.size() != (size_t)kManyKeys)
        exit(101);
    if (obj.begin()->first != "key0" || backward.getObject().begin()->first !=
                                          "key" + std::to_string(kManyKeys - 1))
        exit(102);
    if (forward != backward || backward != forward)
        exit(103);
    // erasing renumbers the members behind it
    if (!obj.erase("key100"))
        exit(104);
    if (obj.find("key100") || obj.find("key101")->getLong() != 101 ||
        obj.find("key99")->getLong() != 99)
        exit(105);
    if ((obj.begin() + 100)->first != "key101")
        exit(106);
    if (forward == backward)
        exit(107);
    if (!obj.set("key100", Json(100)) || (obj.end() - 1)->first != "key100")
        exit(108);
    if (forward != backward)
        exit(109);
    Json copy(forward);
    copy["key7"] = "seven";
    if (copy.getObject().find("key7")->getString() != "seven" ||
        forward["key7"].getLong() != 7)
        exit(110);
}

void
equality_test()
{
    // member order is irrelevant, array order is not
    if (parseOrDie(R"({"a":1,"b":[1,2]})", 50) !=
        parseOrDie(R"({"b":[1,2],"a":1})", 50))
        exit(51);
    if (parseOrDie("[1,2]", 50) == parseOrDie("[2,1]", 50))
        exit(52);
    // numbers compare by value
    if (Json(1) != Json(1.0))
        exit(53);
    if (Json(1.0) != Json(1))
        exit(54);
    if (Json(1) == Json(1.5))
        exit(55);
    if (parseOrDie("10", 50) != parseOrDie("1e1", 50))
        exit(56);
    // kinds never mix
    if (Json(0) == Json(false))
        exit(57);
    if (Json() == Json(""))
        exit(58);
    if (Json("1") == Json(1))
        exit(59);
    if (parseOrDie("{}", 50) == parseOrDie("[]", 50))
        exit(60);
    if (parseOrDie(R"({"a":1})", 50) == parseOrDie(R"({"a":1,"b":2})", 50))
        exit(61);
    if (parseOrDie(R"({"a":null})", 50) == parseOrDie(R"({"b":null})", 50))
        exit(62);
    if (Json() != Json(nullptr))
        exit(63);
}

void
copy_test()
{
    Json src = parseOrDie(R"({"list":[1,2],"inner":{"k":"v"}})", 70);
    Json dup(src);
    dup["list"][0] = 100;
    dup["inner"]["k"] = "changed";
    if (src.toString() != R"({"list":[1,2],"inner":{"k":"v"}})")
        exit(71);
    if (dup.toString() != R"({"list":[100,2],"inner":{"k":"changed"}})")
        exit(72);
    Json moved(std::move(dup));
    if (!dup.isNull() || moved["list"][0].getLong() != 100)
        exit(73);
}

void
assign_descendant_test()
{
    Json json = parseOrDie(R"({"a":{"b":[1,{"c":true}]}})", 80);
    json = json["a"]["b"][1];
    if (json.toString() != R"({"c":true})")
        exit(81);
    json = parseOrDie(R"({"a":{"b":"x"}})", 80);
    json = std::move(json["a"]);
    if (json.toString() != R"({"b":"x"})")
        exit(82);
}

void
accessor_test()
{
    Json json = parseOrDie(R"({"s":"text","n":3})", 90);
    bool thrown = false;
    try {
        json["s"].getLong();
    } catch (const std::logic_error&) {
        thrown = true;
    }
    if (!thrown)
        exit(91);
    if (json["n"].getNumber() != 3)
        exit(92);
    if (!json.contains("s") || json.contains("missing"))
        exit(93);
    if (std::string(Json::TypeToString(json.getType())) != "object")
        exit(94);
    if (std::string(Json::TypeToString(Json(2.5).getType())) != "number")
        exit(95);
}

static const struct
{
    std::string before;
    std::string after;
} kRoundTrip[] = {

    // types
    { "0", "0" },
    { "[]", "[]" },
    { "{}", "{}" },
    { "0.1", "0.1" },
    { "\"\"", "\"\"" },
    { "null", "null" },
    { "true", "true" },
    { "false", "false" },

    // member order survives
    { R"({"b":1,"a":2})", R"({"b":1,"a":2})" },
    { " { \"~\" : \"/\" } ", R"({"~":"\/"})" },

    // valid utf16 sequences
    { " [\"\\u0020\"] ", "[\" \"]" },
    { " [\"\\u00A0\"] ", "[\"\\u00a0\"]" },

    // invalid utf16 sequences are echoed as ascii
    { "[\"\\uDFAA\"]", "[\"\\\\uDFAA\"]" },
    { " [\"\\ud800\"] ", "[\"\\\\ud800\"]" },

    // underflow and overflow
    { " [123.456e-789] ", "[0]" },
    { " [1.5e+9999] ", "[1e5000]" },
    { " [-123123123123123123123123123123] ", "[-1.2312312312312312e+29]" },
};

void
round_trip_test()
{
    for (size_t i = 0; i < ARRAYLEN(kRoundTrip); ++i) {
        std::pair<Json::Status, Json> res = Json::parse(kRoundTrip[i].before);
        if (res.first != Json::success) {
            printf(
              "error: Json::parse returned Json::%s but wanted Json::%s: %s\n",
              Json::StatusToString(res.first),
              Json::StatusToString(Json::success),
              kRoundTrip[i].before.c_str());
            exit(10);
        }
        if (res.second.toString() != kRoundTrip[i].after) {
            printf("error: Json::parse(%s).toString() was %s but should have "
                   "been %s\n",
                   kRoundTrip[i].before.c_str(),
                   res.second.toString().c_str(),
                   kRoundTrip[i].after.c_str());
            exit(11);
        }
    }
}

// https://github.com/nst/JSONTestSuite/
static const struct
{
    Json::Status error;
    std::string json;
} kJsonTestSuite[] = {
    { Json::absent_value, "" },
    { Json::trailing_content, "[] []" },
    { Json::illegal_character, "[nan]" },
    { Json::bad_negative, "[-nan]" },
    { Json::unexpected_octal, "{\"Numbers cannot have leading zeroes\": 013}" },
    { Json::depth_exceeded,
      "[[[[[[[[[[[[[[[[[[[[\"Too deep\"]]]]]]]]]]]]]]]]]]]]" },
    { Json::missing_colon, "{\"Missing colon\" null}" },
    { Json::unexpected_colon, "{\"Double colon\":: null}" },
    { Json::unexpected_comma, "{\"Comma instead of colon\", null}" },
    { Json::non_del_c0_control_code_in_string, "[\"line\nbreak\"]" },
    { Json::invalid_escape_character, "[\"line\\\nbreak\"]" },
    { Json::bad_exponent, "[0e]" },
    { Json::unexpected_eof, "[\"Unclosed array\"" },
    { Json::unexpected_end_of_object, "[\"mismatch\"}" },
    { Json::illegal_character, "{unquoted_key: \"keys must be quoted\"}" },
    { Json::unexpected_end_of_array, "[\"extra comma\",]" },
    { Json::unexpected_end_of_object, "{\"Extra comma\": true,}" },
    { Json::object_key_must_be_string, " {\"a\":\"a\" 123} " },
    { Json::bad_double, " [1.] " },
    { Json::missing_comma, " [1 true] " },
    { Json::illegal_character, STRING("\x00") },
    { Json::malformed_utf8, " [\"\xe0\xff\"] " },
    { Json::overlong_ascii, " [\"\xc0\xaf\"] " },
    { Json::c1_control_code_in_string, " [\"\x81\"] " },
    { Json::success,
      R"([[[[[[[[[[[[[[[[[[["Not too deep"]]]]]]]]]]]]]]]]]]])" },
    { Json::success, R"({
    "name": "Alice",
    "age": 20,
    "tags": ["x", "y"],
    "profile": {"city": "Seoul"}
}
)" },
};

void
json_test_suite()
{
    for (size_t i = 0; i < ARRAYLEN(kJsonTestSuite); ++i) {
        std::pair<Json::Status, Json> res = Json::parse(kJsonTestSuite[i].json);
        if (res.first != kJsonTestSuite[i].error) {
            printf(
              "error: Json::parse returned Json::%s but wanted Json::%s: %s\n",
              Json::StatusToString(res.first),
              Json::StatusToString(kJsonTestSuite[i].error),
              kJsonTestSuite[i].json.c_str());
            exit(12);
        }
    }
}

int
main()
{
    object_test();
    deep_test();
    parse_test();
    insertion_order_test();
    duplicate_key_test();
    object_members_test();
    many_keys_test();
    equality_test();
    copy_test();
    assign_descendant_test();
    accessor_test();
    round_trip_test();
    json_test_suite();

    BENCH(2000, 1, object_test());
    BENCH(2000, 1, deep_test());
    BENCH(2000, 1, parse_test());
    BENCH(2000, 1, equality_test());
    BENCH(20, kManyKeys, many_keys_test());
    BENCH(2000, 1, round_trip_test());
    BENCH(2000, 1, json_test_suite());
}
