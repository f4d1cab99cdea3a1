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

// Example usage of the jpatch library
//
// Run without arguments to walk through pointers and patches on a
// small document. Run as
//
//     jpatch_example document.json patch.json
//
// to apply a patch file to a document file. The patched document is
// printed to stdout; on failure the error goes to stderr and the exit
// status is 1.

#include "../json.h"
#include "../patch.h"
#include "../pointer.h"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using jpatch::Json;
using jpatch::JsonPointer;
using jpatch::Patch;
using jpatch::PatchError;

static const char kDocument[] = R"({
    "name": "Alice",
    "age": 20,
    "tags": ["x", "y"],
    "profile": {"city": "Seoul"}
})";

static Json
document()
{
    std::pair<Json::Status, Json> res = Json::parse(kDocument);
    if (res.first != Json::success) {
        std::cerr << "Parse error: " << Json::StatusToString(res.first)
                  << std::endl;
        exit(1);
    }
    return res.second;
}

// Example 1: Resolve JSON Pointers
void example_pointer()
{
    std::cout << "\n=== Example 1: JSON Pointers ===" << std::endl;

    Json doc = document();
    const char* pointers[] = { "", "/name", "/tags/1", "/profile/city",
                               "/tags/7", "/nope" };
    for (const char* text : pointers) {
        JsonPointer ptr(text);
        const Json* found;
        jpatch::Status status = ptr.resolve(doc, &found);
        std::cout << "  \"" << text << "\" -> ";
        if (status == jpatch::success)
            std::cout << found->toString() << std::endl;
        else
            std::cout << jpatch::StatusToString(status) << std::endl;
    }

    std::cout << "  escape(\"a/b~c\") = \"" << JsonPointer::escape("a/b~c")
              << "\"" << std::endl;
}

// Example 2: Apply a patch parsed from JSON text
void example_apply()
{
    std::cout << "\n=== Example 2: Applying a Patch ===" << std::endl;

    std::pair<Json::Status, Json> ops = Json::parse(R"([
        {"op": "replace", "path": "/name", "value": "Bob"},
        {"op": "add", "path": "/tags/-", "value": "z"},
        {"op": "move", "from": "/age", "path": "/profile/age"}
    ])");
    if (ops.first != Json::success) {
        std::cerr << "Parse error: " << Json::StatusToString(ops.first)
                  << std::endl;
        return;
    }

    Json doc = document();
    std::pair<PatchError, Json> res = jpatch::applyPatch(doc, ops.second);
    if (!res.first.ok()) {
        std::cerr << "Patch error: " << res.first.toString() << std::endl;
        return;
    }
    std::cout << "Before:" << std::endl;
    std::cout << doc.toStringPretty() << std::endl;
    std::cout << "After:" << std::endl;
    std::cout << res.second.toStringPretty() << std::endl;
}

// Example 3: Build a patch in code
void example_builder()
{
    std::cout << "\n=== Example 3: Building a Patch ===" << std::endl;

    Patch patch;
    patch.test(JsonPointer("/name"), "Alice")
      .copy(JsonPointer("/profile"), JsonPointer("/home"))
      .replace(JsonPointer("/home/city"), "Busan")
      .remove(JsonPointer("/tags/0"));

    std::cout << "Patch:" << std::endl;
    std::cout << patch.toJson().toStringPretty() << std::endl;

    std::pair<PatchError, Json> res = patch.apply(document());
    if (!res.first.ok()) {
        std::cerr << "Patch error: " << res.first.toString() << std::endl;
        return;
    }
    std::cout << "Result:" << std::endl;
    std::cout << res.second.toStringPretty() << std::endl;
}

// Example 4: Failures leave the document untouched
void example_errors()
{
    std::cout << "\n=== Example 4: Error Handling ===" << std::endl;

    Json doc = document();
    const char* patches[] = {
        R"([{"op": "remove", "path": "/tags/5"}])",
        R"([{"op": "add", "path": "/x"}])",
        R"([{"op": "test", "path": "/age", "value": 21}])",
        R"([{"op": "move", "from": "/profile", "path": "/profile/inner"}])",
        R"([{"op": "add", "path": "/a", "value": 1},
            {"op": "remove", "path": "/missing"}])",
    };
    for (const char* text : patches) {
        std::pair<PatchError, Json> res =
          jpatch::applyPatch(doc, Json::parse(text).second);
        if (res.first.ok())
            std::cout << "  applied (unexpected!)" << std::endl;
        else
            std::cout << "  " << res.first.toString() << std::endl;
    }
    std::cout << "Document is still:" << std::endl;
    std::cout << doc.toString() << std::endl;
}

static bool
readJson(const char* path, Json* out)
{
    std::ifstream in(path);
    if (!in) {
        std::cerr << path << ": cannot open" << std::endl;
        return false;
    }
    std::stringstream buf;
    buf << in.rdbuf();
    std::pair<Json::Status, Json> res = Json::parse(buf.str());
    if (res.first != Json::success) {
        std::cerr << path << ": " << Json::StatusToString(res.first)
                  << std::endl;
        return false;
    }
    *out = std::move(res.second);
    return true;
}

static int
patchFiles(const char* documentPath, const char* patchPath)
{
    Json doc;
    Json ops;
    if (!readJson(documentPath, &doc) || !readJson(patchPath, &ops))
        return 1;
    std::pair<PatchError, Json> res = jpatch::applyPatch(doc, ops);
    if (!res.first.ok()) {
        std::cerr << patchPath << ": " << res.first.toString() << std::endl;
        return 1;
    }
    std::cout << res.second.toStringPretty() << std::endl;
    return 0;
}

int main(int argc, char* argv[])
{
    if (argc == 3)
        return patchFiles(argv[1], argv[2]);
    if (argc != 1) {
        std::cerr << "usage: " << argv[0] << " [document.json patch.json]"
                  << std::endl;
        return 1;
    }

    std::cout << "JSON Patch Example Program" << std::endl;
    std::cout << "==========================" << std::endl;

    example_pointer();
    example_apply();
    example_builder();
    example_errors();

    std::cout << "\nAll examples completed!" << std::endl;
    return 0;
}
