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

#ifndef JPATCH_PATCH_H_
#define JPATCH_PATCH_H_

#include "json.h"
#include "pointer.h"
#include "status.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace jpatch {

// Why a patch was rejected. Index is the 0-based position of the
// failing operation, or -1 when the patch as a whole is malformed.
struct PatchError
{
    Status status = success;
    long index = -1;
    std::string detail;
    Json expected; // test_failed only
    Json actual; // test_failed only

    bool ok() const
    {
        return status == success;
    }

    std::string toString() const;
};

struct PatchOperation
{
    enum Op
    {
        Add,
        Remove,
        Replace,
        Move,
        Copy,
        Test
    };

    Op op = Add;
    JsonPointer path;
    JsonPointer from; // move and copy
    Json value; // add, replace and test

    static const char* OpToString(Op);
    static bool OpFromString(const std::string&, Op*);

    Json toJson() const;
};

/**
 * RFC 6902 JSON Patch.
 *
 * A patch is validated once, when it is parsed from its JSON form, and
 * then applied as a whole: operations run in order against a private
 * copy of the document and the copy is only handed back once every
 * operation succeeded. The input document is never modified.
 */
class Patch
{
  public:
    // Structural check only: the operations value must be an array of
    // objects with a known "op", a string "path" holding a valid
    // pointer, plus "value" or "from" as the kind requires.
    static PatchError validate(const Json& ops);
    static std::pair<PatchError, Patch> parse(const Json& ops);

    std::pair<PatchError, Json> apply(const Json& doc) const;

    Patch& add(const JsonPointer& path, Json value);
    Patch& remove(const JsonPointer& path);
    Patch& replace(const JsonPointer& path, Json value);
    Patch& move(const JsonPointer& from, const JsonPointer& path);
    Patch& copy(const JsonPointer& from, const JsonPointer& path);
    Patch& test(const JsonPointer& path, Json value);

    size_t size() const
    {
        return operations_.size();
    }

    bool empty() const
    {
        return operations_.empty();
    }

    const std::vector<PatchOperation>& operations() const
    {
        return operations_;
    }

    Json toJson() const;

  private:
    static PatchError applyOperation(Json& doc, const PatchOperation& op);

    std::vector<PatchOperation> operations_;
};

// Validates ops and applies them to doc in one call.
std::pair<PatchError, Json>
applyPatch(const Json& doc, const Json& ops);

} // namespace jpatch

#endif /* JPATCH_PATCH_H_ */
