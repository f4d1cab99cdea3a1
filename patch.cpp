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

#include "patch.h"
#include "log.h"

#include <stdexcept>

namespace jpatch {

static PatchError
fail(Status status, std::string detail)
{
    PatchError err;
    err.status = status;
    err.detail = std::move(detail);
    return err;
}

static PatchError
malformed(long index, const std::string& reason)
{
    PatchError err = fail(malformed_patch, reason);
    err.index = index;
    return err;
}

static PatchError
located(Status status, const char* member, const JsonPointer& where,
        const std::string& detail)
{
    return fail(status,
                std::string(member) + " \"" + where.toString() + "\": " +
                  detail);
}

std::string
PatchError::toString() const
{
    std::string b;
    if (index >= 0) {
        b += "operation ";
        b += std::to_string(index);
        b += ": ";
    }
    b += StatusToString(status);
    if (!detail.empty()) {
        b += ": ";
        b += detail;
    }
    if (status == test_failed) {
        b += " (expected ";
        b += expected.toString();
        b += ", actual ";
        b += actual.toString();
        b += ')';
    }
    return b;
}

const char*
PatchOperation::OpToString(Op op)
{
    switch (op) {
        case Add:
            return "add";
        case Remove:
            return "remove";
        case Replace:
            return "replace";
        case Move:
            return "move";
        case Copy:
            return "copy";
        case Test:
            return "test";
        default:
            throw std::logic_error("Unhandled patch operation.");
    }
}

bool
PatchOperation::OpFromString(const std::string& s, Op* op)
{
    static const Op kOps[] = { Add, Remove, Replace, Move, Copy, Test };
    for (Op candidate : kOps) {
        if (s == OpToString(candidate)) {
            *op = candidate;
            return true;
        }
    }
    return false;
}

Json
PatchOperation::toJson() const
{
    Json res;
    res["op"] = OpToString(op);
    if (op == Move || op == Copy)
        res["from"] = from.toString();
    res["path"] = path.toString();
    if (op == Add || op == Replace || op == Test)
        res["value"] = value;
    return res;
}

// Reads member name of an operation object as a JSON Pointer.
static bool
readPointer(const Json& object,
            const char* name,
            long index,
            JsonPointer* out,
            PatchError* err)
{
    const Json* member = object.getObject().find(name);
    if (!member) {
        *err = malformed(index, std::string("missing \"") + name + "\" member");
        return false;
    }
    if (!member->isString()) {
        *err = malformed(index,
                         std::string("\"") + name + "\" must be a string, got " +
                           Json::TypeToString(member->getType()));
        return false;
    }
    std::pair<bool, JsonPointer> ptr = JsonPointer::parse(member->getString());
    if (!ptr.first) {
        *err = malformed(index,
                         std::string("\"") + name +
                           "\" is not a valid JSON Pointer: \"" +
                           member->getString() + "\"");
        return false;
    }
    *out = std::move(ptr.second);
    return true;
}

std::pair<PatchError, Patch>
Patch::parse(const Json& ops)
{
    std::pair<PatchError, Patch> res;
    if (!ops.isArray()) {
        res.first = malformed(-1,
                              std::string("patch must be an array, got ") +
                                Json::TypeToString(ops.getType()));
        return res;
    }
    const std::vector<Json>& array = ops.getArray();
    res.second.operations_.reserve(array.size());
    for (size_t i = 0; i < array.size(); ++i) {
        const Json& item = array[i];
        long index = static_cast<long>(i);
        if (!item.isObject()) {
            res.first = malformed(index,
                                  std::string("operation must be an object, got ") +
                                    Json::TypeToString(item.getType()));
            return res;
        }
        const JsonObject& object = item.getObject();
        PatchOperation op;

        const Json* name = object.find("op");
        if (!name) {
            res.first = malformed(index, "missing \"op\" member");
            return res;
        }
        if (!name->isString()) {
            res.first = malformed(index, "\"op\" must be a string");
            return res;
        }
        if (!PatchOperation::OpFromString(name->getString(), &op.op)) {
            res.first = malformed(index,
                                  "unknown operation \"" + name->getString() +
                                    "\"");
            return res;
        }

        if (!readPointer(item, "path", index, &op.path, &res.first))
            return res;

        switch (op.op) {
            case PatchOperation::Add:
            case PatchOperation::Replace:
            case PatchOperation::Test: {
                const Json* value = object.find("value");
                if (!value) {
                    res.first = malformed(
                      index,
                      std::string("\"") + PatchOperation::OpToString(op.op) +
                        "\" requires a \"value\" member");
                    return res;
                }
                op.value = *value;
                break;
            }
            case PatchOperation::Move:
            case PatchOperation::Copy:
                if (!readPointer(item, "from", index, &op.from, &res.first))
                    return res;
                break;
            case PatchOperation::Remove:
                break;
        }
        res.second.operations_.emplace_back(std::move(op));
    }
    return res;
}

PatchError
Patch::validate(const Json& ops)
{
    return parse(ops).first;
}

// Adding at the root replaces the whole document.
static Status
addValue(Json& doc, const JsonPointer& path, Json value, std::string* detail)
{
    if (path.isRoot()) {
        doc = std::move(value);
        return success;
    }
    Json* container;
    Status status = path.resolveParent(doc, &container, detail);
    if (status != success)
        return status;
    return insertAt(*container, path.back(), std::move(value), detail);
}

PatchError
Patch::applyOperation(Json& doc, const PatchOperation& op)
{
    std::string detail;
    Status status;
    switch (op.op) {
        case PatchOperation::Add:
            status = addValue(doc, op.path, op.value, &detail);
            if (status != success)
                return located(status, "path", op.path, detail);
            return PatchError();

        case PatchOperation::Remove: {
            Json* container;
            status = op.path.resolveParent(doc, &container, &detail);
            if (status == success)
                status = removeAt(*container, op.path.back(), nullptr, &detail);
            if (status != success)
                return located(status, "path", op.path, detail);
            return PatchError();
        }

        case PatchOperation::Replace: {
            if (op.path.isRoot()) {
                doc = op.value;
                return PatchError();
            }
            Json* container;
            status = op.path.resolveParent(doc, &container, &detail);
            if (status == success)
                status = replaceAt(*container, op.path.back(), op.value, &detail);
            if (status != success)
                return located(status, "path", op.path, detail);
            return PatchError();
        }

        case PatchOperation::Move: {
            if (op.from.isPrefixOf(op.path))
                return located(invalid_move,
                               "from",
                               op.from,
                               "cannot move a value into its own child \"" +
                                 op.path.toString() + "\"");
            const Json* source;
            status = op.from.resolve(doc, &source, &detail);
            if (status != success)
                return located(status, "from", op.from, detail);
            if (op.from == op.path)
                return PatchError();
            Json value;
            Json* container;
            status = op.from.resolveParent(doc, &container, &detail);
            if (status == success)
                status = removeAt(*container, op.from.back(), &value, &detail);
            if (status != success)
                return located(status, "from", op.from, detail);
            status = addValue(doc, op.path, std::move(value), &detail);
            if (status != success)
                return located(status, "path", op.path, detail);
            return PatchError();
        }

        case PatchOperation::Copy: {
            const Json* source;
            status = op.from.resolve(doc, &source, &detail);
            if (status != success)
                return located(status, "from", op.from, detail);
            Json value(*source);
            status = addValue(doc, op.path, std::move(value), &detail);
            if (status != success)
                return located(status, "path", op.path, detail);
            return PatchError();
        }

        case PatchOperation::Test: {
            const Json* actual;
            status = op.path.resolve(doc, &actual, &detail);
            if (status != success)
                return located(status, "path", op.path, detail);
            if (*actual != op.value) {
                PatchError err = located(test_failed,
                                         "path",
                                         op.path,
                                         "value does not match");
                err.expected = op.value;
                err.actual = *actual;
                return err;
            }
            return PatchError();
        }

        default:
            throw std::logic_error("Unhandled patch operation.");
    }
}

std::pair<PatchError, Json>
Patch::apply(const Json& doc) const
{
    std::pair<PatchError, Json> res;
    Json working(doc);
    for (size_t i = 0; i < operations_.size(); ++i) {
        const PatchOperation& op = operations_[i];
        PatchError err = applyOperation(working, op);
        if (!err.ok()) {
            err.index = static_cast<long>(i);
            JPATCH_INFO("patch rejected: %s\n", err.toString().c_str());
            res.first = std::move(err);
            return res;
        }
        JPATCH_TRACE("applied %s %s\n",
                     PatchOperation::OpToString(op.op),
                     op.path.toString().c_str());
    }
    res.second = std::move(working);
    return res;
}

Patch&
Patch::add(const JsonPointer& path, Json value)
{
    PatchOperation op;
    op.op = PatchOperation::Add;
    op.path = path;
    op.value = std::move(value);
    operations_.emplace_back(std::move(op));
    return *this;
}

Patch&
Patch::remove(const JsonPointer& path)
{
    PatchOperation op;
    op.op = PatchOperation::Remove;
    op.path = path;
    operations_.emplace_back(std::move(op));
    return *this;
}

Patch&
Patch::replace(const JsonPointer& path, Json value)
{
    PatchOperation op;
    op.op = PatchOperation::Replace;
    op.path = path;
    op.value = std::move(value);
    operations_.emplace_back(std::move(op));
    return *this;
}

Patch&
Patch::move(const JsonPointer& from, const JsonPointer& path)
{
    PatchOperation op;
    op.op = PatchOperation::Move;
    op.from = from;
    op.path = path;
    operations_.emplace_back(std::move(op));
    return *this;
}

Patch&
Patch::copy(const JsonPointer& from, const JsonPointer& path)
{
    PatchOperation op;
    op.op = PatchOperation::Copy;
    op.from = from;
    op.path = path;
    operations_.emplace_back(std::move(op));
    return *this;
}

Patch&
Patch::test(const JsonPointer& path, Json value)
{
    PatchOperation op;
    op.op = PatchOperation::Test;
    op.path = path;
    op.value = std::move(value);
    operations_.emplace_back(std::move(op));
    return *this;
}

Json
Patch::toJson() const
{
    Json res;
    res.setArray();
    for (const PatchOperation& op : operations_)
        res.getArray().emplace_back(op.toJson());
    return res;
}

std::pair<PatchError, Json>
applyPatch(const Json& doc, const Json& ops)
{
    std::pair<PatchError, Patch> patch = Patch::parse(ops);
    if (!patch.first.ok()) {
        JPATCH_INFO("patch rejected: %s\n", patch.first.toString().c_str());
        return std::make_pair(std::move(patch.first), Json());
    }
    return patch.second.apply(doc);
}

} // namespace jpatch
