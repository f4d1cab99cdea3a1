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

#include "pointer.h"

#include <cstdint>
#include <stdexcept>

namespace jpatch {

static std::string
quote(const std::string& s)
{
    return '"' + s + '"';
}

static std::string
describe(const Json& value)
{
    return Json::TypeToString(value.getType());
}

static void
explain(std::string* detail, const std::string& message)
{
    if (detail)
        *detail = message;
}

JsonPointer::JsonPointer()
{
}

JsonPointer::JsonPointer(const std::string& text)
{
    std::pair<bool, JsonPointer> res = parse(text);
    if (!res.first)
        throw std::invalid_argument("Invalid JSON Pointer: " + quote(text));
    tokens_ = std::move(res.second.tokens_);
}

std::pair<bool, JsonPointer>
JsonPointer::parse(const std::string& text)
{
    std::pair<bool, JsonPointer> res;
    res.first = false;
    if (text.empty()) {
        res.first = true;
        return res;
    }
    if (text[0] != '/')
        return res;
    size_t start = 1;
    for (;;) {
        size_t slash = text.find('/', start);
        std::string token;
        if (!unescape(text.substr(start, slash - start), token))
            return res;
        res.second.tokens_.emplace_back(std::move(token));
        if (slash == std::string::npos)
            break;
        start = slash + 1;
    }
    res.first = true;
    return res;
}

std::string
JsonPointer::escape(const std::string& token)
{
    std::string b;
    b.reserve(token.size());
    for (char c : token) {
        if (c == '~')
            b += "~0";
        else if (c == '/')
            b += "~1";
        else
            b += c;
    }
    return b;
}

// Decodes left to right, so "~01" is "~1" and never "/".
bool
JsonPointer::unescape(const std::string& raw, std::string& token)
{
    token.clear();
    token.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] != '~') {
            token += raw[i];
            continue;
        }
        if (i + 1 == raw.size())
            return false;
        switch (raw[++i]) {
            case '0':
                token += '~';
                break;
            case '1':
                token += '/';
                break;
            default:
                return false;
        }
    }
    return true;
}

const std::string&
JsonPointer::back() const
{
    if (tokens_.empty())
        throw std::logic_error("The root JSON Pointer has no last token.");
    return tokens_.back();
}

JsonPointer
JsonPointer::parent() const
{
    JsonPointer res;
    if (!tokens_.empty())
        res.tokens_.assign(tokens_.begin(), tokens_.end() - 1);
    return res;
}

JsonPointer
JsonPointer::append(const std::string& token) const
{
    JsonPointer res(*this);
    res.tokens_.push_back(token);
    return res;
}

JsonPointer
JsonPointer::append(size_t index) const
{
    return append(std::to_string(index));
}

bool
JsonPointer::isPrefixOf(const JsonPointer& other) const
{
    if (tokens_.size() >= other.tokens_.size())
        return false;
    for (size_t i = 0; i < tokens_.size(); ++i)
        if (tokens_[i] != other.tokens_[i])
            return false;
    return true;
}

std::string
JsonPointer::toString() const
{
    return prefix(tokens_.size());
}

std::string
JsonPointer::prefix(size_t count) const
{
    std::string b;
    for (size_t i = 0; i < count; ++i) {
        b += '/';
        b += escape(tokens_[i]);
    }
    return b;
}

bool
JsonPointer::operator==(const JsonPointer& other) const
{
    return tokens_ == other.tokens_;
}

bool
JsonPointer::operator!=(const JsonPointer& other) const
{
    return tokens_ != other.tokens_;
}

Status
JsonPointer::walk(const Json& root,
                  size_t count,
                  const Json** out,
                  std::string* detail) const
{
    const Json* node = &root;
    for (size_t i = 0; i < count; ++i) {
        const std::string& token = tokens_[i];
        if (node->isObject()) {
            const Json* child = node->getObject().find(token);
            if (!child) {
                explain(detail,
                        "no member " + quote(token) + " in " +
                          quote(prefix(i)));
                return pointer_not_found;
            }
            node = child;
        } else if (node->isArray()) {
            const std::vector<Json>& array = node->getArray();
            size_t index;
            if (parseIndex(token, &index) != success) {
                explain(detail,
                        quote(token) + " is not an index into the array at " +
                          quote(prefix(i)));
                return invalid_index;
            }
            if (index >= array.size()) {
                explain(detail,
                        "index " + token + " is out of bounds for the array of " +
                          std::to_string(array.size()) + " at " +
                          quote(prefix(i)));
                return invalid_index;
            }
            node = &array[index];
        } else {
            explain(detail,
                    "cannot look up " + quote(token) + " in the " +
                      describe(*node) + " at " + quote(prefix(i)));
            return not_container;
        }
    }
    *out = node;
    return success;
}

Status
JsonPointer::resolve(const Json& root,
                     const Json** out,
                     std::string* detail) const
{
    return walk(root, tokens_.size(), out, detail);
}

Status
JsonPointer::resolve(Json& root, Json** out, std::string* detail) const
{
    const Json* node;
    Status status = walk(root, tokens_.size(), &node, detail);
    if (status == success)
        *out = const_cast<Json*>(node);
    return status;
}

Status
JsonPointer::resolveParent(Json& root,
                           Json** container,
                           std::string* detail) const
{
    if (tokens_.empty()) {
        explain(detail, "the document root has no parent");
        return root_has_no_parent;
    }
    const Json* node;
    Status status = walk(root, tokens_.size() - 1, &node, detail);
    if (status != success)
        return status;
    if (!node->isContainer()) {
        explain(detail,
                "cannot look up " + quote(tokens_.back()) + " in the " +
                  describe(*node) + " at " + quote(prefix(tokens_.size() - 1)));
        return not_container;
    }
    *container = const_cast<Json*>(node);
    return success;
}

bool
JsonPointer::exists(const Json& root) const
{
    const Json* node;
    return walk(root, tokens_.size(), &node, nullptr) == success;
}

Status
parseIndex(const std::string& token, size_t* index)
{
    if (token.empty() || (token[0] == '0' && token.size() > 1))
        return invalid_index;
    size_t x = 0;
    for (char c : token) {
        if (c < '0' || c > '9')
            return invalid_index;
        size_t digit = c - '0';
        if (x > (SIZE_MAX - digit) / 10)
            x = SIZE_MAX;
        else
            x = x * 10 + digit;
    }
    *index = x;
    return success;
}

// Shared by every array write: "-" handling differs per primitive.
static Status
arrayIndex(const std::vector<Json>& array,
           const std::string& token,
           bool allowEnd,
           size_t* index,
           std::string* detail)
{
    if (token == "-") {
        if (!allowEnd) {
            explain(detail, "\"-\" does not name an existing array element");
            return invalid_index;
        }
        *index = array.size();
        return success;
    }
    if (parseIndex(token, index) != success) {
        explain(detail, quote(token) + " is not an array index");
        return invalid_index;
    }
    if (allowEnd ? *index > array.size() : *index >= array.size()) {
        explain(detail,
                "index " + token + " is out of bounds for an array of " +
                  std::to_string(array.size()));
        return index_out_of_range;
    }
    return success;
}

Status
insertAt(Json& container,
         const std::string& token,
         Json value,
         std::string* detail)
{
    if (container.isObject()) {
        container.getObject().set(token, std::move(value));
        return success;
    }
    if (container.isArray()) {
        std::vector<Json>& array = container.getArray();
        size_t index;
        Status status = arrayIndex(array, token, true, &index, detail);
        if (status != success)
            return status;
        array.insert(array.begin() + index, std::move(value));
        return success;
    }
    explain(detail,
            "cannot add " + quote(token) + " to a " + describe(container));
    return not_container;
}

Status
removeAt(Json& container,
         const std::string& token,
         Json* removed,
         std::string* detail)
{
    if (container.isObject()) {
        JsonObject& object = container.getObject();
        Json* member = object.find(token);
        if (!member) {
            explain(detail, "no member " + quote(token) + " to remove");
            return key_not_found;
        }
        if (removed)
            *removed = std::move(*member);
        object.erase(token);
        return success;
    }
    if (container.isArray()) {
        std::vector<Json>& array = container.getArray();
        size_t index;
        Status status = arrayIndex(array, token, false, &index, detail);
        if (status != success)
            return status;
        if (removed)
            *removed = std::move(array[index]);
        array.erase(array.begin() + index);
        return success;
    }
    explain(detail,
            "cannot remove " + quote(token) + " from a " + describe(container));
    return not_container;
}

Status
replaceAt(Json& container,
          const std::string& token,
          Json value,
          std::string* detail)
{
    if (container.isObject()) {
        Json* member = container.getObject().find(token);
        if (!member) {
            explain(detail, "no member " + quote(token) + " to replace");
            return key_not_found;
        }
        *member = std::move(value);
        return success;
    }
    if (container.isArray()) {
        std::vector<Json>& array = container.getArray();
        size_t index;
        Status status = arrayIndex(array, token, false, &index, detail);
        if (status != success)
            return status;
        array[index] = std::move(value);
        return success;
    }
    explain(detail,
            "cannot replace " + quote(token) + " in a " + describe(container));
    return not_container;
}

} // namespace jpatch
