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

#ifndef JPATCH_POINTER_H_
#define JPATCH_POINTER_H_

#include "json.h"
#include "status.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace jpatch {

/**
 * RFC 6901 JSON Pointer.
 *
 * A pointer is a sequence of decoded reference tokens. The empty
 * sequence refers to the whole document. Tokens are interpreted when
 * resolved: as member names inside objects, as decimal indices inside
 * arrays. The token "-" names the slot one past the end of an array and
 * is only accepted by insertAt().
 *
 * Resolution never throws. Failures are returned as a Status and, when
 * a detail string is supplied, a message naming the offending token and
 * the location where resolution stopped.
 */
class JsonPointer
{
  public:
    JsonPointer();

    // Throws std::invalid_argument if text is not a valid pointer.
    explicit JsonPointer(const std::string& text);

    // A non-empty pointer must start with '/' and every '~' must be
    // followed by '0' or '1'.
    static std::pair<bool, JsonPointer> parse(const std::string& text);

    static std::string escape(const std::string& token);
    static bool unescape(const std::string& raw, std::string& token);

    bool isRoot() const
    {
        return tokens_.empty();
    }

    size_t size() const
    {
        return tokens_.size();
    }

    const std::vector<std::string>& tokens() const
    {
        return tokens_;
    }

    const std::string& back() const;
    JsonPointer parent() const;
    JsonPointer append(const std::string& token) const;
    JsonPointer append(size_t index) const;

    // True if this pointer is a proper ancestor of other.
    bool isPrefixOf(const JsonPointer& other) const;

    std::string toString() const;

    bool operator==(const JsonPointer& other) const;
    bool operator!=(const JsonPointer& other) const;

    Status resolve(const Json& root,
                   const Json** out,
                   std::string* detail = nullptr) const;
    Status resolve(Json& root, Json** out, std::string* detail = nullptr) const;

    // Stops one token short. The container is guaranteed to be an array
    // or an object; the final token is back().
    Status resolveParent(Json& root,
                         Json** container,
                         std::string* detail = nullptr) const;

    bool exists(const Json& root) const;

  private:
    Status walk(const Json& root,
                size_t count,
                const Json** out,
                std::string* detail) const;
    std::string prefix(size_t count) const;

    std::vector<std::string> tokens_;
};

// Parses an array index: "0" or a digit string without a leading zero.
// Indices too large for size_t saturate to SIZE_MAX so callers report
// them as out of range.
Status
parseIndex(const std::string& token, size_t* index);

// Objects: creates or overwrites the member. Arrays: inserts before
// index, shifting later elements right, or appends for "-".
Status
insertAt(Json& container,
         const std::string& token,
         Json value,
         std::string* detail = nullptr);

// Objects: deletes an existing member. Arrays: erases an existing
// element, shifting later elements left. The removed value is moved
// into removed when it is not null.
Status
removeAt(Json& container,
         const std::string& token,
         Json* removed = nullptr,
         std::string* detail = nullptr);

// Overwrites an existing member or element. Never creates one.
Status
replaceAt(Json& container,
          const std::string& token,
          Json value,
          std::string* detail = nullptr);

} // namespace jpatch

#endif /* JPATCH_POINTER_H_ */
