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

#include "status.h"

#include <stdexcept>

namespace jpatch {

const char*
StatusToString(Status status)
{
    switch (status) {
        case success:
            return "success";
        case malformed_patch:
            return "malformed_patch";
        case pointer_not_found:
            return "pointer_not_found";
        case key_not_found:
            return "key_not_found";
        case index_out_of_range:
            return "index_out_of_range";
        case invalid_index:
            return "invalid_index";
        case not_container:
            return "not_container";
        case root_has_no_parent:
            return "root_has_no_parent";
        case invalid_move:
            return "invalid_move";
        case test_failed:
            return "test_failed";
        default:
            throw std::logic_error("Unhandled patch status value.");
    }
}

} // namespace jpatch
