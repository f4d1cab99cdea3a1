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

#ifndef JPATCH_STATUS_H_
#define JPATCH_STATUS_H_

namespace jpatch {

// Outcome of pointer resolution and patch application.
enum Status
{
    success,
    malformed_patch,
    pointer_not_found,
    key_not_found,
    index_out_of_range,
    invalid_index,
    not_container,
    root_has_no_parent,
    invalid_move,
    test_failed,
};

const char*
StatusToString(Status status);

} // namespace jpatch

#endif /* JPATCH_STATUS_H_ */
