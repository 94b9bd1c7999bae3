/*
 * This file is open source software, licensed to you under the terms
 * of the Apache License, Version 2.0 (the "License").  See the NOTICE file
 * distributed with this work for additional information regarding copyright
 * ownership.  You may not use this file except in compliance with the License.
 *
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 */

/*
 * Copyright (C) 2019 ScyllaDB Ltd.
 */

#pragma once

#include <stdexcept>
#include <vector>

namespace rfalter {

// Returns `take` elements of `input` starting at `position`, wrapping
// around its end. Elements are distinct as long as take <= input.size().
template<typename T>
std::vector<T> rotation(const std::vector<T>& input, size_t position, size_t take) {
    std::vector<T> output;
    if (take == 0) {
        return output;
    }
    if (input.empty()) {
        throw std::out_of_range("Cannot take a rotation window of an empty sequence");
    }
    output.reserve(take);
    for (size_t i = position; i < position + take; i++) {
        output.push_back(input[i % input.size()]);
    }
    return output;
}

}
