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

#include <istream>
#include <map>
#include <string>

namespace rfalter {

using properties_map = std::map<std::string, std::string>;

// Reads Java-style properties: `key=value`, `key: value` or `key value`
// lines, `#` and `!` comments, trailing-backslash continuations.
// Backslash escapes (`\\`, `\=`, `\t`, unicode escapes) are decoded in keys
// and values; an escaped separator belongs to the key.
properties_map parse_properties(std::istream& is);

// Throws configuration_error when the file cannot be opened.
properties_map load_properties_file(const std::string& path);

}
