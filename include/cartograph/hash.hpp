// Copyright 2025 Siddhant Biradar
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

#pragma once

#include "types.hpp"
#include <string>
#include <string_view>

namespace cartograph {

// Lowercase hex SHA-256 of the given bytes
std::string sha256_hex(std::string_view data);

// Stable symbol id: first 63 bits of SHA-256(repo_id ":" qualified_name).
// Never returns INVALID_UID.
SymbolUID stable_symbol_uid(RowId repo_id, std::string_view qualified_name);

} // namespace cartograph
