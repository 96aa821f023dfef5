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

#include <stdexcept>
#include <string>

namespace cartograph {

// ============================================================================
// Error types
//
// Job handlers let these propagate; the worker pool decides between retry
// and permanent failure from the type (see is_permanent_failure).
// ============================================================================

class NotFound : public std::runtime_error {
public:
    explicit NotFound(const std::string &msg) : std::runtime_error(msg) {}
};

class InvalidArgument : public std::runtime_error {
public:
    explicit InvalidArgument(const std::string &msg) : std::runtime_error(msg) {}
};

class InvalidState : public std::runtime_error {
public:
    explicit InvalidState(const std::string &msg) : std::runtime_error(msg) {}
};

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string &msg) : std::runtime_error(msg) {}
};

// SQLITE_BUSY / SQLITE_LOCKED after the busy timeout expired
class StoreBusy : public StoreError {
public:
    explicit StoreBusy(const std::string &msg) : StoreError(msg) {}
};

class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string &msg) : std::runtime_error(msg) {}
};

class CollaboratorTimeout : public std::runtime_error {
public:
    explicit CollaboratorTimeout(const std::string &msg) : std::runtime_error(msg) {}
};

// Failures that retrying the same job cannot fix
inline bool is_permanent_failure(const std::exception &e) {
    return dynamic_cast<const NotFound *>(&e) != nullptr ||
           dynamic_cast<const InvalidArgument *>(&e) != nullptr;
}

} // namespace cartograph
