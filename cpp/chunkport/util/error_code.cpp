/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <chunkport/util/error_code.hpp>

#include <folly/Conv.h>
#include <folly/ExceptionString.h>

#include <exception>

namespace chunkport {

ErrorCodeData get_error_code_data(ErrorCode code) {
    switch (code) {
#define ERROR_CODE(code, Name) case ErrorCode::Name: return error_code_data<ErrorCode::Name>;
        CHUNKPORT_ERROR_CODES
#undef ERROR_CODE
    }
    return {"E_UNKNOWN", "E0"};
}

std::string current_exception_message() {
    return folly::to<std::string>(folly::exceptionStr(std::current_exception()));
}

} //namespace chunkport
