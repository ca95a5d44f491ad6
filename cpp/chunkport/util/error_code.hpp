/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <fmt/format.h>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace chunkport {

namespace detail {
using BaseType = std::uint32_t;
constexpr BaseType error_category_scale = 1000u;
}

enum class ErrorCategory : detail::BaseType {
    INTERNAL = 1,
    /// Bad chunk sizes, illegal mutation of a dispatched chain, storage that does not fit the topology
    CONFIGURATION = 2,
    SIZING = 3,
    /// Failures inside a single chunk job: reading, serializing or writing rows
    CHUNK_WRITE = 4,
    STORAGE = 5,
    MISSING_DATA = 6,
    CHAIN = 7
};

inline std::unordered_map<ErrorCategory, const char*> get_error_category_names() {
    return {
        {ErrorCategory::INTERNAL, "INTERNAL"},
        {ErrorCategory::CONFIGURATION, "CONFIGURATION"},
        {ErrorCategory::SIZING, "SIZING"},
        {ErrorCategory::CHUNK_WRITE, "CHUNK_WRITE"},
        {ErrorCategory::STORAGE, "STORAGE"},
        {ErrorCategory::MISSING_DATA, "MISSING_DATA"},
        {ErrorCategory::CHAIN, "CHAIN"},
    };
}

// A macro that will be expanded in different ways by redefining ERROR_CODE():
#define CHUNKPORT_ERROR_CODES \
    ERROR_CODE(1000, E_INVALID_RANGE) \
    ERROR_CODE(1001, E_INVALID_ARGUMENT) \
    ERROR_CODE(1002, E_ASSERTION_FAILURE) \
    ERROR_CODE(2000, E_INVALID_CHUNK_SIZE) \
    ERROR_CODE(2001, E_MISSING_SIZE_STRATEGY) \
    ERROR_CODE(2002, E_CHAIN_ALREADY_DISPATCHED) \
    ERROR_CODE(2003, E_CHAIN_TERMINATED) \
    ERROR_CODE(2004, E_UNSHARED_STORAGE_IN_MULTI_HOST) \
    ERROR_CODE(2005, E_INVALID_STORAGE_CONFIG) \
    ERROR_CODE(2006, E_MISSING_DATA_SOURCE) \
    ERROR_CODE(3000, E_COUNT_FAILED) \
    ERROR_CODE(3001, E_CUSTOM_SIZE_FAILED) \
    ERROR_CODE(3002, E_CHUNK_COUNT_OVERFLOW) \
    ERROR_CODE(4000, E_ROW_READ_FAILED) \
    ERROR_CODE(4001, E_ROW_SERIALIZATION_FAILED) \
    ERROR_CODE(4002, E_ARTIFACT_WRITE_FAILED) \
    ERROR_CODE(5000, E_STORAGE_IO) \
    ERROR_CODE(5001, E_ARTIFACT_EXISTS) \
    ERROR_CODE(5002, E_DESTINATION_WRITE_FAILED) \
    ERROR_CODE(6000, E_ARTIFACT_NOT_FOUND) \
    ERROR_CODE(7000, E_CHAIN_ABORTED)

enum class ErrorCode : detail::BaseType {
#define ERROR_CODE(code, Name, ...) Name = code,
    CHUNKPORT_ERROR_CODES
#undef ERROR_CODE
};

struct ErrorCodeData {
    std::string_view name_;
    std::string_view as_string_;
};

template<ErrorCode code>
inline constexpr ErrorCodeData error_code_data{};

#define ERROR_CODE(code, Name, ...) template<> inline constexpr ErrorCodeData error_code_data<ErrorCode::Name> \
    { #Name, "E" #code };
CHUNKPORT_ERROR_CODES
#undef ERROR_CODE

inline std::vector<ErrorCode> get_error_codes() {
    static std::vector<ErrorCode> error_codes{
#define ERROR_CODE(code, Name) ErrorCode::Name,
        CHUNKPORT_ERROR_CODES
#undef ERROR_CODE
    };
    return error_codes;
}

ErrorCodeData get_error_code_data(ErrorCode code);

// Description of the exception currently being handled, whatever its type. Only valid inside a catch block.
std::string current_exception_message();

constexpr ErrorCategory get_error_category(ErrorCode code) {
    return static_cast<ErrorCategory>(static_cast<detail::BaseType>(code) / detail::error_category_scale);
}

struct ChunkportException : public std::runtime_error {
    explicit ChunkportException(const std::string& msg_with_error_code):
            std::runtime_error(msg_with_error_code) {
    }
};

template<ErrorCategory error_category>
struct ChunkportCategorizedException : public ChunkportException {
    using ChunkportException::ChunkportException;
};

template<ErrorCode specific_code>
struct ChunkportSpecificException : public ChunkportCategorizedException<get_error_category(specific_code)> {
    static constexpr ErrorCategory category = get_error_category(specific_code);

    explicit ChunkportSpecificException(const std::string& msg_with_error_code) :
            ChunkportCategorizedException<category>(msg_with_error_code) {
        static_assert(get_error_category(specific_code) == category);
    }
};

using InternalException = ChunkportCategorizedException<ErrorCategory::INTERNAL>;
using ConfigurationException = ChunkportCategorizedException<ErrorCategory::CONFIGURATION>;
using SizingException = ChunkportCategorizedException<ErrorCategory::SIZING>;
using ChunkWriteException = ChunkportCategorizedException<ErrorCategory::CHUNK_WRITE>;
using StorageException = ChunkportCategorizedException<ErrorCategory::STORAGE>;
using MissingDataException = ChunkportCategorizedException<ErrorCategory::MISSING_DATA>;
using ArtifactNotFoundException = ChunkportSpecificException<ErrorCode::E_ARTIFACT_NOT_FOUND>;
using UnsharedStorageException = ChunkportSpecificException<ErrorCode::E_UNSHARED_STORAGE_IN_MULTI_HOST>;

template<ErrorCode error_code>
[[noreturn]] void throw_error(const std::string& msg) {
    throw ChunkportCategorizedException<get_error_category(error_code)>(msg);
}

template<>
[[noreturn]] inline void throw_error<ErrorCode::E_ARTIFACT_NOT_FOUND>(const std::string& msg) {
    throw ArtifactNotFoundException(msg);
}

template<>
[[noreturn]] inline void throw_error<ErrorCode::E_UNSHARED_STORAGE_IN_MULTI_HOST>(const std::string& msg) {
    throw UnsharedStorageException(msg);
}

}

namespace fmt {
template<>
struct formatter<chunkport::ErrorCode> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(chunkport::ErrorCode code, FormatContext &ctx) const {
        std::string_view str = chunkport::get_error_code_data(code).as_string_;
        return std::copy(str.begin(), str.end(), ctx.out());
    }
};
}
