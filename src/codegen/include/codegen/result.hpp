#pragma once

#include "codegen/error.hpp"

#include <expected>
#include <string>
#include <utility>

namespace kestrel::codegen
{

template <typename T>
using Result = std::expected<T, Error>;

template <typename T = void>
inline Result<T> unexpected_result(Error error)
{
    return std::unexpected(std::move(error));
}

template <typename T = void>
inline Result<T> unexpected_result(ErrorKind kind, std::string message = {})
{
    return unexpected_result<T>(make_error(kind, std::move(message)));
}

}  // namespace kestrel::codegen
