#pragma once

#include "core/Error.hpp"

#include <array>
#include <string_view>

namespace RS::Tree {

enum class RequestMethod {
    Get,
    Post,
    Put,
    Patch,
    Delete
};

enum class BodyKind {
    NoBody,
    Json
};

enum class AuthKind {
    None,
    Bearer
};

inline constexpr std::array<RequestMethod, 5> AllRequestMethods{
    RequestMethod::Get, RequestMethod::Post, RequestMethod::Put, RequestMethod::Patch, RequestMethod::Delete};

[[nodiscard]] auto methodToString(RequestMethod method) -> std::string_view;
[[nodiscard]] auto parseMethod(std::string_view text) -> Expected<RequestMethod>;

// Cyclic order used by the UI when tabbing through methods.
[[nodiscard]] auto nextMethod(RequestMethod method) -> RequestMethod;
[[nodiscard]] auto prevMethod(RequestMethod method) -> RequestMethod;

// GET and DELETE conventionally carry no payload.
[[nodiscard]] constexpr auto methodAllowsBody(RequestMethod method) noexcept -> bool {
    return method == RequestMethod::Post || method == RequestMethod::Put || method == RequestMethod::Patch;
}

[[nodiscard]] auto bodyKindToString(BodyKind kind) -> std::string_view;
[[nodiscard]] auto parseBodyKind(std::string_view text) -> Expected<BodyKind>;

[[nodiscard]] auto authKindToString(AuthKind kind) -> std::string_view;
[[nodiscard]] auto parseAuthKind(std::string_view text) -> Expected<AuthKind>;

} // namespace RS::Tree
