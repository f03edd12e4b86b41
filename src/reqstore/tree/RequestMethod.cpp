#include "tree/RequestMethod.hpp"

#include <string>

namespace RS::Tree {

auto methodToString(RequestMethod method) -> std::string_view {
    switch (method) {
    case RequestMethod::Get:
        return "GET";
    case RequestMethod::Post:
        return "POST";
    case RequestMethod::Put:
        return "PUT";
    case RequestMethod::Patch:
        return "PATCH";
    case RequestMethod::Delete:
        return "DELETE";
    }
    return "GET";
}

auto parseMethod(std::string_view text) -> Expected<RequestMethod> {
    for (auto method : AllRequestMethods) {
        if (methodToString(method) == text)
            return method;
    }
    return std::unexpected(Error{Error::Code::MalformedInput, "Unknown request method '" + std::string(text) + "'"});
}

auto nextMethod(RequestMethod method) -> RequestMethod {
    switch (method) {
    case RequestMethod::Get:
        return RequestMethod::Post;
    case RequestMethod::Post:
        return RequestMethod::Put;
    case RequestMethod::Put:
        return RequestMethod::Patch;
    case RequestMethod::Patch:
        return RequestMethod::Delete;
    case RequestMethod::Delete:
        return RequestMethod::Get;
    }
    return RequestMethod::Get;
}

auto prevMethod(RequestMethod method) -> RequestMethod {
    switch (method) {
    case RequestMethod::Get:
        return RequestMethod::Delete;
    case RequestMethod::Post:
        return RequestMethod::Get;
    case RequestMethod::Put:
        return RequestMethod::Post;
    case RequestMethod::Patch:
        return RequestMethod::Put;
    case RequestMethod::Delete:
        return RequestMethod::Patch;
    }
    return RequestMethod::Get;
}

auto bodyKindToString(BodyKind kind) -> std::string_view {
    switch (kind) {
    case BodyKind::NoBody:
        return "NO_BODY";
    case BodyKind::Json:
        return "JSON";
    }
    return "NO_BODY";
}

auto parseBodyKind(std::string_view text) -> Expected<BodyKind> {
    if (text == "NO_BODY")
        return BodyKind::NoBody;
    if (text == "JSON")
        return BodyKind::Json;
    return std::unexpected(Error{Error::Code::MalformedInput, "Unknown body kind '" + std::string(text) + "'"});
}

auto authKindToString(AuthKind kind) -> std::string_view {
    switch (kind) {
    case AuthKind::None:
        return "NO_AUTH";
    case AuthKind::Bearer:
        return "BEARER";
    }
    return "NO_AUTH";
}

auto parseAuthKind(std::string_view text) -> Expected<AuthKind> {
    if (text == "NO_AUTH")
        return AuthKind::None;
    if (text == "BEARER")
        return AuthKind::Bearer;
    return std::unexpected(Error{Error::Code::MalformedInput, "Unknown auth kind '" + std::string(text) + "'"});
}

} // namespace RS::Tree
