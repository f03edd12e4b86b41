#pragma once

#include "tree/Node.hpp"

#include <cstddef>
#include <string>
#include <variant>

namespace RS::Store {

struct SetMethod {
    Tree::RequestMethod method;
};

struct SetUrl {
    std::string url;
};

// An empty body clears it.
struct SetBody {
    std::string body;
};

struct SetBodyKind {
    Tree::BodyKind kind;
};

struct SetAuth {
    Tree::AuthKind auth;
};

struct AddHeader {
    std::string name;
    std::string value;
    bool        enabled = true;
};

struct UpdateHeader {
    std::size_t index = 0;
    std::string name;
    std::string value;
};

struct RemoveHeader {
    std::size_t index = 0;
};

struct SetHeaderEnabled {
    std::size_t index   = 0;
    bool        enabled = true;
};

struct AddSampleResponse {
    Tree::SampleResponse response;
};

struct RemoveSampleResponse {
    std::size_t index = 0;
};

using RequestUpdate = std::variant<SetMethod,
                                   SetUrl,
                                   SetBody,
                                   SetBodyKind,
                                   SetAuth,
                                   AddHeader,
                                   UpdateHeader,
                                   RemoveHeader,
                                   SetHeaderEnabled,
                                   AddSampleResponse,
                                   RemoveSampleResponse>;

struct UpdateOutcome {
    // False when the update left the request as it was; nothing is marked dirty then.
    bool changed = false;
    // The request carries a body its method does not send (GET, DELETE).
    bool bodyIgnoredByMethod = false;
};

} // namespace RS::Store
