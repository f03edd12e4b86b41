#include "codec/CollectionCodec.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace RS::Codec {

namespace {

using json = nlohmann::json;

auto dumpDeterministic(json const& value) -> std::string {
    // The store only admits valid UTF-8; replacing keeps a hand-built node from throwing.
    return value.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

auto schemaError(std::string const& pointer, std::string const& what) -> Error {
    return Error{Error::Code::MalformedInput, (pointer.empty() ? std::string{"/"} : pointer) + ": " + what};
}

auto parseBytes(std::string_view bytes) -> Expected<json> {
    try {
        return json::parse(bytes.begin(), bytes.end());
    } catch (json::parse_error const& error) {
        return std::unexpected(Error{Error::Code::MalformedInput,
                                     "Syntax error at byte " + std::to_string(error.byte) + ": " + error.what()});
    }
}

auto requireString(json const& object, std::string const& field, std::string const& pointer) -> Expected<std::string> {
    auto it = object.find(field);
    if (it == object.end())
        return std::unexpected(schemaError(pointer + "/" + field, "missing"));
    if (!it->is_string())
        return std::unexpected(schemaError(pointer + "/" + field, "expected a string"));
    return it->get<std::string>();
}

auto optionalString(json const& object, std::string const& field, std::string const& pointer) -> Expected<std::string> {
    auto it = object.find(field);
    if (it == object.end())
        return std::string{};
    if (!it->is_string())
        return std::unexpected(schemaError(pointer + "/" + field, "expected a string"));
    return it->get<std::string>();
}

auto checkFormat(json const& document) -> Expected<void> {
    auto it = document.find("format");
    if (it == document.end() || !it->is_number_integer())
        return std::unexpected(schemaError("/format", "missing format version"));
    if (it->get<int>() != FormatVersion)
        return std::unexpected(schemaError("/format", "unsupported format version " + std::to_string(it->get<int>())));
    return {};
}

auto requireKey(json const& object, std::string const& pointer) -> Expected<std::string> {
    auto key = requireString(object, "key", pointer);
    if (!key)
        return key;
    if (!Tree::isValidNodeKey(*key))
        return std::unexpected(schemaError(pointer + "/key", "invalid key '" + *key + "'"));
    return key;
}

auto requireName(json const& object, std::string const& pointer) -> Expected<std::string> {
    auto name = requireString(object, "name", pointer);
    if (!name)
        return name;
    if (name->empty())
        return std::unexpected(schemaError(pointer + "/name", "name must not be empty"));
    return name;
}

auto requireKind(json const& object, std::string const& pointer) -> Expected<Tree::NodeKind> {
    auto kind = requireString(object, "kind", pointer);
    if (!kind)
        return std::unexpected(kind.error());
    if (*kind == Tree::nodeKindToString(Tree::NodeKind::Directory))
        return Tree::NodeKind::Directory;
    if (*kind == Tree::nodeKindToString(Tree::NodeKind::Request))
        return Tree::NodeKind::Request;
    return std::unexpected(schemaError(pointer + "/kind", "unknown node kind '" + *kind + "'"));
}

auto info_to_json(Tree::CollectionInfo const& info) -> json {
    return json{
            {"name", info.name},
            {"description", info.description},
    };
}

auto info_from_json(json const& document) -> Expected<Tree::CollectionInfo> {
    auto it = document.find("info");
    if (it == document.end() || !it->is_object())
        return std::unexpected(schemaError("/info", "expected an object"));
    auto name = requireString(*it, "name", "/info");
    if (!name)
        return std::unexpected(name.error());
    auto description = optionalString(*it, "description", "/info");
    if (!description)
        return std::unexpected(description.error());
    return Tree::CollectionInfo{std::move(*name), std::move(*description)};
}

auto sample_response_to_json(Tree::SampleResponse const& response) -> json {
    json headers = json::array();
    for (auto const& [name, value] : response.headers)
        headers.push_back(json{{"name", name}, {"value", value}});
    json object{
            {"name", response.name},
            {"body", response.body},
            {"headers", std::move(headers)},
    };
    if (response.status)
        object["status"] = *response.status;
    return object;
}

auto sample_response_from_json(json const& object, std::string const& pointer) -> Expected<Tree::SampleResponse> {
    if (!object.is_object())
        return std::unexpected(schemaError(pointer, "sample response must be an object"));

    Tree::SampleResponse response;
    auto                 name = requireName(object, pointer);
    if (!name)
        return std::unexpected(name.error());
    response.name = std::move(*name);
    auto body     = optionalString(object, "body", pointer);
    if (!body)
        return std::unexpected(body.error());
    response.body = std::move(*body);

    if (auto it = object.find("status"); it != object.end()) {
        if (!it->is_number_unsigned() || it->get<std::uint64_t>() > 999)
            return std::unexpected(schemaError(pointer + "/status", "expected an HTTP status code"));
        response.status = static_cast<std::uint16_t>(it->get<std::uint64_t>());
    }
    if (auto it = object.find("headers"); it != object.end()) {
        if (!it->is_array())
            return std::unexpected(schemaError(pointer + "/headers", "expected an array"));
        for (std::size_t i = 0; i < it->size(); ++i) {
            auto const& entry        = (*it)[i];
            auto const  entryPointer = pointer + "/headers/" + std::to_string(i);
            if (!entry.is_object())
                return std::unexpected(schemaError(entryPointer, "header must be an object"));
            auto headerName = requireName(entry, entryPointer);
            if (!headerName)
                return std::unexpected(headerName.error());
            auto headerValue = optionalString(entry, "value", entryPointer);
            if (!headerValue)
                return std::unexpected(headerValue.error());
            response.headers.emplace_back(std::move(*headerName), std::move(*headerValue));
        }
    }
    return response;
}

auto request_to_json(Tree::Node const& request) -> json {
    json headers = json::array();
    for (auto const& header : request.request.headers) {
        headers.push_back(json{
                {"name", header.name},
                {"value", header.value},
                {"enabled", header.enabled},
        });
    }
    json object{
            {"kind", std::string(Tree::nodeKindToString(Tree::NodeKind::Request))},
            {"key", request.key},
            {"name", request.name},
            {"method", std::string(Tree::methodToString(request.request.method))},
            {"url", request.request.url},
            {"headers", std::move(headers)},
            {"body", request.request.body},
            {"bodyKind", std::string(Tree::bodyKindToString(request.request.bodyKind))},
            {"auth", std::string(Tree::authKindToString(request.request.auth))},
    };
    // Omitted when empty, as in files written before sample responses existed.
    if (!request.request.sampleResponses.empty()) {
        json samples = json::array();
        for (auto const& response : request.request.sampleResponses)
            samples.push_back(sample_response_to_json(response));
        object["sampleResponses"] = std::move(samples);
    }
    return object;
}

auto request_from_json(json const& object, std::string const& pointer) -> Expected<std::unique_ptr<Tree::Node>> {
    if (!object.is_object())
        return std::unexpected(schemaError(pointer, "request must be an object"));

    auto key = requireKey(object, pointer);
    if (!key)
        return std::unexpected(key.error());
    auto name = requireName(object, pointer);
    if (!name)
        return std::unexpected(name.error());
    auto methodText = requireString(object, "method", pointer);
    if (!methodText)
        return std::unexpected(methodText.error());
    auto method = Tree::parseMethod(*methodText);
    if (!method)
        return std::unexpected(schemaError(pointer + "/method", *method.error().message));

    auto node = Tree::Node::makeRequest(std::move(*name), *method, std::move(*key));

    auto url = optionalString(object, "url", pointer);
    if (!url)
        return std::unexpected(url.error());
    node->request.url = std::move(*url);

    auto body = optionalString(object, "body", pointer);
    if (!body)
        return std::unexpected(body.error());
    node->request.body = std::move(*body);

    if (object.contains("bodyKind")) {
        auto text = requireString(object, "bodyKind", pointer);
        if (!text)
            return std::unexpected(text.error());
        auto kind = Tree::parseBodyKind(*text);
        if (!kind)
            return std::unexpected(schemaError(pointer + "/bodyKind", *kind.error().message));
        node->request.bodyKind = *kind;
    }
    if (object.contains("auth")) {
        auto text = requireString(object, "auth", pointer);
        if (!text)
            return std::unexpected(text.error());
        auto auth = Tree::parseAuthKind(*text);
        if (!auth)
            return std::unexpected(schemaError(pointer + "/auth", *auth.error().message));
        node->request.auth = *auth;
    }

    if (auto it = object.find("headers"); it != object.end()) {
        if (!it->is_array())
            return std::unexpected(schemaError(pointer + "/headers", "expected an array"));
        for (std::size_t i = 0; i < it->size(); ++i) {
            auto const& entry        = (*it)[i];
            auto const  entryPointer = pointer + "/headers/" + std::to_string(i);
            if (!entry.is_object())
                return std::unexpected(schemaError(entryPointer, "header must be an object"));
            auto headerName = requireString(entry, "name", entryPointer);
            if (!headerName)
                return std::unexpected(headerName.error());
            if (headerName->empty())
                return std::unexpected(schemaError(entryPointer + "/name", "header name must not be empty"));
            auto headerValue = optionalString(entry, "value", entryPointer);
            if (!headerValue)
                return std::unexpected(headerValue.error());
            bool enabled = true;
            if (auto enabledIt = entry.find("enabled"); enabledIt != entry.end()) {
                if (!enabledIt->is_boolean())
                    return std::unexpected(schemaError(entryPointer + "/enabled", "expected a boolean"));
                enabled = enabledIt->get<bool>();
            }
            node->request.headers.push_back(Tree::HeaderEntry{std::move(*headerName), std::move(*headerValue), enabled});
        }
    }

    if (auto it = object.find("sampleResponses"); it != object.end()) {
        if (!it->is_array())
            return std::unexpected(schemaError(pointer + "/sampleResponses", "expected an array"));
        for (std::size_t i = 0; i < it->size(); ++i) {
            auto response = sample_response_from_json((*it)[i], pointer + "/sampleResponses/" + std::to_string(i));
            if (!response)
                return std::unexpected(response.error());
            node->request.sampleResponses.push_back(std::move(*response));
        }
    }
    return node;
}

auto manifest_to_json(Tree::Node const& node) -> json {
    if (node.isRequest()) {
        return json{
                {"kind", std::string(Tree::nodeKindToString(Tree::NodeKind::Request))},
                {"key", node.key},
        };
    }
    json children = json::array();
    for (auto const& child : node.children)
        children.push_back(manifest_to_json(*child));
    return json{
            {"kind", std::string(Tree::nodeKindToString(Tree::NodeKind::Directory))},
            {"key", node.key},
            {"name", node.name},
            {"children", std::move(children)},
    };
}

auto manifest_entry_from_json(json const& object, std::string const& pointer, bool isRoot) -> Expected<ManifestEntry> {
    if (!object.is_object())
        return std::unexpected(schemaError(pointer, "entry must be an object"));

    ManifestEntry entry;
    auto          kind = requireKind(object, pointer);
    if (!kind)
        return std::unexpected(kind.error());
    entry.kind = *kind;
    auto key   = requireKey(object, pointer);
    if (!key)
        return std::unexpected(key.error());
    entry.key = std::move(*key);
    if (entry.kind == Tree::NodeKind::Request) {
        if (isRoot)
            return std::unexpected(schemaError(pointer + "/kind", "root must be a directory"));
        return entry;
    }

    auto name = isRoot ? optionalString(object, "name", pointer) : requireName(object, pointer);
    if (!name)
        return std::unexpected(name.error());
    entry.name = std::move(*name);

    auto it = object.find("children");
    if (it == object.end())
        return entry;
    if (!it->is_array())
        return std::unexpected(schemaError(pointer + "/children", "expected an array"));
    for (std::size_t i = 0; i < it->size(); ++i) {
        auto child = manifest_entry_from_json((*it)[i], pointer + "/children/" + std::to_string(i), false);
        if (!child)
            return child;
        entry.children.push_back(std::move(*child));
    }
    return entry;
}

auto document_to_json(Tree::Node const& node) -> json {
    if (node.isRequest())
        return request_to_json(node);
    json children = json::array();
    for (auto const& child : node.children)
        children.push_back(document_to_json(*child));
    return json{
            {"kind", std::string(Tree::nodeKindToString(Tree::NodeKind::Directory))},
            {"key", node.key},
            {"name", node.name},
            {"children", std::move(children)},
    };
}

auto document_node_from_json(json const& object, std::string const& pointer, bool isRoot)
        -> Expected<std::unique_ptr<Tree::Node>> {
    if (!object.is_object())
        return std::unexpected(schemaError(pointer, "entry must be an object"));
    auto kind = requireKind(object, pointer);
    if (!kind)
        return std::unexpected(kind.error());
    if (*kind == Tree::NodeKind::Request) {
        if (isRoot)
            return std::unexpected(schemaError(pointer + "/kind", "root must be a directory"));
        return request_from_json(object, pointer);
    }

    auto key = requireKey(object, pointer);
    if (!key)
        return std::unexpected(key.error());
    auto name = isRoot ? optionalString(object, "name", pointer) : requireName(object, pointer);
    if (!name)
        return std::unexpected(name.error());
    auto directory = Tree::Node::makeDirectory(isRoot && name->empty() ? std::string{"root"} : std::move(*name),
                                               std::move(*key));

    if (auto it = object.find("children"); it != object.end()) {
        if (!it->is_array())
            return std::unexpected(schemaError(pointer + "/children", "expected an array"));
        for (std::size_t i = 0; i < it->size(); ++i) {
            auto child = document_node_from_json((*it)[i], pointer + "/children/" + std::to_string(i), false);
            if (!child)
                return child;
            (*child)->parent = directory.get();
            directory->children.push_back(std::move(*child));
        }
    }
    return directory;
}

} // namespace

auto encodeRequest(Tree::Node const& request) -> std::string {
    auto object      = request_to_json(request);
    object["format"] = FormatVersion;
    return dumpDeterministic(object);
}

auto encodeManifest(Tree::CollectionInfo const& info, Tree::Node const& root) -> std::string {
    json document{
            {"format", FormatVersion},
            {"info", info_to_json(info)},
            {"root", manifest_to_json(root)},
    };
    return dumpDeterministic(document);
}

auto encodeDocument(Tree::CollectionInfo const& info, Tree::Node const& root) -> std::string {
    json document{
            {"format", FormatVersion},
            {"info", info_to_json(info)},
            {"root", document_to_json(root)},
    };
    return dumpDeterministic(document);
}

auto decodeRequest(std::string_view bytes) -> Expected<std::unique_ptr<Tree::Node>> {
    auto parsed = parseBytes(bytes);
    if (!parsed)
        return std::unexpected(parsed.error());
    if (!parsed->is_object())
        return std::unexpected(schemaError("", "request must be an object"));
    if (auto format = checkFormat(*parsed); !format)
        return std::unexpected(format.error());
    return request_from_json(*parsed, "");
}

auto decodeManifest(std::string_view bytes) -> Expected<Manifest> {
    auto parsed = parseBytes(bytes);
    if (!parsed)
        return std::unexpected(parsed.error());
    if (!parsed->is_object())
        return std::unexpected(schemaError("", "manifest must be an object"));
    if (auto format = checkFormat(*parsed); !format)
        return std::unexpected(format.error());

    auto info = info_from_json(*parsed);
    if (!info)
        return std::unexpected(info.error());
    auto rootIt = parsed->find("root");
    if (rootIt == parsed->end())
        return std::unexpected(schemaError("/root", "missing"));
    auto root = manifest_entry_from_json(*rootIt, "/root", true);
    if (!root)
        return std::unexpected(root.error());
    return Manifest{std::move(*info), std::move(*root)};
}

auto decodeDocument(std::string_view bytes) -> Expected<Document> {
    auto parsed = parseBytes(bytes);
    if (!parsed)
        return std::unexpected(parsed.error());
    if (!parsed->is_object())
        return std::unexpected(schemaError("", "document must be an object"));
    if (auto format = checkFormat(*parsed); !format)
        return std::unexpected(format.error());

    auto info = info_from_json(*parsed);
    if (!info)
        return std::unexpected(info.error());
    auto rootIt = parsed->find("root");
    if (rootIt == parsed->end())
        return std::unexpected(schemaError("/root", "missing"));
    auto root = document_node_from_json(*rootIt, "/root", true);
    if (!root)
        return std::unexpected(root.error());
    if (auto valid = Tree::validateTree(**root); !valid)
        return std::unexpected(Error{Error::Code::MalformedInput, *valid.error().message});
    return Document{std::move(*info), std::move(*root)};
}

} // namespace RS::Codec
