#include "store/CollectionStore.hpp"

#include <doctest/doctest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

using namespace RS;
using namespace RS::Store;
using namespace RS::Tree;
using namespace std::chrono_literals;

namespace {

auto makeStore() -> CollectionStore {
    return CollectionStore{Node::makeDirectory("root"), CollectionInfo{"Demo API", ""}};
}

auto create(CollectionStore& store, NodeId parent, NodeKind kind, std::string name) -> NodeId {
    auto id = store.createNode(parent, kind, std::move(name));
    REQUIRE(id.has_value());
    return *id;
}

auto pathOf(CollectionStore const& store, NodeId id) -> std::vector<std::string> {
    auto path = store.withTree([&](CollectionTree const& tree) { return tree.pathOf(id); });
    REQUIRE(path.has_value());
    REQUIRE(path->has_value());
    return **path;
}

auto childNames(CollectionStore const& store, NodeId id) -> std::vector<std::string> {
    auto names = store.withTree([&](CollectionTree const& tree) {
        std::vector<std::string> out;
        for (auto const& child : tree.find(id)->children)
            out.push_back(child->name);
        return out;
    });
    REQUIRE(names.has_value());
    return *names;
}

auto testEncoders() -> FlushEncoders {
    return FlushEncoders{.request  = [](Node const& node) { return node.name; },
                         .manifest = [](CollectionInfo const& info, Node const&) { return info.name; }};
}

} // namespace

TEST_SUITE("store.collection_store") {
    TEST_CASE("Create nodes and reject bad names") {
        CollectionStore store  = makeStore();
        NodeId          root   = store.rootId().value();
        NodeId          auth   = create(store, root, NodeKind::Directory, "Auth");
        NodeId          login  = create(store, auth, NodeKind::Request, "Login");

        CHECK(pathOf(store, login) == std::vector<std::string>{"Auth", "Login"});

        auto duplicate = store.createNode(auth, NodeKind::Request, "Login");
        REQUIRE_FALSE(duplicate.has_value());
        CHECK(duplicate.error().code == Error::Code::NameCollision);

        auto empty = store.createNode(auth, NodeKind::Request, "");
        REQUIRE_FALSE(empty.has_value());
        CHECK(empty.error().code == Error::Code::InvalidName);

        auto underRequest = store.createNode(login, NodeKind::Request, "Nested");
        REQUIRE_FALSE(underRequest.has_value());
        CHECK(underRequest.error().code == Error::Code::InvalidParent);

        auto unknownParent = store.createNode(9999, NodeKind::Directory, "Ghost");
        REQUIRE_FALSE(unknownParent.has_value());
        CHECK(unknownParent.error().code == Error::Code::NotFound);

        // Same name under a different directory is allowed.
        NodeId users = create(store, root, NodeKind::Directory, "Users");
        CHECK(store.createNode(users, NodeKind::Request, "Login").has_value());
    }

    TEST_CASE("New requests start with defaults") {
        CollectionStore store = makeStore();
        NodeId          login = create(store, store.rootId().value(), NodeKind::Request, "Login");
        auto            snap  = store.requestSnapshot(login);
        REQUIRE(snap.has_value());
        CHECK(snap->name == "Login");
        CHECK(snap->data == RequestData{});
        CHECK(snap->data.method == RequestMethod::Get);

        auto onDirectory = store.requestSnapshot(store.rootId().value());
        REQUIRE_FALSE(onDirectory.has_value());
        CHECK(onDirectory.error().code == Error::Code::TypeMismatch);
    }

    TEST_CASE("Creating marks the node and its parent dirty") {
        CollectionStore store = makeStore();
        NodeId          root  = store.rootId().value();
        CHECK_FALSE(store.anyDirty().value());

        NodeId auth = create(store, root, NodeKind::Directory, "Auth");
        CHECK(store.isDirty(auth).value());
        CHECK(store.isDirty(root).value());
        CHECK(store.dirtyIds().value() == std::vector<NodeId>{root, auth});

        auto unknown = store.isDirty(9999);
        REQUIRE_FALSE(unknown.has_value());
        CHECK(unknown.error().code == Error::Code::NotFound);
    }

    TEST_CASE("Rename") {
        CollectionStore store  = makeStore();
        NodeId          root   = store.rootId().value();
        NodeId          auth   = create(store, root, NodeKind::Directory, "Auth");
        NodeId          login  = create(store, auth, NodeKind::Request, "Login");
        NodeId          logout = create(store, auth, NodeKind::Request, "Logout");
        (void)store.takeFlushSnapshot(testEncoders());

        REQUIRE(store.renameNode(login, "Sign in").has_value());
        CHECK(pathOf(store, login) == std::vector<std::string>{"Auth", "Sign in"});
        CHECK(store.isDirty(login).value());

        auto collision = store.renameNode(logout, "Sign in");
        REQUIRE_FALSE(collision.has_value());
        CHECK(collision.error().code == Error::Code::NameCollision);
        CHECK(pathOf(store, logout) == std::vector<std::string>{"Auth", "Logout"});

        auto empty = store.renameNode(logout, "");
        REQUIRE_FALSE(empty.has_value());
        CHECK(empty.error().code == Error::Code::InvalidName);

        auto rootRename = store.renameNode(root, "Top");
        REQUIRE_FALSE(rootRename.has_value());
        CHECK(rootRename.error().code == Error::Code::InvalidOperation);

        // Renaming to the current name changes nothing.
        REQUIRE(store.renameNode(logout, "Logout").has_value());
        CHECK_FALSE(store.isDirty(logout).value());
    }

    TEST_CASE("Move between directories") {
        CollectionStore store = makeStore();
        NodeId          root  = store.rootId().value();
        NodeId          auth  = create(store, root, NodeKind::Directory, "Auth");
        NodeId          login = create(store, auth, NodeKind::Request, "Login");
        NodeId          users = create(store, root, NodeKind::Directory, "Users");
        NodeId          list  = create(store, users, NodeKind::Request, "List");
        (void)store.takeFlushSnapshot(testEncoders());

        REQUIRE(store.moveNode(login, users).has_value());
        CHECK(pathOf(store, login) == std::vector<std::string>{"Users", "Login"});
        CHECK(childNames(store, users) == std::vector<std::string>{"List", "Login"});
        CHECK(childNames(store, auth).empty());
        CHECK(store.isDirty(auth).value());
        CHECK(store.isDirty(users).value());
        CHECK(store.isDirty(login).value());
        CHECK_FALSE(store.isDirty(list).value());

        REQUIRE(store.moveNode(login, auth, 0).has_value());
        CHECK(childNames(store, auth) == std::vector<std::string>{"Login"});
    }

    TEST_CASE("Moving a directory carries its subtree") {
        CollectionStore store = makeStore();
        NodeId          root  = store.rootId().value();
        NodeId          api   = create(store, root, NodeKind::Directory, "API");
        NodeId          auth  = create(store, root, NodeKind::Directory, "Auth");
        NodeId          login = create(store, auth, NodeKind::Request, "Login");

        auto before = pathOf(store, login);
        REQUIRE(store.moveNode(auth, api).has_value());
        auto after = pathOf(store, login);
        REQUIRE(after.size() == before.size() + 1);
        CHECK(after.front() == "API");
        CHECK(std::vector<std::string>(after.begin() + 1, after.end()) == before);
    }

    TEST_CASE("Move rejects cycles, collisions and bad targets") {
        CollectionStore store  = makeStore();
        NodeId          root   = store.rootId().value();
        NodeId          auth   = create(store, root, NodeKind::Directory, "Auth");
        NodeId          nested = create(store, auth, NodeKind::Directory, "Nested");
        NodeId          login  = create(store, auth, NodeKind::Request, "Login");
        NodeId          other  = create(store, root, NodeKind::Directory, "Other");
        create(store, other, NodeKind::Request, "Login");

        auto intoSelf = store.moveNode(auth, auth);
        REQUIRE_FALSE(intoSelf.has_value());
        CHECK(intoSelf.error().code == Error::Code::CyclicMove);

        auto intoChild = store.moveNode(auth, nested);
        REQUIRE_FALSE(intoChild.has_value());
        CHECK(intoChild.error().code == Error::Code::CyclicMove);
        CHECK(pathOf(store, nested) == std::vector<std::string>{"Auth", "Nested"});

        auto collision = store.moveNode(login, other);
        REQUIRE_FALSE(collision.has_value());
        CHECK(collision.error().code == Error::Code::NameCollision);

        auto intoRequest = store.moveNode(nested, login);
        REQUIRE_FALSE(intoRequest.has_value());
        CHECK(intoRequest.error().code == Error::Code::InvalidParent);

        auto movingRoot = store.moveNode(root, other);
        REQUIRE_FALSE(movingRoot.has_value());
        CHECK(movingRoot.error().code == Error::Code::InvalidOperation);

        auto past = store.moveNode(login, root, 7);
        REQUIRE_FALSE(past.has_value());
        CHECK(past.error().code == Error::Code::OutOfRange);
    }

    TEST_CASE("Reordering within one directory") {
        CollectionStore store = makeStore();
        NodeId          root  = store.rootId().value();
        NodeId          a     = create(store, root, NodeKind::Request, "A");
        create(store, root, NodeKind::Request, "B");
        create(store, root, NodeKind::Request, "C");
        (void)store.takeFlushSnapshot(testEncoders());

        REQUIRE(store.moveNode(a, root, 2).has_value());
        CHECK(childNames(store, root) == std::vector<std::string>{"B", "C", "A"});
        CHECK(store.isDirty(root).value());

        (void)store.takeFlushSnapshot(testEncoders());
        // Already last: nothing moves and nothing turns dirty.
        REQUIRE(store.moveNode(a, root).has_value());
        CHECK_FALSE(store.anyDirty().value());

        auto beyond = store.moveNode(a, root, 3);
        REQUIRE_FALSE(beyond.has_value());
        CHECK(beyond.error().code == Error::Code::OutOfRange);
    }

    TEST_CASE("Delete removes the subtree and queues its files") {
        CollectionStore store  = makeStore();
        NodeId          root   = store.rootId().value();
        NodeId          auth   = create(store, root, NodeKind::Directory, "Auth");
        NodeId          login  = create(store, auth, NodeKind::Request, "Login");
        NodeId          logout = create(store, auth, NodeKind::Request, "Logout");
        (void)store.takeFlushSnapshot(testEncoders());

        auto loginKey = store.withTree([&](CollectionTree const& tree) { return tree.find(login)->key; }).value();

        REQUIRE(store.deleteNode(auth).has_value());
        CHECK(store.withTree([&](CollectionTree const& tree) { return tree.find(logout) == nullptr; }).value());
        CHECK_FALSE(store.isDirty(login).has_value());
        CHECK(store.isDirty(root).value());
        CHECK(store.hasPendingWork().value());

        auto snapshot = store.takeFlushSnapshot(testEncoders());
        REQUIRE(snapshot.has_value());
        CHECK(snapshot->removals.size() == 2);
        CHECK(std::find(snapshot->removals.begin(), snapshot->removals.end(), loginKey) != snapshot->removals.end());
        CHECK(snapshot->requests.empty());
        CHECK(snapshot->manifest.has_value());

        auto again = store.deleteNode(auth);
        REQUIRE_FALSE(again.has_value());
        CHECK(again.error().code == Error::Code::NotFound);

        auto rootDelete = store.deleteNode(root);
        REQUIRE_FALSE(rootDelete.has_value());
        CHECK(rootDelete.error().code == Error::Code::InvalidOperation);
    }

    TEST_CASE("Request updates") {
        CollectionStore store = makeStore();
        NodeId          login = create(store, store.rootId().value(), NodeKind::Request, "Login");
        (void)store.takeFlushSnapshot(testEncoders());

        SUBCASE("fields") {
            REQUIRE(store.updateRequest(login, SetMethod{RequestMethod::Post}).has_value());
            REQUIRE(store.updateRequest(login, SetUrl{"https://api.example.com/login"}).has_value());
            REQUIRE(store.updateRequest(login, SetBodyKind{BodyKind::Json}).has_value());
            REQUIRE(store.updateRequest(login, SetAuth{AuthKind::Bearer}).has_value());
            auto body = store.updateRequest(login, SetBody{R"({"user":"ana"})"});
            REQUIRE(body.has_value());
            CHECK(body->changed);
            CHECK_FALSE(body->bodyIgnoredByMethod);

            auto data = store.requestSnapshot(login).value().data;
            CHECK(data.method == RequestMethod::Post);
            CHECK(data.url == "https://api.example.com/login");
            CHECK(data.body == R"({"user":"ana"})");
            CHECK(data.bodyKind == BodyKind::Json);
            CHECK(data.auth == AuthKind::Bearer);
            CHECK(store.isDirty(login).value());
        }

        SUBCASE("unchanged values do not dirty") {
            auto same = store.updateRequest(login, SetMethod{RequestMethod::Get});
            REQUIRE(same.has_value());
            CHECK_FALSE(same->changed);
            CHECK_FALSE(store.isDirty(login).value());
        }

        SUBCASE("body on GET is kept but flagged") {
            auto body = store.updateRequest(login, SetBody{"payload"});
            REQUIRE(body.has_value());
            CHECK(body->changed);
            CHECK(body->bodyIgnoredByMethod);
            CHECK(store.requestSnapshot(login).value().data.body == "payload");

            auto toPut = store.updateRequest(login, SetMethod{RequestMethod::Put});
            REQUIRE(toPut.has_value());
            CHECK_FALSE(toPut->bodyIgnoredByMethod);
        }

        SUBCASE("headers") {
            REQUIRE(store.updateRequest(login, AddHeader{"Accept", "application/json"}).has_value());
            REQUIRE(store.updateRequest(login, AddHeader{"X-Trace", ""}).has_value());
            REQUIRE(store.updateRequest(login, SetHeaderEnabled{1, false}).has_value());
            REQUIRE(store.updateRequest(login, UpdateHeader{0, "Accept", "text/plain"}).has_value());

            auto headers = store.requestSnapshot(login).value().data.headers;
            REQUIRE(headers.size() == 2);
            CHECK(headers[0] == HeaderEntry{"Accept", "text/plain", true});
            CHECK(headers[1] == HeaderEntry{"X-Trace", "", false});

            auto noName = store.updateRequest(login, AddHeader{"", "value"});
            REQUIRE_FALSE(noName.has_value());
            CHECK(noName.error().code == Error::Code::InvalidName);

            auto badIndex = store.updateRequest(login, RemoveHeader{2});
            REQUIRE_FALSE(badIndex.has_value());
            CHECK(badIndex.error().code == Error::Code::OutOfRange);
            CHECK(store.requestSnapshot(login).value().data.headers.size() == 2);

            REQUIRE(store.updateRequest(login, RemoveHeader{0}).has_value());
            CHECK(store.requestSnapshot(login).value().data.headers.size() == 1);
        }

        SUBCASE("sample responses") {
            SampleResponse created{.name = "Created", .status = 201, .body = "{}", .headers = {{"Location", "/users/7"}}};
            REQUIRE(store.updateRequest(login, AddSampleResponse{created}).has_value());
            REQUIRE(store.updateRequest(login, AddSampleResponse{SampleResponse{.name = "Offline"}}).has_value());
            CHECK(store.isDirty(login).value());

            auto samples = store.requestSnapshot(login).value().data.sampleResponses;
            REQUIRE(samples.size() == 2);
            CHECK(samples[0] == created);
            CHECK_FALSE(samples[1].status.has_value());

            auto unnamed = store.updateRequest(login, AddSampleResponse{SampleResponse{.name = ""}});
            REQUIRE_FALSE(unnamed.has_value());
            CHECK(unnamed.error().code == Error::Code::InvalidName);

            auto badHeader = store.updateRequest(login, AddSampleResponse{SampleResponse{.name = "Bad", .headers = {{"", "x"}}}});
            REQUIRE_FALSE(badHeader.has_value());
            CHECK(badHeader.error().code == Error::Code::InvalidName);

            auto badIndex = store.updateRequest(login, RemoveSampleResponse{2});
            REQUIRE_FALSE(badIndex.has_value());
            CHECK(badIndex.error().code == Error::Code::OutOfRange);

            REQUIRE(store.updateRequest(login, RemoveSampleResponse{0}).has_value());
            samples = store.requestSnapshot(login).value().data.sampleResponses;
            REQUIRE(samples.size() == 1);
            CHECK(samples[0].name == "Offline");
        }

        SUBCASE("directories reject request updates") {
            auto onRoot = store.updateRequest(store.rootId().value(), SetUrl{"x"});
            REQUIRE_FALSE(onRoot.has_value());
            CHECK(onRoot.error().code == Error::Code::TypeMismatch);
        }
    }

    TEST_CASE("Collection info") {
        CollectionStore store = makeStore();
        NodeId          root  = store.rootId().value();
        REQUIRE(store.setInfo("Demo API", "").has_value());
        CHECK_FALSE(store.anyDirty().value());

        REQUIRE(store.setInfo("Payments", "Billing endpoints").has_value());
        CHECK(store.info().value() == CollectionInfo{"Payments", "Billing endpoints"});
        CHECK(store.isDirty(root).value());

        auto empty = store.setInfo("", "x");
        REQUIRE_FALSE(empty.has_value());
        CHECK(empty.error().code == Error::Code::InvalidName);
    }

    TEST_CASE("Invalid UTF-8 never enters the tree") {
        CollectionStore store = makeStore();
        NodeId          root  = store.rootId().value();
        NodeId          login = create(store, root, NodeKind::Request, "Login");
        (void)store.takeFlushSnapshot(testEncoders());

        for (std::string bad : {std::string("x\xFF"), std::string("\x89PNG\xFF"), std::string("caf\xC3"),
                                std::string("\xC0\xAF"), std::string("\xED\xA0\x80")}) {
            INFO(bad.size());
            auto created = store.createNode(root, NodeKind::Request, bad);
            REQUIRE_FALSE(created.has_value());
            CHECK(created.error().code == Error::Code::InvalidName);

            auto renamed = store.renameNode(login, bad);
            REQUIRE_FALSE(renamed.has_value());
            CHECK(renamed.error().code == Error::Code::InvalidName);

            auto url = store.updateRequest(login, SetUrl{bad});
            REQUIRE_FALSE(url.has_value());
            CHECK(url.error().code == Error::Code::MalformedInput);

            auto body = store.updateRequest(login, SetBody{bad});
            REQUIRE_FALSE(body.has_value());
            CHECK(body.error().code == Error::Code::MalformedInput);

            auto headerValue = store.updateRequest(login, AddHeader{"X-Raw", bad});
            REQUIRE_FALSE(headerValue.has_value());
            CHECK(headerValue.error().code == Error::Code::MalformedInput);

            auto headerName = store.updateRequest(login, AddHeader{bad, "1"});
            REQUIRE_FALSE(headerName.has_value());
            CHECK(headerName.error().code == Error::Code::InvalidName);

            auto sample = store.updateRequest(login, AddSampleResponse{SampleResponse{.name = "Raw", .body = bad}});
            REQUIRE_FALSE(sample.has_value());
            CHECK(sample.error().code == Error::Code::MalformedInput);

            auto info = store.setInfo(bad, "");
            REQUIRE_FALSE(info.has_value());
            CHECK(info.error().code == Error::Code::InvalidName);
        }

        CHECK(childNames(store, root) == std::vector<std::string>{"Login"});
        CHECK(store.requestSnapshot(login).value().data == RequestData{});
        CHECK(store.info().value().name == "Demo API");
        CHECK_FALSE(store.anyDirty().value());

        REQUIRE(store.renameNode(login, "Anmeldung \xE2\x9C\x93").has_value());
        REQUIRE(store.updateRequest(login, SetBody{"\xF0\x9F\x98\x80"}).has_value());
    }

    TEST_CASE("Cached responses are not persisted state") {
        CollectionStore store = makeStore();
        NodeId          login = create(store, store.rootId().value(), NodeKind::Request, "Login");
        (void)store.takeFlushSnapshot(testEncoders());

        CHECK_FALSE(store.lastResponse(login).value().has_value());
        ResponseSummary response{.status = 200, .sizeBytes = 17, .duration = 42ms, .headers = {}, .body = "{}"};
        REQUIRE(store.attachResponse(login, response).has_value());
        auto cached = store.lastResponse(login);
        REQUIRE(cached.has_value());
        REQUIRE(cached->has_value());
        CHECK((*cached)->status == 200);
        CHECK_FALSE(store.anyDirty().value());
    }

    TEST_CASE("Flush snapshot and reconcile") {
        CollectionStore store = makeStore();
        NodeId          root  = store.rootId().value();
        NodeId          auth  = create(store, root, NodeKind::Directory, "Auth");
        NodeId          login = create(store, auth, NodeKind::Request, "Login");
        NodeId          users = create(store, root, NodeKind::Request, "Users");

        auto snapshot = store.takeFlushSnapshot(testEncoders());
        REQUIRE(snapshot.has_value());
        REQUIRE(snapshot->requests.size() == 2);
        CHECK(snapshot->requests[0].id == login);
        CHECK(snapshot->requests[0].bytes == "Login");
        CHECK(snapshot->requests[1].id == users);
        CHECK(snapshot->manifest == std::optional<std::string>{"Demo API"});
        CHECK(snapshot->directories == std::vector<NodeId>{root, auth});
        CHECK_FALSE(store.anyDirty().value());

        SUBCASE("failed request goes back to dirty") {
            FlushOutcome outcome{.failedRequests = {login}, .manifestWritten = false, .unremovedKeys = {}};
            CHECK(store.reconcileFlush(*snapshot, outcome));
            CHECK(store.isDirty(login).value());
            CHECK(store.isDirty(auth).value());
            CHECK(store.isDirty(root).value());
            CHECK_FALSE(store.isDirty(users).value());
        }

        SUBCASE("edits during the flush survive") {
            REQUIRE(store.updateRequest(users, SetUrl{"/users"}).has_value());
            FlushOutcome outcome{.failedRequests = {}, .manifestWritten = true, .unremovedKeys = {}};
            CHECK(store.reconcileFlush(*snapshot, outcome));
            CHECK(store.dirtyIds().value() == std::vector<NodeId>{users});
        }

        SUBCASE("clean after full success") {
            FlushOutcome outcome{.failedRequests = {}, .manifestWritten = true, .unremovedKeys = {}};
            CHECK_FALSE(store.reconcileFlush(*snapshot, outcome));
            auto empty = store.takeFlushSnapshot(testEncoders());
            REQUIRE(empty.has_value());
            CHECK(empty->empty());
        }

        SUBCASE("unremoved keys are retried") {
            FlushOutcome outcome{.failedRequests = {}, .manifestWritten = true, .unremovedKeys = {"k"}};
            CHECK(store.reconcileFlush(*snapshot, outcome));
            auto retry = store.takeFlushSnapshot(testEncoders());
            REQUIRE(retry.has_value());
            CHECK(retry->removals == std::vector<std::string>{"k"});
        }
    }

    TEST_CASE("replaceContents resets the state") {
        CollectionStore store = makeStore();
        create(store, store.rootId().value(), NodeKind::Request, "Login");

        auto root = Node::makeDirectory("root");
        root->children.push_back(Node::makeRequest("Health"));
        store.replaceContents(std::move(root), CollectionInfo{"Reloaded", ""}, {"orphan"});
        CHECK_FALSE(store.anyDirty().value());
        CHECK(store.hasPendingWork().value());
        CHECK(store.info().value().name == "Reloaded");
        CHECK(childNames(store, store.rootId().value()) == std::vector<std::string>{"Health"});
    }

    TEST_CASE("Busy lock reports a timeout") {
        CollectionStore store{Node::makeDirectory("root"), CollectionInfo{"Demo", ""}, StoreOptions{.lockTimeout = 20ms}};
        NodeId          root = store.rootId().value();

        std::atomic<bool> holding{false};
        std::atomic<bool> release{false};
        std::thread       holder([&] {
            auto held = store.withTree([&](CollectionTree const&) {
                holding = true;
                while (!release)
                    std::this_thread::sleep_for(1ms);
            });
            CHECK(held.has_value());
        });
        while (!holding)
            std::this_thread::sleep_for(1ms);

        auto blocked = store.createNode(root, NodeKind::Request, "Login");
        release      = true;
        holder.join();

        REQUIRE_FALSE(blocked.has_value());
        CHECK(blocked.error().code == Error::Code::Timeout);
        CHECK(isTransient(blocked.error()));
        // Nothing was changed by the failed call, and a retry succeeds.
        CHECK(store.createNode(root, NodeKind::Request, "Login").has_value());
    }
}
