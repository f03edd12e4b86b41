#include "tree/CollectionTree.hpp"

#include <doctest/doctest.h>

#include <set>
#include <string>
#include <vector>

using namespace RS;
using namespace RS::Tree;

namespace {

// root
//   Auth/
//     Login
//     Logout
//   Users/
//     List
//   Health
struct SampleTree {
    CollectionTree tree;
    NodeId         auth   = InvalidNodeId;
    NodeId         login  = InvalidNodeId;
    NodeId         logout = InvalidNodeId;
    NodeId         users  = InvalidNodeId;
    NodeId         list   = InvalidNodeId;
    NodeId         health = InvalidNodeId;

    SampleTree() {
        auto& a      = tree.attach(tree.root(), Node::makeDirectory("Auth"));
        this->auth   = a.id;
        this->login  = tree.attach(a, Node::makeRequest("Login", RequestMethod::Post)).id;
        this->logout = tree.attach(a, Node::makeRequest("Logout", RequestMethod::Post)).id;
        auto& u      = tree.attach(tree.root(), Node::makeDirectory("Users"));
        this->users  = u.id;
        this->list   = tree.attach(u, Node::makeRequest("List")).id;
        this->health = tree.attach(tree.root(), Node::makeRequest("Health")).id;
    }
};

auto namesOf(SubtreeRange range) -> std::vector<std::string> {
    std::vector<std::string> names;
    for (Node const& node : range)
        names.push_back(node.name);
    return names;
}

} // namespace

TEST_SUITE("tree.collection_tree") {
    TEST_CASE("Fresh tree holds an indexed root") {
        CollectionTree tree;
        CHECK(tree.size() == 1);
        CHECK(tree.root().isDirectory());
        CHECK(tree.root().name == "root");
        CHECK(tree.rootId() != InvalidNodeId);
        CHECK(tree.find(tree.rootId()) == &tree.root());
        CHECK(isValidNodeKey(tree.root().key));
    }

    TEST_CASE("find and pathOf") {
        SampleTree sample;
        auto&      tree = sample.tree;
        CHECK(tree.size() == 7);

        Node const* login = tree.find(sample.login);
        REQUIRE(login != nullptr);
        CHECK(login->name == "Login");
        CHECK(login->request.method == RequestMethod::Post);
        CHECK(login->parent == tree.find(sample.auth));

        auto path = tree.pathOf(sample.login);
        REQUIRE(path.has_value());
        CHECK(*path == std::vector<std::string>{"Auth", "Login"});

        auto rootPath = tree.pathOf(tree.rootId());
        REQUIRE(rootPath.has_value());
        CHECK(rootPath->empty());

        CHECK(tree.find(9999) == nullptr);
        auto missing = tree.pathOf(9999);
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::NotFound);
    }

    TEST_CASE("Subtree walks pre-order and restarts") {
        SampleTree sample;
        auto       range = sample.tree.subtree(sample.tree.rootId());

        std::vector<std::string> expected{"root", "Auth", "Login", "Logout", "Users", "List", "Health"};
        CHECK(namesOf(range) == expected);
        // A second pass starts from the top again.
        CHECK(namesOf(range) == expected);

        CHECK(namesOf(sample.tree.subtree(sample.auth)) == std::vector<std::string>{"Auth", "Login", "Logout"});
        CHECK(namesOf(sample.tree.subtree(sample.health)) == std::vector<std::string>{"Health"});
        CHECK(sample.tree.subtree(12345).empty());
        CHECK(namesOf(sample.tree.subtree(12345)).empty());
    }

    TEST_CASE("Descendant checks are strict") {
        SampleTree sample;
        auto&      tree = sample.tree;
        CHECK(tree.isDescendant(sample.auth, sample.login));
        CHECK(tree.isDescendant(tree.rootId(), sample.list));
        CHECK_FALSE(tree.isDescendant(sample.auth, sample.auth));
        CHECK_FALSE(tree.isDescendant(sample.login, sample.auth));
        CHECK_FALSE(tree.isDescendant(sample.users, sample.login));
        CHECK_FALSE(tree.isDescendant(sample.auth, 9999));
    }

    TEST_CASE("attach places children and clamps the position") {
        SampleTree sample;
        auto&      tree = sample.tree;
        Node&      auth = *tree.find(sample.auth);

        auto& first = tree.attach(auth, Node::makeRequest("Refresh"), 0);
        CHECK(tree.childIndex(first.id) == 0);
        CHECK(tree.childIndex(sample.login) == 1);

        auto& last = tree.attach(auth, Node::makeRequest("Revoke"), 42);
        CHECK(tree.childIndex(last.id) == auth.children.size() - 1);
        CHECK_FALSE(tree.childIndex(tree.rootId()).has_value());
    }

    TEST_CASE("detach removes the whole subtree from the index") {
        SampleTree sample;
        auto&      tree = sample.tree;

        auto detached = tree.detach(*tree.find(sample.auth));
        REQUIRE(detached != nullptr);
        CHECK(detached->parent == nullptr);
        CHECK(detached->children.size() == 2);
        CHECK(tree.find(sample.auth) == nullptr);
        CHECK(tree.find(sample.login) == nullptr);
        CHECK(tree.size() == 4);

        // Reattaching keeps the ids the nodes already carry.
        auto& users = *tree.find(sample.users);
        tree.attach(users, std::move(detached));
        CHECK(tree.find(sample.login) != nullptr);
        CHECK(tree.isDescendant(sample.users, sample.login));
        CHECK(*tree.pathOf(sample.login) == std::vector<std::string>{"Users", "Auth", "Login"});

        CHECK(tree.detach(tree.root()) == nullptr);
    }

    TEST_CASE("Ids are never handed out twice") {
        SampleTree        sample;
        auto&             tree = sample.tree;
        std::set<NodeId>  seen;
        for (Node const& node : tree.subtree(tree.rootId()))
            seen.insert(node.id);

        auto removed = tree.detach(*tree.find(sample.users));
        removed.reset();
        auto& again = tree.attach(tree.root(), Node::makeDirectory("Users"));
        CHECK_FALSE(seen.contains(again.id));
        seen.insert(again.id);

        auto before = tree.peekNextId();
        tree.adoptRoot(Node::makeDirectory("root"));
        CHECK(tree.size() == 1);
        CHECK(tree.rootId() >= before);
        CHECK_FALSE(seen.contains(tree.rootId()));
    }

    TEST_CASE("Node helpers") {
        auto dir = Node::makeDirectory("Auth");
        auto req = Node::makeRequest("Login", RequestMethod::Put, std::string(32, 'a'));
        CHECK(dir->isDirectory());
        CHECK(req->isRequest());
        CHECK(req->key == std::string(32, 'a'));
        CHECK(req->request.method == RequestMethod::Put);
        CHECK(nodeKindToString(NodeKind::Request) == "request");

        CHECK(dir->findChild("Login") == nullptr);
        Node* raw = req.get();
        dir->children.push_back(std::move(req));
        CHECK(dir->findChild("Login") == raw);
        CHECK(dir->indexOf(raw) == 0);
    }

    TEST_CASE("Generated keys are valid and distinct") {
        std::set<std::string> keys;
        for (int i = 0; i < 256; ++i) {
            auto key = generateNodeKey();
            CHECK(isValidNodeKey(key));
            keys.insert(key);
        }
        CHECK(keys.size() == 256);

        CHECK_FALSE(isValidNodeKey(""));
        CHECK_FALSE(isValidNodeKey(std::string(32, 'A')));
        CHECK_FALSE(isValidNodeKey(std::string(31, 'a')));
        CHECK_FALSE(isValidNodeKey("../../../../../../etc/passwd....."));
    }

    TEST_CASE("UTF-8 validation") {
        CHECK(isValidUtf8(""));
        CHECK(isValidUtf8("plain ascii"));
        CHECK(isValidUtf8("Gr\xC3\xBC\xC3\x9F" "e"));
        CHECK(isValidUtf8("\xE2\x82\xAC"));
        CHECK(isValidUtf8("\xF0\x9F\x98\x80"));
        CHECK(isValidUtf8("\xF4\x8F\xBF\xBF"));
        CHECK(isValidUtf8(std::string("nul\0inside", 10)));

        CHECK_FALSE(isValidUtf8("\xFF"));
        CHECK_FALSE(isValidUtf8("\x80"));
        CHECK_FALSE(isValidUtf8("\xC0\x80"));
        CHECK_FALSE(isValidUtf8("\xC1\xBF"));
        CHECK_FALSE(isValidUtf8("\xE0\x9F\xBF"));
        CHECK_FALSE(isValidUtf8("\xED\xA0\x80"));
        CHECK_FALSE(isValidUtf8("\xF0\x8F\xBF\xBF"));
        CHECK_FALSE(isValidUtf8("\xF4\x90\x80\x80"));
        CHECK_FALSE(isValidUtf8("\xF5\x80\x80\x80"));
        CHECK_FALSE(isValidUtf8("caf\xC3"));
        CHECK_FALSE(isValidUtf8("\xE2\x82"));
        CHECK_FALSE(isValidUtf8("\xC3\x28"));
    }

    TEST_CASE("validateTree reports inconsistent trees") {
        SUBCASE("duplicate sibling names") {
            auto root = Node::makeDirectory("root");
            root->children.push_back(Node::makeRequest("Login"));
            root->children.push_back(Node::makeRequest("Login"));
            auto result = validateTree(*root);
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::NameCollision);
        }
        SUBCASE("empty name") {
            auto root = Node::makeDirectory("root");
            root->children.push_back(Node::makeDirectory(""));
            auto result = validateTree(*root);
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::InvalidName);
        }
        SUBCASE("request with children") {
            auto root    = Node::makeDirectory("root");
            auto request = Node::makeRequest("Login");
            request->children.push_back(Node::makeRequest("Nested"));
            root->children.push_back(std::move(request));
            auto result = validateTree(*root);
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::MalformedInput);
        }
        SUBCASE("duplicate keys") {
            auto root = Node::makeDirectory("root");
            root->children.push_back(Node::makeRequest("A", RequestMethod::Get, std::string(32, '1')));
            root->children.push_back(Node::makeRequest("B", RequestMethod::Get, std::string(32, '1')));
            auto result = validateTree(*root);
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::MalformedInput);
        }
        SUBCASE("same name in different directories is fine") {
            SampleTree sample;
            Node&      users = *sample.tree.find(sample.users);
            sample.tree.attach(users, Node::makeRequest("Login"));
            CHECK(validateTree(sample.tree.root()).has_value());
        }
    }
}
